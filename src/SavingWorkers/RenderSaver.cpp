#include "RenderSaver.hpp"
#include "../common/debug_log.hpp"

#include <iostream>

RenderSaver::RenderSaver(std::shared_ptr<IStore> store, std::shared_ptr<Journal> journal,
                         std::string docId, size_t snapshotInterval)
    : _store(std::move(store))
    , _journal(std::move(journal))
    , _doc_id(std::move(docId))
    , _snapshot_interval(snapshotInterval)
    , _busy(false)
    , _shutdown(false)
    , _journal_writes(0)
    , _journal_failures(0) {
    if (!_store || !_journal) {
        throw std::invalid_argument("RenderSaver requires a store and a journal");
    }
    Journal::PathFor(_doc_id);
    _thread = std::make_unique<std::thread>(&RenderSaver::WriterLoop, this);
}

RenderSaver::~RenderSaver() {
    {
        std::lock_guard<std::mutex> lock(_queue_mutex);
        _shutdown = true;
    }
    _queue_cv.notify_all();
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

void RenderSaver::Save(const std::string& path, const RenderArtifact& artifact) {
    _store->Save(path, artifact.bytes);

    {
        std::lock_guard<std::mutex> lock(_queue_mutex);
        _queue.push_back(JournalEntry::SaveRender(path, artifact.bytes.size()));
    }
    _queue_cv.notify_one();
}

void RenderSaver::Flush() {
    std::unique_lock<std::mutex> lock(_queue_mutex);
    _idle_cv.wait(lock, [this] { return _queue.empty() && !_busy; });
}

void RenderSaver::WriterLoop() {
    std::unique_lock<std::mutex> lock(_queue_mutex);
    while (true) {
        _queue_cv.wait(lock, [this] { return _shutdown || !_queue.empty(); });
        // Drain what is queued even when shutting down.
        if (_queue.empty()) {
            break;
        }

        JournalEntry entry = std::move(_queue.front());
        _queue.pop_front();
        _busy = true;
        lock.unlock();

        WriteEntry(entry);

        lock.lock();
        _busy = false;
        if (_queue.empty()) {
            _idle_cv.notify_all();
        }
    }
    _idle_cv.notify_all();
}

void RenderSaver::WriteEntry(const JournalEntry& entry) {
    try {
        JournalEntry stored = _journal->Append(_doc_id, entry);
        ++_journal_writes;
        DEBUG_LOG("Journaled " << stored.kind << " #" << stored.seq << DEBUG_LOG_ENDL);

        if (_snapshot_interval == 0) {
            return;
        }
        if (!_since_snapshot) {
            _since_snapshot = _journal->Replay(_doc_id).appliedEntries;
        } else {
            ++*_since_snapshot;
        }
        if (*_since_snapshot >= _snapshot_interval) {
            JournalEntry snapshot = _journal->Snapshot(_doc_id, _journal->Replay(_doc_id));
            _since_snapshot = 0;
            DEBUG_LOG("Journal snapshot #" << snapshot.seq << DEBUG_LOG_ENDL);
        }
    } catch (const std::exception& e) {
        ++_journal_failures;
        std::cerr << "Journal write for " << _doc_id << " failed: " << e.what() << std::endl;
    }
}
