#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "RenderArtifact.hpp"
#include "../Storage/IStore.hpp"
#include "../Storage/Journal.hpp"

/**
 * Saves renders and journals them afterwards.
 *
 * Save() returns once the artifact is in the store. The matching "save-render"
 * entry is handed to a writer thread; a journal failure there is logged and counted
 * but never undoes or fails the save. Every snapshotInterval journaled entries the
 * writer also records a snapshot (0 disables).
 */
class RenderSaver {
public:
    RenderSaver(std::shared_ptr<IStore> store, std::shared_ptr<Journal> journal,
                std::string docId, size_t snapshotInterval = 0);
    ~RenderSaver();

    RenderSaver(const RenderSaver&) = delete;
    RenderSaver& operator=(const RenderSaver&) = delete;

    // Throws WriteError if the artifact could not be stored and std::invalid_argument
    // if the store rejects path. Nothing is journaled then.
    void Save(const std::string& path, const RenderArtifact& artifact);

    // Blocks until every queued journal entry has been attempted.
    void Flush();

    uint64_t JournalWrites() const { return _journal_writes.load(); }
    uint64_t JournalFailures() const { return _journal_failures.load(); }
    const std::string& DocumentId() const { return _doc_id; }

private:
    void WriterLoop();
    void WriteEntry(const JournalEntry& entry);

    std::shared_ptr<IStore> _store;
    std::shared_ptr<Journal> _journal;
    std::string _doc_id;
    size_t _snapshot_interval;
    std::optional<size_t> _since_snapshot;

    std::mutex _queue_mutex;
    std::condition_variable _queue_cv;
    std::condition_variable _idle_cv;
    std::deque<JournalEntry> _queue;
    bool _busy;
    bool _shutdown;
    std::unique_ptr<std::thread> _thread;

    std::atomic<uint64_t> _journal_writes;
    std::atomic<uint64_t> _journal_failures;
};
