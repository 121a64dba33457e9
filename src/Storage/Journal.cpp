#include "Journal.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

namespace {

uint64_t NowMs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

struct ParsedLog {
    std::vector<JournalEntry> entries;
    size_t corrupt = 0;
};

ParsedLog ParseLog(const std::string& text) {
    ParsedLog parsed;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }
        JournalEntry entry;
        if (JournalEntry::FromJsonLine(line, entry)) {
            parsed.entries.push_back(std::move(entry));
        } else {
            ++parsed.corrupt;
        }
    }
    return parsed;
}

void ValidateDocId(const std::string& docId) {
    if (docId.empty() || docId == "." || docId == ".." || docId.find('/') != std::string::npos
        || docId.find('\\') != std::string::npos) {
        throw std::invalid_argument("Invalid journal document id: '" + docId + "'");
    }
}

} // namespace

Journal::Journal(std::shared_ptr<IStore> store)
    : _store(std::move(store)) {
    if (!_store) {
        throw std::invalid_argument("Journal requires a store");
    }
}

std::string Journal::PathFor(const std::string& docId) {
    ValidateDocId(docId);
    return "projects/" + docId + "/journal.log";
}

Journal::DocumentLog& Journal::Document(const std::string& docId) {
    std::lock_guard<std::mutex> lock(_documents_mutex);
    auto& log = _documents[docId];
    if (!log) {
        log = std::make_unique<DocumentLog>();
    }
    return *log;
}

std::string Journal::ReadLocked(const std::string& docId) const {
    try {
        std::vector<uint8_t> bytes = _store->Load(PathFor(docId));
        return std::string(bytes.begin(), bytes.end());
    } catch (const NotFound&) {
        return {};
    }
}

void Journal::RecoverLocked(const std::string& docId, DocumentLog& log) {
    std::string text = ReadLocked(docId);
    ParsedLog parsed = ParseLog(text);

    uint64_t lastSeq = 0;
    for (const JournalEntry& entry : parsed.entries) {
        lastSeq = std::max(lastSeq, entry.seq);
    }

    // A torn final line has no newline; start the next entry on a fresh line.
    if (!text.empty() && text.back() != '\n') {
        std::cerr << "Journal " << docId << ": repairing truncated tail" << std::endl;
        _store->Append(PathFor(docId), {'\n'});
    }

    DEBUG_LOG("Journal " << docId << ": recovered seq " << lastSeq << ", "
              << parsed.corrupt << " corrupt line(s)" << DEBUG_LOG_ENDL);

    log.lastSeq = lastSeq;
    log.loaded = true;
}

JournalEntry Journal::Append(const std::string& docId, JournalEntry entry) {
    const std::string path = PathFor(docId);
    DocumentLog& log = Document(docId);
    std::lock_guard<std::mutex> lock(log.mutex);

    try {
        if (!log.loaded) {
            RecoverLocked(docId, log);
        }

        entry.seq = log.lastSeq + 1;
        if (entry.ts == 0) {
            entry.ts = NowMs();
        }

        std::string line = entry.ToJsonLine();
        _store->Append(path, std::vector<uint8_t>(line.begin(), line.end()));
    } catch (const WasmixException& e) {
        // The file may now end in a partial line; rescan before the next append.
        log.loaded = false;
        throw JournalError("Journal append to " + path + " failed: " + e.what());
    } catch (const nlohmann::json::exception& e) {
        // Nothing was written, the entry could not be serialized.
        throw JournalError("Journal entry for " + path + " is not serializable: " + e.what());
    }

    log.lastSeq = entry.seq;
    return entry;
}

JournalEntry Journal::Snapshot(const std::string& docId, const JournalState& state) {
    JournalEntry entry;
    entry.kind = JournalEntry::kSnapshot;
    entry.payload = state.ToJson();
    return Append(docId, std::move(entry));
}

JournalState Journal::Replay(const std::string& docId) {
    PathFor(docId);
    DocumentLog& log = Document(docId);
    std::lock_guard<std::mutex> lock(log.mutex);

    ParsedLog parsed = ParseLog(ReadLocked(docId));
    std::stable_sort(parsed.entries.begin(), parsed.entries.end(),
                     [](const JournalEntry& a, const JournalEntry& b) { return a.seq < b.seq; });

    auto snapshot = std::find_if(parsed.entries.rbegin(), parsed.entries.rend(),
                                 [](const JournalEntry& e) { return e.kind == JournalEntry::kSnapshot; });
    auto begin = snapshot == parsed.entries.rend() ? parsed.entries.begin() : std::prev(snapshot.base());

    JournalState state;
    for (const JournalEntry& entry : parsed.entries) {
        state.lastSeq = std::max(state.lastSeq, entry.seq);
    }
    for (auto it = begin; it != parsed.entries.end(); ++it) {
        state.Apply(*it);
    }
    state.discardedEntries += parsed.corrupt;

    if (parsed.corrupt > 0) {
        std::cerr << "Journal " << docId << ": discarded " << parsed.corrupt << " corrupt entr"
                  << (parsed.corrupt == 1 ? "y" : "ies") << std::endl;
    }
    return state;
}

uint64_t Journal::LastSequence(const std::string& docId) {
    PathFor(docId);
    DocumentLog& log = Document(docId);
    std::lock_guard<std::mutex> lock(log.mutex);
    if (!log.loaded) {
        try {
            RecoverLocked(docId, log);
        } catch (const WasmixException& e) {
            throw JournalError("Journal recovery for " + docId + " failed: " + e.what());
        }
    }
    return log.lastSeq;
}
