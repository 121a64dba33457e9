#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "IStore.hpp"
#include "JournalEntry.hpp"

/**
 * Append-only per-document event log kept in the store at
 * projects/<docId>/journal.log, one JSON entry per line.
 *
 * Sequence numbers continue from the highest well-formed entry found in the file,
 * so they are never reused across restarts. Appends to one document are serialized.
 * Replay starts at the newest snapshot entry and drops corrupt lines, which is what a
 * write torn by a crash leaves behind.
 */
class Journal {
public:
    explicit Journal(std::shared_ptr<IStore> store);

    static std::string PathFor(const std::string& docId);

    // Assigns the next sequence number (and the timestamp when entry.ts is 0) and
    // writes the entry. Returns it as stored. Throws JournalError.
    JournalEntry Append(const std::string& docId, JournalEntry entry);

    // Records the folded state so later replays can start here. Throws JournalError.
    JournalEntry Snapshot(const std::string& docId, const JournalState& state);

    // Never throws for missing or damaged journals; the result is the default state.
    JournalState Replay(const std::string& docId);

    uint64_t LastSequence(const std::string& docId);

private:
    struct DocumentLog {
        std::mutex mutex;
        bool loaded = false;
        uint64_t lastSeq = 0;
    };

    DocumentLog& Document(const std::string& docId);
    void RecoverLocked(const std::string& docId, DocumentLog& log);
    std::string ReadLocked(const std::string& docId) const;

    std::shared_ptr<IStore> _store;
    std::mutex _documents_mutex;
    std::unordered_map<std::string, std::unique_ptr<DocumentLog>> _documents;
};
