#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

// One journal record. Persisted as a single JSON line:
//   {"seq": 7, "ts": 1718000000000, "kind": "save-render", "payload": {...}}
struct JournalEntry {
    static constexpr const char* kSaveRender = "save-render";
    static constexpr const char* kSnapshot = "snapshot";

    uint64_t seq = 0;
    // Epoch milliseconds.
    uint64_t ts = 0;
    std::string kind;
    nlohmann::json payload = nlohmann::json::object();

    static JournalEntry SaveRender(const std::string& path, uint64_t bytes);

    std::string ToJsonLine() const;
    // False if the line is corrupt or incomplete.
    static bool FromJsonLine(const std::string& line, JournalEntry& out);
};

// Fold of the journal from the last snapshot onwards.
struct JournalState {
    uint64_t lastSeq = 0;
    // Sequence of the snapshot replay started from, 0 if none.
    uint64_t snapshotSeq = 0;
    size_t appliedEntries = 0;
    size_t discardedEntries = 0;
    size_t unknownEntries = 0;

    uint64_t renderSaves = 0;
    // Size of the latest save per render path.
    std::map<std::string, uint64_t> renders;

    void Apply(const JournalEntry& entry);

    // Only the folded data goes into a snapshot, not the replay counters.
    nlohmann::json ToJson() const;
    static JournalState FromJson(const nlohmann::json& data);
};
