#include "JournalEntry.hpp"

using json = nlohmann::json;

JournalEntry JournalEntry::SaveRender(const std::string& path, uint64_t bytes) {
    JournalEntry entry;
    entry.kind = kSaveRender;
    entry.payload = {{"path", path}, {"bytes", bytes}};
    return entry;
}

std::string JournalEntry::ToJsonLine() const {
    json line = {{"seq", seq}, {"ts", ts}, {"kind", kind}, {"payload", payload}};
    return line.dump() + "\n";
}

bool JournalEntry::FromJsonLine(const std::string& line, JournalEntry& out) {
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return false;
    }

    auto seq = message.find("seq");
    auto kind = message.find("kind");
    if (seq == message.end() || !seq->is_number_unsigned() || kind == message.end() || !kind->is_string()) {
        return false;
    }

    JournalEntry entry;
    entry.seq = seq->get<uint64_t>();
    entry.kind = kind->get<std::string>();

    auto ts = message.find("ts");
    if (ts != message.end() && ts->is_number_unsigned()) {
        entry.ts = ts->get<uint64_t>();
    }
    auto payload = message.find("payload");
    if (payload != message.end()) {
        entry.payload = *payload;
    }

    out = std::move(entry);
    return true;
}

void JournalState::Apply(const JournalEntry& entry) {
    if (entry.seq > lastSeq) {
        lastSeq = entry.seq;
    }

    if (entry.kind == JournalEntry::kSaveRender) {
        auto path = entry.payload.find("path");
        auto bytes = entry.payload.find("bytes");
        if (!entry.payload.is_object() || path == entry.payload.end() || !path->is_string()
            || bytes == entry.payload.end() || !bytes->is_number_unsigned()) {
            ++discardedEntries;
            return;
        }
        renders[path->get<std::string>()] = bytes->get<uint64_t>();
        ++renderSaves;
    } else if (entry.kind == JournalEntry::kSnapshot) {
        JournalState restored = FromJson(entry.payload);
        renders = std::move(restored.renders);
        renderSaves = restored.renderSaves;
        snapshotSeq = entry.seq;
        appliedEntries = 0;
        return;
    } else {
        ++unknownEntries;
        return;
    }
    ++appliedEntries;
}

json JournalState::ToJson() const {
    json data = {{"renders", json::object()}, {"render_saves", renderSaves}};
    for (const auto& [path, bytes] : renders) {
        data["renders"][path] = bytes;
    }
    return data;
}

JournalState JournalState::FromJson(const json& data) {
    JournalState state;
    if (!data.is_object()) {
        return state;
    }

    auto renders = data.find("renders");
    if (renders != data.end() && renders->is_object()) {
        for (auto it = renders->begin(); it != renders->end(); ++it) {
            if (it.value().is_number_unsigned()) {
                state.renders[it.key()] = it.value().get<uint64_t>();
            }
        }
    }
    auto saves = data.find("render_saves");
    if (saves != data.end() && saves->is_number_unsigned()) {
        state.renderSaves = saves->get<uint64_t>();
    }
    return state;
}
