#include "Storage/Journal.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>
#include <vector>

using test_utils::Bytes;
using test_utils::FlakyStore;
using test_utils::TempDir;

namespace {

JournalEntry Custom(const std::string& kind) {
    JournalEntry entry;
    entry.kind = kind;
    entry.payload = {{"note", kind}};
    return entry;
}

std::string ReadJournal(FileStore& store, const std::string& docId) {
    std::vector<uint8_t> bytes = store.Load(Journal::PathFor(docId));
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST(JournalTest, ReplayOfMissingJournalIsEmptyState) {
    TempDir dir;
    Journal journal(std::make_shared<FileStore>(dir.Path()));

    JournalState state = journal.Replay("default");
    EXPECT_EQ(state.lastSeq, 0u);
    EXPECT_EQ(state.appliedEntries, 0u);
    EXPECT_EQ(state.discardedEntries, 0u);
    EXPECT_TRUE(state.renders.empty());
}

TEST(JournalTest, AppendAssignsConsecutiveSequenceNumbers) {
    TempDir dir;
    Journal journal(std::make_shared<FileStore>(dir.Path()));

    JournalEntry first = journal.Append("default", JournalEntry::SaveRender("renders/a.wav", 100));
    JournalEntry second = journal.Append("default", JournalEntry::SaveRender("renders/a.wav", 200));

    EXPECT_EQ(first.seq, 1u);
    EXPECT_EQ(second.seq, first.seq + 1);
    EXPECT_GT(first.ts, 0u);

    JournalState state = journal.Replay("default");
    EXPECT_EQ(state.lastSeq, 2u);
    EXPECT_EQ(state.appliedEntries, 2u);
    EXPECT_EQ(state.renderSaves, 2u);
    // The later save wins, so the first entry was folded first.
    EXPECT_EQ(state.renders.at("renders/a.wav"), 200u);
}

TEST(JournalTest, PersistedLayoutIsOneJsonObjectPerLine) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    Journal journal(store);

    JournalEntry entry = JournalEntry::SaveRender("renders/mixdown.wav", 46);
    entry.ts = 1700000000000ull;
    journal.Append("doc", entry);

    std::string text = ReadJournal(*store, "doc");
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');

    auto line = nlohmann::json::parse(text);
    EXPECT_EQ(line["seq"], 1);
    EXPECT_EQ(line["ts"], 1700000000000ull);
    EXPECT_EQ(line["kind"], "save-render");
    EXPECT_EQ(line["payload"]["path"], "renders/mixdown.wav");
    EXPECT_EQ(line["payload"]["bytes"], 46);
}

TEST(JournalTest, SequenceContinuesAfterRestart) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    {
        Journal journal(store);
        journal.Append("doc", Custom("a"));
        journal.Append("doc", Custom("b"));
        journal.Append("doc", Custom("c"));
    }

    Journal reopened(store);
    EXPECT_EQ(reopened.LastSequence("doc"), 3u);
    EXPECT_EQ(reopened.Append("doc", Custom("d")).seq, 4u);
}

TEST(JournalTest, DocumentsHaveIndependentSequences) {
    TempDir dir;
    Journal journal(std::make_shared<FileStore>(dir.Path()));

    journal.Append("one", Custom("x"));
    journal.Append("one", Custom("x"));
    EXPECT_EQ(journal.Append("two", Custom("x")).seq, 1u);
    EXPECT_EQ(Journal::PathFor("two"), "projects/two/journal.log");
}

TEST(JournalTest, TruncatedTailIsDiscardedOnReplay) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    {
        Journal journal(store);
        journal.Append("doc", JournalEntry::SaveRender("renders/mixdown.wav", 1234));
    }
    store->Append(Journal::PathFor("doc"), Bytes("{\"seq\":2,\"ts\":17000,\"kind\":\"save-ren"));

    Journal journal(store);
    JournalState state = journal.Replay("doc");
    EXPECT_EQ(state.lastSeq, 1u);
    EXPECT_EQ(state.renderSaves, 1u);
    EXPECT_EQ(state.renders.at("renders/mixdown.wav"), 1234u);
    EXPECT_EQ(state.discardedEntries, 1u);

    // Replay does not modify the log, so it can be repeated with the same result.
    JournalState again = journal.Replay("doc");
    EXPECT_EQ(again.lastSeq, state.lastSeq);
    EXPECT_EQ(again.renders, state.renders);
}

TEST(JournalTest, AppendAfterTornTailStartsOnFreshLine) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    {
        Journal journal(store);
        journal.Append("doc", JournalEntry::SaveRender("renders/a.wav", 1));
    }
    store->Append(Journal::PathFor("doc"), Bytes("{\"seq\":2,\"ki"));

    Journal journal(store);
    JournalEntry next = journal.Append("doc", JournalEntry::SaveRender("renders/b.wav", 2));
    EXPECT_EQ(next.seq, 2u);

    JournalState state = journal.Replay("doc");
    EXPECT_EQ(state.lastSeq, 2u);
    EXPECT_EQ(state.renderSaves, 2u);
    EXPECT_EQ(state.discardedEntries, 1u);
    EXPECT_EQ(state.renders.at("renders/b.wav"), 2u);
}

TEST(JournalTest, GarbageOnlyJournalReplaysToEmptyState) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    store->Save(Journal::PathFor("doc"), Bytes("\x01\x02garbage\nnot json either"));

    Journal journal(store);
    JournalState state = journal.Replay("doc");
    EXPECT_EQ(state.lastSeq, 0u);
    EXPECT_EQ(state.discardedEntries, 2u);
    EXPECT_EQ(journal.Append("doc", Custom("x")).seq, 1u);
}

TEST(JournalTest, ReplayStartsFromLatestSnapshot) {
    TempDir dir;
    Journal journal(std::make_shared<FileStore>(dir.Path()));

    journal.Append("doc", JournalEntry::SaveRender("renders/a.wav", 10));
    journal.Append("doc", JournalEntry::SaveRender("renders/b.wav", 20));
    JournalEntry snapshot = journal.Snapshot("doc", journal.Replay("doc"));
    journal.Append("doc", JournalEntry::SaveRender("renders/a.wav", 30));

    JournalState state = journal.Replay("doc");
    EXPECT_EQ(state.snapshotSeq, snapshot.seq);
    EXPECT_EQ(snapshot.seq, 3u);
    EXPECT_EQ(state.lastSeq, 4u);
    // Only the entry after the snapshot was folded on top of it.
    EXPECT_EQ(state.appliedEntries, 1u);
    EXPECT_EQ(state.renderSaves, 3u);
    EXPECT_EQ(state.renders.at("renders/a.wav"), 30u);
    EXPECT_EQ(state.renders.at("renders/b.wav"), 20u);
}

TEST(JournalTest, SnapshotKeepsPriorEntries) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    Journal journal(store);

    journal.Append("doc", Custom("a"));
    journal.Snapshot("doc", journal.Replay("doc"));

    std::string text = ReadJournal(*store, "doc");
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
}

TEST(JournalTest, OlderUnknownKindsStillReplay) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    // Entries as an earlier writer produced them: no payload on one, an unknown kind on another.
    store->Save(Journal::PathFor("doc"), Bytes(
        "{\"seq\":1,\"ts\":1,\"kind\":\"save-render\",\"payload\":{\"path\":\"renders/mixdown.wav\",\"bytes\":46}}\n"
        "{\"seq\":2,\"ts\":2,\"kind\":\"note-edit\"}\n"));

    Journal journal(store);
    JournalState state = journal.Replay("doc");
    EXPECT_EQ(state.lastSeq, 2u);
    EXPECT_EQ(state.unknownEntries, 1u);
    EXPECT_EQ(state.renders.at("renders/mixdown.wav"), 46u);
}

TEST(JournalTest, FailedAppendRaisesJournalErrorAndDoesNotConsumeSequence) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    Journal journal(store);

    journal.Append("doc", Custom("a"));
    store->failAppends = true;
    EXPECT_THROW(journal.Append("doc", Custom("b")), JournalError);
    store->failAppends = false;

    EXPECT_EQ(journal.Append("doc", Custom("c")).seq, 2u);
}

TEST(JournalTest, ConcurrentAppendsGetUniqueSequences) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    Journal journal(store);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&journal]() {
            for (int i = 0; i < 25; ++i) {
                journal.Append("doc", Custom("tick"));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    JournalState state = journal.Replay("doc");
    EXPECT_EQ(state.lastSeq, 100u);
    EXPECT_EQ(state.unknownEntries, 100u);
    EXPECT_EQ(state.discardedEntries, 0u);
}

TEST(JournalTest, RejectsDocumentIdsThatAreNotOneFolder) {
    TempDir dir;
    Journal journal(std::make_shared<FileStore>(dir.Path()));
    EXPECT_THROW(journal.Append("../x", Custom("a")), std::invalid_argument);
    EXPECT_THROW(journal.Replay(""), std::invalid_argument);
}

TEST(JournalTest, NonIntegralTimestampsAreIgnored) {
    for (const char* ts : {"-1.5", "1e30", "-7", "\"yesterday\""}) {
        JournalEntry entry;
        std::string line = std::string("{\"seq\":3,\"ts\":") + ts + ",\"kind\":\"save-render\",\"payload\":{}}";
        ASSERT_TRUE(JournalEntry::FromJsonLine(line, entry)) << line;
        EXPECT_EQ(entry.seq, 3u);
        EXPECT_EQ(entry.ts, 0u) << line;
    }
}

TEST(JournalTest, UnserializablePayloadRaisesJournalError) {
    TempDir dir;
    auto store = std::make_shared<FileStore>(dir.Path());
    Journal journal(store);

    journal.Append("doc", Custom("a"));
    EXPECT_THROW(journal.Append("doc", JournalEntry::SaveRender("renders/\xff\xfe.wav", 10)), JournalError);

    EXPECT_EQ(journal.Append("doc", Custom("b")).seq, 2u);
    EXPECT_EQ(journal.Replay("doc").discardedEntries, 0u);
}
