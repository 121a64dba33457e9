#include "SavingWorkers/RenderSaver.hpp"
#include "SavingWorkers/WavEncoder.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using test_utils::FlakyStore;
using test_utils::TempDir;

namespace {

RenderArtifact MakeArtifact(size_t samples) {
    RenderArtifact artifact;
    artifact.bytes = EncodeWav(std::vector<float>(samples, 0.25f), 48000);
    artifact.sampleRate = 48000;
    artifact.sampleCount = samples;
    return artifact;
}

} // namespace

TEST(RenderSaverTest, SaveStoresArtifactAndJournalsIt) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    auto journal = std::make_shared<Journal>(store);
    RenderSaver saver(store, journal, "default");

    RenderArtifact artifact = MakeArtifact(480);
    saver.Save("renders/mixdown.wav", artifact);
    saver.Flush();

    EXPECT_EQ(store->Load("renders/mixdown.wav"), artifact.bytes);
    EXPECT_EQ(saver.JournalWrites(), 1u);
    EXPECT_EQ(saver.JournalFailures(), 0u);

    JournalState state = journal->Replay("default");
    EXPECT_EQ(state.renders.at("renders/mixdown.wav"), artifact.Size());
}

TEST(RenderSaverTest, JournalFailureDoesNotUndoTheSave) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    auto journal = std::make_shared<Journal>(store);
    RenderSaver saver(store, journal, "default");

    store->failAppends = true;
    RenderArtifact artifact = MakeArtifact(64);
    EXPECT_NO_THROW(saver.Save("renders/mixdown.wav", artifact));
    saver.Flush();

    EXPECT_EQ(store->Load("renders/mixdown.wav"), artifact.bytes);
    EXPECT_EQ(saver.JournalWrites(), 0u);
    EXPECT_EQ(saver.JournalFailures(), 1u);
    EXPECT_TRUE(journal->Replay("default").renders.empty());
}

TEST(RenderSaverTest, FailedSaveIsReportedAndNotJournaled) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    auto journal = std::make_shared<Journal>(store);
    RenderSaver saver(store, journal, "default");

    store->failSaves = true;
    EXPECT_THROW(saver.Save("renders/mixdown.wav", MakeArtifact(8)), WriteError);
    saver.Flush();

    EXPECT_FALSE(store->Exists("renders/mixdown.wav"));
    EXPECT_EQ(journal->LastSequence("default"), 0u);
}

TEST(RenderSaverTest, SnapshotsAfterConfiguredNumberOfEntries) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    auto journal = std::make_shared<Journal>(store);
    RenderSaver saver(store, journal, "default", 3);

    for (int i = 0; i < 4; ++i) {
        saver.Save("renders/take" + std::to_string(i) + ".wav", MakeArtifact(16 + i));
    }
    saver.Flush();

    JournalState state = journal->Replay("default");
    // Three saves, a snapshot, then one more save.
    EXPECT_EQ(state.lastSeq, 5u);
    EXPECT_EQ(state.snapshotSeq, 4u);
    EXPECT_EQ(state.appliedEntries, 1u);
    EXPECT_EQ(state.renderSaves, 4u);
    EXPECT_EQ(state.renders.size(), 4u);
}

TEST(RenderSaverTest, DestructorDrainsQueuedEntries) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    auto journal = std::make_shared<Journal>(store);
    {
        RenderSaver saver(store, journal, "default");
        for (int i = 0; i < 10; ++i) {
            saver.Save("renders/mixdown.wav", MakeArtifact(4));
        }
    }
    EXPECT_EQ(journal->Replay("default").renderSaves, 10u);
}

TEST(RenderSaverTest, RejectedPathIsReportedAndNotJournaled) {
    TempDir dir;
    auto store = std::make_shared<FlakyStore>(dir.Path());
    auto journal = std::make_shared<Journal>(store);
    RenderSaver saver(store, journal, "default");

    EXPECT_THROW(saver.Save("../outside.wav", MakeArtifact(8)), std::invalid_argument);
    EXPECT_THROW(saver.Save("", MakeArtifact(8)), std::invalid_argument);
    saver.Flush();

    EXPECT_EQ(saver.JournalWrites(), 0u);
    EXPECT_EQ(journal->LastSequence("default"), 0u);
}
