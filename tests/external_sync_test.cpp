#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "placer/sync/ExternalSync.hpp"

using placer::core::AssetRecord;
using placer::core::EventBus;
using placer::core::MutationEvent;
using placer::core::MutationKind;
using placer::sync::ExternalSync;
using placer::test::EventRecorder;
using placer::test::MakeRecord;

namespace topics = placer::core::topics;

namespace
{
const std::vector<std::string> kMutationTopics = {
    topics::kAssetAdded,
    topics::kAssetVisualSync,
    topics::kAssetUpdated,
    topics::kAssetDeleted,
};

MutationEvent LocalAdded(const AssetRecord& record)
{
    MutationEvent event;
    event.kind = MutationKind::Added;
    event.id = record.id;
    event.modelUrl = record.modelUrl;
    event.position = record.position;
    return event;
}
} // namespace

TEST(ExternalSyncTest, UnseenRecordsArriveAsVisualSync)
{
    EventBus bus;
    ExternalSync sync(bus);
    EventRecorder recorder(bus, kMutationTopics);

    sync.Observe({MakeRecord("a", glm::vec3{1.0F, 0.0F, 1.0F}), MakeRecord("b", glm::vec3{3.0F, 0.0F, 3.0F})});

    EXPECT_EQ(recorder.Count(topics::kAssetVisualSync), 2U);
    EXPECT_EQ(recorder.Count(topics::kAssetAdded), 0U);
    EXPECT_EQ(sync.TrackedCount(), 2U);

    // Same list again: nothing new.
    recorder.Reset();
    sync.Observe({MakeRecord("a", glm::vec3{1.0F, 0.0F, 1.0F}), MakeRecord("b", glm::vec3{3.0F, 0.0F, 3.0F})});
    EXPECT_TRUE(recorder.events.empty());
}

TEST(ExternalSyncTest, LocalAddEchoIsSuppressed)
{
    EventBus bus;
    ExternalSync sync(bus);
    const AssetRecord record = MakeRecord("dragdrop-crate-1", glm::vec3{3.0F, 0.0F, -5.0F});
    bus.Emit(topics::kAssetAdded, LocalAdded(record));

    EventRecorder recorder(bus, kMutationTopics);
    sync.Observe({record});
    EXPECT_TRUE(recorder.events.empty());
    EXPECT_EQ(sync.TrackedCount(), 1U);
}

TEST(ExternalSyncTest, ExternalTransformChangeEmitsUpdate)
{
    EventBus bus;
    ExternalSync sync(bus);
    sync.Observe({MakeRecord("a", glm::vec3{1.0F, 0.0F, 1.0F})});
    EventRecorder recorder(bus, kMutationTopics);

    AssetRecord moved = MakeRecord("a", glm::vec3{5.0F, 0.0F, 1.0F});
    sync.Observe({moved});

    ASSERT_EQ(recorder.Count(topics::kAssetUpdated), 1U);
    const MutationEvent* updated = recorder.Last<MutationEvent>(topics::kAssetUpdated);
    EXPECT_EQ(updated->id, "a");
    EXPECT_FLOAT_EQ(updated->position->x, 5.0F);
    EXPECT_FALSE(updated->fromGizmo);
}

TEST(ExternalSyncTest, LocalCommitEchoIsSuppressedButLaterExternalChangeIsNot)
{
    EventBus bus;
    ExternalSync sync(bus);
    sync.Observe({MakeRecord("a", glm::vec3{1.0F, 0.0F, 1.0F})});

    MutationEvent commit;
    commit.kind = MutationKind::Updated;
    commit.id = "a";
    commit.position = glm::vec3{-7.0F, 0.5F, 7.0F};
    bus.Emit(topics::kAssetUpdated, commit);

    EventRecorder recorder(bus, kMutationTopics);
    sync.Observe({MakeRecord("a", glm::vec3{-7.0F, 0.5F, 7.0F})});
    EXPECT_TRUE(recorder.events.empty());

    sync.Observe({MakeRecord("a", glm::vec3{9.0F, 0.5F, 7.0F})});
    EXPECT_EQ(recorder.Count(topics::kAssetUpdated), 1U);
}

TEST(ExternalSyncTest, GizmoTicksDoNotMaskExternalChanges)
{
    EventBus bus;
    ExternalSync sync(bus);
    sync.Observe({MakeRecord("a", glm::vec3{1.0F, 0.0F, 1.0F})});

    MutationEvent tick;
    tick.kind = MutationKind::Updated;
    tick.id = "a";
    tick.position = glm::vec3{2.0F, 0.0F, 1.0F};
    tick.fromGizmo = true;
    bus.Emit(topics::kAssetUpdated, tick);

    EventRecorder recorder(bus, kMutationTopics);
    sync.Observe({MakeRecord("a", glm::vec3{2.0F, 0.0F, 1.0F})});
    EXPECT_EQ(recorder.Count(topics::kAssetUpdated), 1U);
}

TEST(ExternalSyncTest, RemovedRecordsEmitDeleteUnlessDeletedLocally)
{
    EventBus bus;
    ExternalSync sync(bus);
    sync.Observe({MakeRecord("a", glm::vec3{1.0F}), MakeRecord("b", glm::vec3{3.0F})});

    MutationEvent local;
    local.kind = MutationKind::Deleted;
    local.id = "a";
    bus.Emit(topics::kAssetDeleted, local);

    EventRecorder recorder(bus, kMutationTopics);
    sync.Observe({});

    ASSERT_EQ(recorder.Count(topics::kAssetDeleted), 1U);
    EXPECT_EQ(recorder.Last<MutationEvent>(topics::kAssetDeleted)->id, "b");
    EXPECT_EQ(sync.TrackedCount(), 0U);
}

TEST(ExternalSyncTest, ClearAllDeletesEveryTrackedAsset)
{
    EventBus bus;
    ExternalSync sync(bus);
    sync.Observe({MakeRecord("a", glm::vec3{1.0F}), MakeRecord("b", glm::vec3{3.0F})});
    EventRecorder recorder(bus, kMutationTopics);

    sync.ClearAllAssets();
    EXPECT_EQ(recorder.Count(topics::kAssetDeleted), 2U);
    EXPECT_EQ(sync.TrackedCount(), 0U);

    // The owner's list catching up to empty produces nothing more.
    recorder.Reset();
    sync.Observe({});
    EXPECT_TRUE(recorder.events.empty());
}

TEST(ExternalSyncTest, ResetForgetsWithoutEmitting)
{
    EventBus bus;
    ExternalSync sync(bus);
    sync.Observe({MakeRecord("a", glm::vec3{1.0F})});
    EventRecorder recorder(bus, kMutationTopics);

    sync.Reset();
    EXPECT_TRUE(recorder.events.empty());
    EXPECT_EQ(sync.TrackedCount(), 0U);

    sync.Observe({MakeRecord("a", glm::vec3{1.0F})});
    EXPECT_EQ(recorder.Count(topics::kAssetVisualSync), 1U);
}
