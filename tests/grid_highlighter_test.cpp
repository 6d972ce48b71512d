#include <gtest/gtest.h>

#include "placer/core/EventBus.hpp"
#include "placer/editor/GridHighlighter.hpp"
#include "placer/scene/SceneGraph.hpp"

using placer::core::EventBus;
using placer::core::HighlightEvent;
using placer::editor::GridHighlighter;
using placer::scene::SceneGraph;

namespace topics = placer::core::topics;

namespace
{
HighlightEvent Highlight(const glm::vec3& center, bool occupied)
{
    HighlightEvent event;
    event.center = center;
    event.sizeX = 2.0F;
    event.sizeZ = 2.0F;
    event.occupied = occupied;
    return event;
}
} // namespace

TEST(GridHighlighterTest, ShowsSingleQuadAtCellCenter)
{
    EventBus bus;
    SceneGraph scene;
    GridHighlighter highlighter(bus, scene);
    const std::size_t baseNodes = scene.NodeCount();

    bus.Emit(topics::kGridHighlight, Highlight(glm::vec3{3.0F, 0.01F, -5.0F}, false));
    ASSERT_TRUE(highlighter.IsShowing());
    const placer::scene::Node* node = scene.Find(highlighter.HighlightNode());
    ASSERT_NE(node, nullptr);
    EXPECT_FALSE(node->pickable);
    EXPECT_FLOAT_EQ(node->transform.position.x, 3.0F);
    EXPECT_FLOAT_EQ(node->transform.position.z, -5.0F);

    const auto bounds = scene.WorldBounds(highlighter.HighlightNode());
    EXPECT_NEAR(bounds.Size().x, 1.9F, 1.0e-5F);

    const placer::scene::Material* material = scene.FindMaterial(node->material);
    ASSERT_NE(material, nullptr);
    EXPECT_FLOAT_EQ(material->color.y, 1.0F);
    EXPECT_FLOAT_EQ(material->opacity, 0.3F);

    bus.Emit(topics::kGridHighlight, Highlight(glm::vec3{5.0F, 0.01F, -5.0F}, true));
    EXPECT_EQ(scene.NodeCount(), baseNodes + 1);
    const placer::scene::Material* occupied = scene.FindMaterial(scene.Find(highlighter.HighlightNode())->material);
    EXPECT_FLOAT_EQ(occupied->color.x, 1.0F);
    EXPECT_FLOAT_EQ(occupied->opacity, 0.5F);
}

TEST(GridHighlighterTest, ClearReleasesQuadResources)
{
    EventBus bus;
    SceneGraph scene;
    GridHighlighter highlighter(bus, scene);

    bus.Emit(topics::kGridHighlight, Highlight(glm::vec3{0.0F}, false));
    bus.Emit(topics::kGridClearHighlight);

    EXPECT_FALSE(highlighter.IsShowing());
    EXPECT_EQ(scene.LiveGeometryCount(), 0U);
    EXPECT_EQ(scene.LiveMaterialCount(), 0U);

    // Clearing with nothing shown is harmless.
    bus.Emit(topics::kGridClearHighlight);
    EXPECT_FALSE(highlighter.IsShowing());
}

TEST(GridHighlighterTest, UnmountStopsListeningAndRemovesQuad)
{
    EventBus bus;
    SceneGraph scene;
    GridHighlighter highlighter(bus, scene);
    bus.Emit(topics::kGridHighlight, Highlight(glm::vec3{0.0F}, false));

    highlighter.Unmount();
    EXPECT_FALSE(highlighter.IsShowing());
    EXPECT_EQ(bus.HandlerCount(topics::kGridHighlight), 0U);

    bus.Emit(topics::kGridHighlight, Highlight(glm::vec3{0.0F}, false));
    EXPECT_FALSE(highlighter.IsShowing());
}
