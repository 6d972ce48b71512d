#pragma once

#include "placer/core/EventBus.hpp"
#include "placer/scene/SceneGraph.hpp"

namespace placer::editor
{
// Single translucent cell marker driven by grid:highlight and grid:clearHighlight.
class GridHighlighter
{
public:
    GridHighlighter(core::EventBus& bus, scene::SceneGraph& scene);
    ~GridHighlighter();

    GridHighlighter(const GridHighlighter&) = delete;
    GridHighlighter& operator=(const GridHighlighter&) = delete;

    void Unmount();

    [[nodiscard]] scene::NodeHandle HighlightNode() const { return m_highlight; }
    [[nodiscard]] bool IsShowing() const { return m_highlight != scene::kInvalidNode; }

private:
    void Show(const core::HighlightEvent& event);
    void Clear();

    core::EventBus& m_bus;
    scene::SceneGraph& m_scene;
    scene::NodeHandle m_highlight = scene::kInvalidNode;
    core::EventBus::HandlerPtr m_highlightHandler;
    core::EventBus::HandlerPtr m_clearHandler;
    bool m_mounted = true;
};
} // namespace placer::editor
