#include "placer/editor/GridHighlighter.hpp"

namespace placer::editor
{
namespace
{
constexpr float kCellFill = 0.95F;
constexpr float kFreeOpacity = 0.3F;
constexpr float kOccupiedOpacity = 0.5F;
const glm::vec3 kFreeColor{0.0F, 1.0F, 0.0F};
const glm::vec3 kOccupiedColor{1.0F, 0.0F, 0.0F};
} // namespace

GridHighlighter::GridHighlighter(core::EventBus& bus, scene::SceneGraph& scene)
    : m_bus(bus)
    , m_scene(scene)
{
    m_highlightHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) {
        if (const core::HighlightEvent* event = core::PayloadAs<core::HighlightEvent>(payload))
        {
            Show(*event);
        }
    });
    m_clearHandler = core::EventBus::MakeHandler([this](const core::Payload&) { Clear(); });
    m_bus.On(core::topics::kGridHighlight, m_highlightHandler);
    m_bus.On(core::topics::kGridClearHighlight, m_clearHandler);
}

GridHighlighter::~GridHighlighter()
{
    Unmount();
}

void GridHighlighter::Unmount()
{
    if (!m_mounted)
    {
        return;
    }
    m_mounted = false;
    m_bus.Off(core::topics::kGridHighlight, m_highlightHandler);
    m_bus.Off(core::topics::kGridClearHighlight, m_clearHandler);
    Clear();
}

void GridHighlighter::Show(const core::HighlightEvent& event)
{
    Clear();

    const float halfX = event.sizeX * kCellFill * 0.5F;
    const float halfZ = event.sizeZ * kCellFill * 0.5F;

    scene::Geometry quad;
    quad.positions = {
        {-halfX, 0.0F, -halfZ},
        {halfX, 0.0F, -halfZ},
        {halfX, 0.0F, halfZ},
        {-halfX, 0.0F, halfZ},
    };
    quad.normals.assign(4, glm::vec3{0.0F, 1.0F, 0.0F});
    quad.indices = {0, 2, 1, 0, 3, 2};
    quad.ComputeBounds();

    scene::Material material;
    material.color = event.occupied ? kOccupiedColor : kFreeColor;
    material.opacity = event.occupied ? kOccupiedOpacity : kFreeOpacity;
    material.transparent = true;
    material.unlit = true;

    const scene::GeometryId geometry = m_scene.CreateGeometry(std::move(quad));
    m_highlight = m_scene.CreateMesh(geometry, m_scene.CreateMaterial(material), "grid-highlight");
    if (scene::Node* node = m_scene.Find(m_highlight))
    {
        node->pickable = false;
    }
    scene::NodeTransform transform;
    transform.position = event.center;
    m_scene.SetTransform(m_highlight, transform);
    m_scene.AddChild(m_scene.Root(), m_highlight);
}

void GridHighlighter::Clear()
{
    if (m_highlight != scene::kInvalidNode)
    {
        m_scene.Destroy(m_highlight);
        m_highlight = scene::kInvalidNode;
    }
}
} // namespace placer::editor
