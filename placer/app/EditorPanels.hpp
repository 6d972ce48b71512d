#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "placer/core/AssetRecord.hpp"

namespace placer::platform
{
class Window;
}

namespace placer::assets
{
class ModelCatalog;
struct ModelEntry;
}

namespace placer::app
{
struct PanelContext
{
    const assets::ModelCatalog* catalog = nullptr;
    const std::vector<core::AssetRecord>* records = nullptr;
    std::optional<std::string> selectedId;
    std::optional<std::string> placementModelId;
    std::string interactionMode;
    std::string terrainId;
    std::string terrainState;
    std::string gizmoMode;
    std::string lastError;
    bool gridVisible = true;
    float fps = 0.0F;

    std::function<void(const assets::ModelEntry*)> setPlacementTemplate;
    std::function<void()> pickUpSelected;
    std::function<void()> deleteSelected;
    std::function<void()> cancelMove;
    std::function<void(float)> rotateSelected;
    std::function<void(float)> resizeSelected;
    std::function<void()> clearAllAssets;
    std::function<void(bool)> setGridVisible;
    std::function<void(int)> setGizmoMode;
    std::function<void(const std::string&, const std::string&)> loadTerrain;
    std::function<void()> dismissError;
};

// Model palette, selection details and session status drawn with Dear ImGui. Without ImGui every
// call is a no-op and the viewport receives all input.
class EditorPanels
{
public:
    EditorPanels() = default;
    ~EditorPanels();

    EditorPanels(const EditorPanels&) = delete;
    EditorPanels& operator=(const EditorPanels&) = delete;

    bool Initialize(platform::Window& window);
    void Shutdown();

    void BeginFrame();
    void Render(const PanelContext& context);
    void EndFrame();

    [[nodiscard]] bool WantsMouse() const;
    [[nodiscard]] bool WantsKeyboard() const;
    // True when the pointer is over a panel this frame.
    [[nodiscard]] bool PointerOverPanels() const;

    // JSON payload of a palette entry currently being dragged, if any.
    [[nodiscard]] std::optional<std::string> ActivePaletteDrag() const;

private:
    struct Impl;
    Impl* m_impl = nullptr;
};
} // namespace placer::app
