#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "placer/app/EditorPanels.hpp"
#include "placer/assets/FileModelSource.hpp"
#include "placer/assets/ModelCatalog.hpp"
#include "placer/core/AssetRecord.hpp"
#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/core/JobSystem.hpp"
#include "placer/core/MainThreadQueue.hpp"
#include "placer/core/SessionConfig.hpp"
#include "placer/core/Time.hpp"
#include "placer/editor/AssetReconciler.hpp"
#include "placer/editor/GridHighlighter.hpp"
#include "placer/editor/InteractionController.hpp"
#include "placer/platform/Input.hpp"
#include "placer/platform/Window.hpp"
#include "placer/scene/SceneHost.hpp"
#include "placer/sync/ExternalSync.hpp"
#include "placer/sync/JsonLayoutStore.hpp"
#include "placer/sync/PersistenceAdapter.hpp"
#include "placer/terrain/TerrainLoader.hpp"

namespace placer::app
{
// Native host of one editing session: owns the window, the declarative record list and every
// subsystem, and runs the frame loop.
class App
{
public:
    explicit App(std::filesystem::path configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    bool Run();

private:
    bool Initialize();
    void Shutdown();

    void HandleViewportInput(float scroll);
    void HandleKeyboard();
    void HandlePaletteDrag();
    void HandleFileDrops();
    void DropPalettePayload(const std::string& text, bool accept);

    void OnMutation(const core::Payload& payload);
    void PublishRecords();

    void SwitchTerrain(const std::string& terrainId, const std::string& url);
    void ClearAllAssets();
    void CancelMove();
    void SetPlacementTemplate(const assets::ModelEntry* entry);

    [[nodiscard]] const core::AssetRecord* SelectedRecord() const;
    [[nodiscard]] PanelContext BuildPanelContext();

    std::filesystem::path m_configPath;
    core::SessionConfig m_config;

    core::EventBus m_bus;
    core::SessionCallbacks m_callbacks;
    core::JobSystem m_jobs;
    core::MainThreadQueue m_mainThread;
    core::Time m_time;

    platform::Window m_window;
    platform::Input m_input;
    EditorPanels m_panels;
    assets::ModelCatalog m_catalog;

    std::unique_ptr<assets::FileModelSource> m_models;
    std::unique_ptr<scene::SceneHost> m_host;
    std::unique_ptr<terrain::TerrainLoader> m_terrain;
    std::unique_ptr<editor::AssetReconciler> m_reconciler;
    std::unique_ptr<editor::GridHighlighter> m_highlighter;
    std::unique_ptr<editor::InteractionController> m_interaction;
    std::unique_ptr<sync::JsonLayoutStore> m_layoutStore;
    std::unique_ptr<sync::PersistenceAdapter> m_persistence;
    std::unique_ptr<sync::ExternalSync> m_externalSync;

    // The declarative asset list this host owns; mutation events are applied to it.
    std::vector<core::AssetRecord> m_records;
    bool m_recordsDirty = false;

    std::optional<std::string> m_selectedId;
    std::optional<std::string> m_placementModelId;
    std::string m_lastError;
    std::vector<std::string> m_pendingDroppedFiles;
    std::optional<std::string> m_paletteDrag;
    bool m_paletteDropDone = false;

    bool m_gizmoDragging = false;
    bool m_initialized = false;

    core::EventBus::HandlerPtr m_mutationHandler;
};
} // namespace placer::app
