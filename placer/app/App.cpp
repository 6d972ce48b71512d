#include "placer/app/App.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include "placer/render/Renderer.hpp"

namespace placer::app
{
namespace
{
constexpr float kRotationStepRadians = 0.2617994F;
constexpr float kResizeStep = 1.1F;
constexpr const char* kDefaultTerrainId = "default";
} // namespace

App::App(std::filesystem::path configPath)
    : m_configPath(std::move(configPath))
{
}

App::~App()
{
    Shutdown();
}

bool App::Run()
{
    if (!Initialize())
    {
        Shutdown();
        return false;
    }

    while (!m_window.ShouldClose())
    {
        m_window.PollEvents();
        const platform::WindowEvents events = m_window.TakeEvents();
        m_input.Update(m_window.NativeHandle());
        if (events.framebufferResize.has_value())
        {
            m_host->Resize(events.framebufferResize->x, events.framebufferResize->y);
        }
        m_pendingDroppedFiles.insert(m_pendingDroppedFiles.end(), events.droppedPaths.begin(), events.droppedPaths.end());
        m_time.BeginFrame(glfwGetTime());

        // Model and terrain load results land here.
        m_mainThread.Drain();

        m_panels.BeginFrame();
        HandleKeyboard();
        HandleViewportInput(events.scroll);
        HandleFileDrops();

        const PanelContext context = BuildPanelContext();
        m_panels.Render(context);
        HandlePaletteDrag();

        if (m_recordsDirty)
        {
            PublishRecords();
        }

        m_host->RenderFrame();
        m_panels.EndFrame();
        m_window.SwapBuffers();
    }

    Shutdown();
    return true;
}

bool App::Initialize()
{
    std::string error;
    if (!core::LoadSessionConfig(m_configPath, &m_config, &error))
    {
        std::cerr << "[App] " << error << "\n";
    }

    m_callbacks.onError = [this](const core::ErrorReport& report) { m_lastError = report.message; };
    m_callbacks.onAssetSelected = [this](const std::optional<std::string>& assetId) { m_selectedId = assetId; };

    if (!m_window.Initialize(m_config.window, &error))
    {
        m_callbacks.ReportError(core::ErrorKind::InitializationFailure, error);
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        m_callbacks.ReportError(core::ErrorKind::InitializationFailure, "Failed to initialize GLAD.");
        return false;
    }
    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "[App] OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    if (!m_jobs.Initialize(static_cast<std::size_t>(std::max(0, m_config.jobWorkers))))
    {
        std::cerr << "[App] Warning: job system not started, models load inline.\n";
    }

    if (!m_catalog.Load(m_config.modelCatalogPath, &error))
    {
        std::cerr << "[App] Warning: " << error << "\n";
    }

    m_models = std::make_unique<assets::FileModelSource>(m_jobs, m_mainThread, m_config.assetRoot);
    m_host = std::make_unique<scene::SceneHost>(m_bus, std::make_unique<render::Renderer>(), m_config.camera, m_callbacks);
    if (!m_host->Mount(m_window.FramebufferSize().x, m_window.FramebufferSize().y))
    {
        return false;
    }

    m_terrain = std::make_unique<terrain::TerrainLoader>(m_bus, *m_host, *m_models, m_callbacks, m_config.terrain);
    m_reconciler = std::make_unique<editor::AssetReconciler>(m_bus, *m_host, *m_terrain, *m_models, m_callbacks);
    m_host->SetAssetIdResolver([this](scene::NodeHandle node) { return m_reconciler->AssetIdFor(node); });
    m_highlighter = std::make_unique<editor::GridHighlighter>(m_bus, m_host->Scene());
    m_interaction = std::make_unique<editor::InteractionController>(m_bus, *m_host, *m_terrain, *m_reconciler, m_callbacks);
    m_layoutStore = std::make_unique<sync::JsonLayoutStore>(m_config.layoutDirectory);
    m_persistence = std::make_unique<sync::PersistenceAdapter>(m_bus, *m_layoutStore, m_callbacks);
    m_externalSync = std::make_unique<sync::ExternalSync>(m_bus);

    m_mutationHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnMutation(payload); });
    m_bus.On(core::topics::kAssetAdded, m_mutationHandler);
    m_bus.On(core::topics::kAssetUpdated, m_mutationHandler);
    m_bus.On(core::topics::kAssetDeleted, m_mutationHandler);

    if (!m_panels.Initialize(m_window))
    {
        std::cerr << "[App] Warning: editor panels unavailable.\n";
    }

    const std::string terrainId = m_config.terrain.terrainId.empty() ? kDefaultTerrainId : m_config.terrain.terrainId;
    SwitchTerrain(terrainId, m_config.terrain.url);

    m_initialized = true;
    std::cout << "[App] Ready: " << m_catalog.Entries().size() << " models, terrain '" << terrainId << "'\n";
    return true;
}

void App::Shutdown()
{
    if (m_host == nullptr && !m_initialized)
    {
        m_window.Shutdown();
        return;
    }

    m_panels.Shutdown();
    if (m_mutationHandler != nullptr)
    {
        m_bus.Off(core::topics::kAssetAdded, m_mutationHandler);
        m_bus.Off(core::topics::kAssetUpdated, m_mutationHandler);
        m_bus.Off(core::topics::kAssetDeleted, m_mutationHandler);
        m_mutationHandler.reset();
    }

    m_externalSync.reset();
    m_persistence.reset();
    m_layoutStore.reset();
    m_interaction.reset();
    m_highlighter.reset();
    m_reconciler.reset();
    m_terrain.reset();
    if (m_host != nullptr)
    {
        m_host->Unmount();
        m_host.reset();
    }
    m_models.reset();
    m_jobs.Shutdown();
    m_window.Shutdown();
    m_initialized = false;
}

void App::HandleViewportInput(float scroll)
{
    if (m_panels.WantsMouse() && !m_gizmoDragging)
    {
        if (m_input.PrimaryPressed())
        {
            m_input.ClaimPrimaryGesture();
        }
        return;
    }

    const glm::vec2 pointer = m_input.Pointer();
    scene::OrbitController* orbit = m_host->Orbit();

    if (scroll != 0.0F && orbit != nullptr)
    {
        orbit->Zoom(scroll);
    }

    if (m_input.PrimaryPressed())
    {
        m_gizmoDragging = m_host->BeginGizmoDrag(pointer);
        if (m_gizmoDragging)
        {
            m_input.ClaimPrimaryGesture();
        }
    }

    if (m_gizmoDragging && m_input.PrimaryDown())
    {
        m_host->UpdateGizmoDrag(pointer);
    }
    else if (m_input.PrimaryDragging() && orbit != nullptr)
    {
        orbit->Rotate(m_input.PointerDelta());
    }

    if (m_input.PrimaryReleased())
    {
        if (m_gizmoDragging)
        {
            m_host->EndGizmoDrag();
            m_gizmoDragging = false;
        }
        else if (m_input.PrimaryClicked())
        {
            m_interaction->Click(pointer);
        }
    }

    if (m_input.SecondaryDown() && orbit != nullptr)
    {
        orbit->Pan(m_input.PointerDelta());
    }

    if (m_input.PointerMoved())
    {
        m_interaction->PointerMove(pointer);
    }
}

void App::HandleKeyboard()
{
    using platform::EditorAction;
    if (m_panels.WantsKeyboard())
    {
        return;
    }

    if (m_input.ActionPressed(EditorAction::Cancel))
    {
        if (m_interaction->Mode() == editor::InteractionMode::PickedUp)
        {
            CancelMove();
        }
        else
        {
            m_interaction->Deselect();
        }
    }
    if (m_input.ActionPressed(EditorAction::DeleteSelected))
    {
        m_interaction->DeleteSelected();
    }
    if (m_input.ActionPressed(EditorAction::PickUpSelected))
    {
        m_interaction->PickUpSelected();
    }
    if (m_input.ActionPressed(EditorAction::ToggleGrid))
    {
        m_bus.Emit(core::topics::kGridToggle, core::GridToggleEvent{});
    }

    if (const core::AssetRecord* selected = SelectedRecord())
    {
        if (m_input.ActionPressed(EditorAction::RotateLeft))
        {
            m_interaction->RotateSelected(selected->rotation.y - kRotationStepRadians);
        }
        else if (m_input.ActionPressed(EditorAction::RotateRight))
        {
            m_interaction->RotateSelected(selected->rotation.y + kRotationStepRadians);
        }
        else if (m_input.ActionPressed(EditorAction::Grow))
        {
            m_interaction->ResizeSelected(selected->scale.x * kResizeStep);
        }
        else if (m_input.ActionPressed(EditorAction::Shrink))
        {
            m_interaction->ResizeSelected(selected->scale.x / kResizeStep);
        }
    }

    scene::TransformGizmo* gizmo = m_host->Gizmo();
    if (gizmo != nullptr && !m_gizmoDragging)
    {
        if (m_input.ActionPressed(EditorAction::GizmoTranslate))
        {
            gizmo->SetMode(scene::GizmoMode::Translate);
        }
        if (m_input.ActionPressed(EditorAction::GizmoRotate))
        {
            gizmo->SetMode(scene::GizmoMode::Rotate);
        }
        if (m_input.ActionPressed(EditorAction::GizmoScale))
        {
            gizmo->SetMode(scene::GizmoMode::Scale);
        }
    }
}

void App::HandlePaletteDrag()
{
    const std::optional<std::string> payload = m_panels.ActivePaletteDrag();
    const bool overViewport = !m_panels.PointerOverPanels();
    const bool released = m_input.PrimaryReleased();

    if (payload.has_value())
    {
        // The payload outlives the release by a frame.
        if (m_paletteDropDone)
        {
            return;
        }
        if (released)
        {
            m_paletteDropDone = true;
            m_paletteDrag.reset();
            DropPalettePayload(*payload, overViewport);
            return;
        }
        if (overViewport)
        {
            m_interaction->DragOver(m_input.Pointer());
        }
        else if (m_paletteDrag.has_value())
        {
            m_interaction->DragLeave();
        }
        m_paletteDrag = payload;
        return;
    }

    m_paletteDropDone = false;
    if (m_paletteDrag.has_value())
    {
        const std::string text = *std::exchange(m_paletteDrag, std::nullopt);
        DropPalettePayload(text, overViewport && released);
    }
}

void App::DropPalettePayload(const std::string& text, bool accept)
{
    if (!accept)
    {
        m_interaction->DragLeave();
        return;
    }

    editor::DragPayload dragPayload;
    std::string error;
    if (!editor::ParseDragPayload(text, &dragPayload, &error))
    {
        std::cerr << "[App] " << error << "\n";
        m_interaction->DragLeave();
        return;
    }
    const editor::PlacementResult result = m_interaction->Drop(m_input.Pointer(), dragPayload);
    std::cout << "[App] Drop " << dragPayload.id << ": " << editor::PlacementResultName(result) << "\n";
}

void App::HandleFileDrops()
{
    if (m_pendingDroppedFiles.empty())
    {
        return;
    }
    const std::vector<std::string> paths = std::exchange(m_pendingDroppedFiles, {});
    const glm::vec2 pointer = m_input.Pointer();

    for (const std::string& path : paths)
    {
        const std::filesystem::path file(path);
        std::error_code ec;
        const std::filesystem::path relative = std::filesystem::proximate(file, m_config.assetRoot, ec);

        editor::DragPayload payload;
        payload.id = file.stem().string();
        payload.name = payload.id;
        payload.url = ec ? file.generic_string() : relative.generic_string();

        const editor::PlacementResult result = m_interaction->Drop(pointer, payload);
        std::cout << "[App] File drop " << file.filename().string() << ": " << editor::PlacementResultName(result) << "\n";
    }
}

void App::OnMutation(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr || event->fromGizmo)
    {
        return;
    }

    const auto it = std::find_if(m_records.begin(), m_records.end(), [&](const core::AssetRecord& record) {
        return record.id == event->id;
    });

    switch (event->kind)
    {
        case core::MutationKind::Added:
        {
            if (it != m_records.end())
            {
                return;
            }
            core::AssetRecord record;
            record.id = event->id;
            record.modelUrl = event->modelUrl.value_or(std::string{});
            record.name = event->name.value_or(event->id);
            record.position = event->position.value_or(glm::vec3{0.0F});
            record.rotation = event->rotation.value_or(glm::vec3{0.0F});
            record.scale = event->scale.value_or(glm::vec3{1.0F});
            m_records.push_back(std::move(record));
            break;
        }
        case core::MutationKind::Updated:
        {
            if (it == m_records.end())
            {
                return;
            }
            if (event->position.has_value())
            {
                it->position.x = event->position->x;
                it->position.z = event->position->z;
                if (event->positionHasY)
                {
                    it->position.y = event->position->y;
                }
            }
            if (event->rotation.has_value())
            {
                it->rotation = *event->rotation;
            }
            if (event->scale.has_value())
            {
                it->scale = *event->scale;
            }
            break;
        }
        case core::MutationKind::Deleted:
        {
            if (it == m_records.end())
            {
                return;
            }
            m_records.erase(it);
            break;
        }
        case core::MutationKind::VisualSync:
            return;
    }
    m_recordsDirty = true;
}

void App::PublishRecords()
{
    m_recordsDirty = false;
    m_interaction->SetPlacedAssets(m_records);
    m_externalSync->Observe(m_records);
}

void App::SwitchTerrain(const std::string& terrainId, const std::string& url)
{
    m_interaction->Deselect();
    m_bus.Emit(core::topics::kGridClearHighlight);

    // Visual teardown only; nothing is deleted from storage.
    m_externalSync->Reset();
    m_reconciler->ClearAll();
    m_records.clear();
    m_models->ClearCache();

    m_persistence->SetTerrainId(terrainId);
    m_terrain->SetTerrain(terrainId, url);

    std::string error;
    if (!m_layoutStore->Load(terrainId, &m_records, &error))
    {
        m_callbacks.ReportError(core::ErrorKind::LoadFailure, "Failed to load layout: " + error);
    }
    m_recordsDirty = true;
    std::cout << "[App] Terrain '" << terrainId << "' with " << m_records.size() << " stored assets\n";
}

void App::ClearAllAssets()
{
    if (!m_persistence->ClearAllAssets())
    {
        return;
    }
    m_interaction->Deselect();
    m_externalSync->Reset();
    m_reconciler->ClearAll();
    m_records.clear();
    m_recordsDirty = true;
}

void App::CancelMove()
{
    m_interaction->CancelMove();
    m_bus.Emit(core::topics::kGridClearHighlight);
    m_selectedId = m_interaction->SelectedId();
}

void App::SetPlacementTemplate(const assets::ModelEntry* entry)
{
    if (entry == nullptr)
    {
        m_interaction->SetPlacementTemplate(std::nullopt);
        m_placementModelId.reset();
        return;
    }

    editor::PlacementTemplate placement;
    placement.modelId = entry->id;
    placement.url = entry->url;
    placement.name = entry->name;
    placement.rotation = entry->metadata.rotation.value_or(glm::vec3{0.0F});
    placement.scale = entry->metadata.scale;
    m_interaction->SetPlacementTemplate(placement);
    m_placementModelId = entry->id;
}

const core::AssetRecord* App::SelectedRecord() const
{
    if (!m_selectedId.has_value())
    {
        return nullptr;
    }
    const auto it = std::find_if(m_records.begin(), m_records.end(), [&](const core::AssetRecord& record) {
        return record.id == *m_selectedId;
    });
    return it != m_records.end() ? &*it : nullptr;
}

PanelContext App::BuildPanelContext()
{
    PanelContext context;
    context.catalog = &m_catalog;
    context.records = &m_records;
    context.selectedId = m_selectedId;
    context.placementModelId = m_placementModelId;
    context.interactionMode = editor::InteractionModeName(m_interaction->Mode());
    context.terrainId = m_terrain->TerrainId();
    context.terrainState = terrain::TerrainStateName(m_terrain->State());
    context.gizmoMode = m_host->Gizmo() != nullptr ? scene::GizmoModeName(m_host->Gizmo()->Mode()) : "none";
    context.lastError = m_lastError;
    context.gridVisible = m_terrain->IsGridVisible();
    context.fps = m_time.SmoothedFps();

    context.setPlacementTemplate = [this](const assets::ModelEntry* entry) { SetPlacementTemplate(entry); };
    context.pickUpSelected = [this]() { m_interaction->PickUpSelected(); };
    context.deleteSelected = [this]() { m_interaction->DeleteSelected(); };
    context.cancelMove = [this]() { CancelMove(); };
    context.rotateSelected = [this](float yaw) { m_interaction->RotateSelected(yaw); };
    context.resizeSelected = [this](float scale) { m_interaction->ResizeSelected(scale); };
    context.clearAllAssets = [this]() { ClearAllAssets(); };
    context.setGridVisible = [this](bool visible) { m_bus.Emit(core::topics::kGridToggle, core::GridToggleEvent{visible}); };
    context.setGizmoMode = [this](int mode) {
        if (scene::TransformGizmo* gizmo = m_host->Gizmo())
        {
            gizmo->SetMode(static_cast<scene::GizmoMode>(mode));
        }
    };
    context.loadTerrain = [this](const std::string& terrainId, const std::string& url) {
        SwitchTerrain(terrainId.empty() ? kDefaultTerrainId : terrainId, url);
    };
    context.dismissError = [this]() { m_lastError.clear(); };
    return context;
}
} // namespace placer::app
