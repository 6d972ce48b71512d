#include "placer/app/EditorPanels.hpp"

#include <array>

#include <nlohmann/json.hpp>

#include "placer/assets/ModelCatalog.hpp"
#include "placer/platform/Window.hpp"

#if PLACER_WITH_IMGUI
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#endif

namespace placer::app
{
namespace
{
constexpr const char* kPalettePayloadType = "PLACER_MODEL";
constexpr float kRotationStepRadians = 0.2617994F; // 15 degrees

std::string PalettePayloadJson(const assets::ModelEntry& entry)
{
    nlohmann::json payload{{"id", entry.id}, {"url", entry.url}, {"name", entry.name}};
    if (entry.metadata.rotation.has_value())
    {
        payload["rotation"] = core::Vec3ToJson(*entry.metadata.rotation);
    }
    return payload.dump();
}
} // namespace

struct EditorPanels::Impl
{
    bool pointerOverPanels = false;
    std::optional<std::string> paletteDrag;
    float resizeValue = 1.0F;
    std::array<char, 128> terrainIdBuffer{};
    std::array<char, 512> terrainUrlBuffer{};
};

EditorPanels::~EditorPanels()
{
    Shutdown();
}

bool EditorPanels::Initialize(platform::Window& window)
{
#if PLACER_WITH_IMGUI
    m_impl = new Impl();

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window.NativeHandle(), true);
    ImGui_ImplOpenGL3_Init("#version 450");
#else
    (void)window;
#endif
    return true;
}

void EditorPanels::Shutdown()
{
#if PLACER_WITH_IMGUI
    if (m_impl != nullptr)
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        delete m_impl;
        m_impl = nullptr;
    }
#endif
}

void EditorPanels::BeginFrame()
{
#if PLACER_WITH_IMGUI
    if (m_impl == nullptr)
    {
        return;
    }
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
#endif
}

void EditorPanels::Render(const PanelContext& context)
{
#if PLACER_WITH_IMGUI
    if (m_impl == nullptr)
    {
        return;
    }

    ImGui::SetNextWindowPos(ImVec2(10.0F, 10.0F), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(260.0F, 420.0F), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Models"))
    {
        if (context.catalog == nullptr || context.catalog->Empty())
        {
            ImGui::TextUnformatted("No models in catalog.");
        }
        else
        {
            ImGui::TextUnformatted("Drag into the scene, or select to click-place.");
            ImGui::Separator();
            for (const assets::ModelEntry& entry : context.catalog->Entries())
            {
                const bool selected = context.placementModelId.has_value() && *context.placementModelId == entry.id;
                if (ImGui::Selectable(entry.name.c_str(), selected) && context.setPlacementTemplate)
                {
                    context.setPlacementTemplate(selected ? nullptr : &entry);
                }
                if (ImGui::BeginDragDropSource())
                {
                    const std::string payload = PalettePayloadJson(entry);
                    ImGui::SetDragDropPayload(kPalettePayloadType, payload.c_str(), payload.size());
                    ImGui::Text("Place %s", entry.name.c_str());
                    ImGui::EndDragDropSource();
                }
            }
        }
    }
    ImGui::End();

    ImGui::SetNextWindowPos(ImVec2(10.0F, 440.0F), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Selection", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::Text("Mode: %s", context.interactionMode.c_str());
        if (!context.selectedId.has_value())
        {
            ImGui::TextUnformatted("Nothing selected.");
        }
        else
        {
            ImGui::Text("Asset: %s", context.selectedId->c_str());
            if (context.records != nullptr)
            {
                for (const core::AssetRecord& record : *context.records)
                {
                    if (record.id != *context.selectedId)
                    {
                        continue;
                    }
                    ImGui::Text("Name: %s", record.name.c_str());
                    ImGui::Text("Position: %.2f %.2f %.2f", record.position.x, record.position.y, record.position.z);
                    ImGui::Text("Rotation Y: %.1f deg", record.rotation.y * 57.29578F);
                    ImGui::Text("Scale: %.2f", record.scale.x);
                    if (ImGui::Button("Rotate -15") && context.rotateSelected)
                    {
                        context.rotateSelected(record.rotation.y - kRotationStepRadians);
                    }
                    ImGui::SameLine();
                    if (ImGui::Button("Rotate +15") && context.rotateSelected)
                    {
                        context.rotateSelected(record.rotation.y + kRotationStepRadians);
                    }
                    break;
                }
            }

            ImGui::SliderFloat("Scale", &m_impl->resizeValue, 0.1F, 5.0F, "%.2f");
            ImGui::SameLine();
            if (ImGui::Button("Apply") && context.resizeSelected)
            {
                context.resizeSelected(m_impl->resizeValue);
            }

            if (context.interactionMode == "PickedUp")
            {
                if (ImGui::Button("Cancel move") && context.cancelMove)
                {
                    context.cancelMove();
                }
            }
            else if (ImGui::Button("Pick up") && context.pickUpSelected)
            {
                context.pickUpSelected();
            }
            ImGui::SameLine();
            if (ImGui::Button("Delete") && context.deleteSelected)
            {
                context.deleteSelected();
            }
        }

        ImGui::Separator();
        ImGui::Text("Gizmo: %s (W/E/R)", context.gizmoMode.c_str());
        if (ImGui::Button("Move") && context.setGizmoMode)
        {
            context.setGizmoMode(0);
        }
        ImGui::SameLine();
        if (ImGui::Button("Rotate") && context.setGizmoMode)
        {
            context.setGizmoMode(1);
        }
        ImGui::SameLine();
        if (ImGui::Button("Scale") && context.setGizmoMode)
        {
            context.setGizmoMode(2);
        }
    }
    ImGui::End();

    ImGui::SetNextWindowPos(ImVec2(280.0F, 10.0F), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Session", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::Text("Terrain: %s (%s)", context.terrainId.c_str(), context.terrainState.c_str());
        ImGui::Text("Assets: %zu", context.records != nullptr ? context.records->size() : static_cast<std::size_t>(0));
        ImGui::Text("FPS: %.1f", context.fps);

        bool gridVisible = context.gridVisible;
        if (ImGui::Checkbox("Grid", &gridVisible) && context.setGridVisible)
        {
            context.setGridVisible(gridVisible);
        }

        ImGui::InputText("Terrain id", m_impl->terrainIdBuffer.data(), m_impl->terrainIdBuffer.size());
        ImGui::InputText("Terrain url", m_impl->terrainUrlBuffer.data(), m_impl->terrainUrlBuffer.size());
        if (ImGui::Button("Load terrain") && context.loadTerrain)
        {
            context.loadTerrain(m_impl->terrainIdBuffer.data(), m_impl->terrainUrlBuffer.data());
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear all assets") && context.clearAllAssets)
        {
            context.clearAllAssets();
        }

        if (!context.lastError.empty())
        {
            ImGui::Separator();
            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0F, 0.45F, 0.45F, 1.0F));
            ImGui::TextWrapped("%s", context.lastError.c_str());
            ImGui::PopStyleColor();
            if (ImGui::Button("Dismiss") && context.dismissError)
            {
                context.dismissError();
            }
        }
    }
    ImGui::End();

    m_impl->pointerOverPanels = ImGui::IsWindowHovered(ImGuiHoveredFlags_AnyWindow);
    m_impl->paletteDrag.reset();
    if (const ImGuiPayload* payload = ImGui::GetDragDropPayload())
    {
        if (payload->IsDataType(kPalettePayloadType) && payload->Data != nullptr)
        {
            m_impl->paletteDrag = std::string(static_cast<const char*>(payload->Data), static_cast<std::size_t>(payload->DataSize));
        }
    }
#else
    (void)context;
#endif
}

void EditorPanels::EndFrame()
{
#if PLACER_WITH_IMGUI
    if (m_impl == nullptr)
    {
        return;
    }
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
#endif
}

bool EditorPanels::WantsMouse() const
{
#if PLACER_WITH_IMGUI
    return m_impl != nullptr && ImGui::GetIO().WantCaptureMouse;
#else
    return false;
#endif
}

bool EditorPanels::WantsKeyboard() const
{
#if PLACER_WITH_IMGUI
    return m_impl != nullptr && ImGui::GetIO().WantCaptureKeyboard;
#else
    return false;
#endif
}

bool EditorPanels::PointerOverPanels() const
{
    return m_impl != nullptr && m_impl->pointerOverPanels;
}

std::optional<std::string> EditorPanels::ActivePaletteDrag() const
{
    if (m_impl == nullptr)
    {
        return std::nullopt;
    }
    return m_impl->paletteDrag;
}
} // namespace placer::app
