#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "placer/render/RenderSurface.hpp"
#include "placer/scene/SceneGraph.hpp"

namespace placer::render
{
class Renderer final : public IRenderSurface
{
public:
    Renderer() = default;
    ~Renderer() override;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool Initialize(int framebufferWidth, int framebufferHeight, std::string* outError) override;
    void Resize(int framebufferWidth, int framebufferHeight) override;
    void Render(
        const scene::SceneGraph& scene,
        const scene::Camera& camera,
        const std::vector<scene::LineSegment>& overlayLines) override;
    void Shutdown() override;

    void SetClearColor(const glm::vec3& color) { m_clearColor = color; }
    [[nodiscard]] std::size_t CachedGeometryCount() const { return m_gpuGeometries.size(); }

private:
    struct LineVertex
    {
        glm::vec3 position;
        glm::vec3 color;
    };

    struct MeshVertex
    {
        glm::vec3 position;
        glm::vec3 normal;
    };

    struct GpuGeometry
    {
        unsigned int vao = 0;
        unsigned int vbo = 0;
        unsigned int ebo = 0;
        std::uint32_t elementCount = 0;
        bool indexed = false;
        bool lines = false;
    };

    struct PendingDraw
    {
        scene::GeometryId geometry = scene::kInvalidGeometry;
        glm::mat4 model{1.0F};
        scene::Material material;
        float viewDepth = 0.0F;
    };

    const GpuGeometry* EnsureGpuGeometry(scene::GeometryId id, const scene::Geometry& geometry);
    void PurgeReleasedGeometries(const scene::SceneGraph& scene);
    void FreeGpuGeometry(GpuGeometry& gpu);
    void DrawPending(const PendingDraw& draw);

    static unsigned int CompileShader(unsigned int type, const char* source);
    static unsigned int CreateProgram(const char* vertexSource, const char* fragmentSource);

    unsigned int m_lineProgram = 0;
    unsigned int m_meshProgram = 0;
    unsigned int m_lineVao = 0;
    unsigned int m_lineVbo = 0;
    std::size_t m_lineVboCapacityBytes = 0;

    int m_lineViewProjLocation = -1;
    int m_meshViewProjLocation = -1;
    int m_meshModelLocation = -1;
    int m_meshColorLocation = -1;
    int m_meshOpacityLocation = -1;
    int m_meshUnlitLocation = -1;
    int m_meshLightDirLocation = -1;

    std::unordered_map<scene::GeometryId, GpuGeometry> m_gpuGeometries;
    std::vector<LineVertex> m_lineVertices;
    std::vector<PendingDraw> m_opaqueDraws;
    std::vector<PendingDraw> m_transparentDraws;
    glm::vec3 m_clearColor{0.12F, 0.13F, 0.16F};
    glm::vec3 m_lightDirection{-0.4F, -1.0F, -0.3F};
    bool m_initialized = false;
};
} // namespace placer::render
