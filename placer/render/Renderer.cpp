#include "placer/render/Renderer.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>

#include <glad/glad.h>

#include <glm/geometric.hpp>
#include <glm/gtc/type_ptr.hpp>

#include "placer/scene/Camera.hpp"

namespace placer::render
{
namespace
{
constexpr const char* kLineVertexShader = R"(
#version 450 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aColor;

uniform mat4 uViewProjection;

out vec3 vColor;

void main()
{
    vColor = aColor;
    gl_Position = uViewProjection * vec4(aPosition, 1.0);
}
)";

constexpr const char* kLineFragmentShader = R"(
#version 450 core
in vec3 vColor;
out vec4 FragColor;

void main()
{
    FragColor = vec4(vColor, 1.0);
}
)";

constexpr const char* kMeshVertexShader = R"(
#version 450 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aNormal;

uniform mat4 uViewProjection;
uniform mat4 uModel;

out vec3 vNormal;

void main()
{
    vec4 worldPos = uModel * vec4(aPosition, 1.0);
    vNormal = mat3(uModel) * aNormal;
    gl_Position = uViewProjection * worldPos;
}
)";

constexpr const char* kMeshFragmentShader = R"(
#version 450 core
in vec3 vNormal;
out vec4 FragColor;

uniform vec3 uColor;
uniform float uOpacity;
uniform int uUnlit;
uniform vec3 uLightDir;

void main()
{
    if (uUnlit == 1)
    {
        FragColor = vec4(uColor, uOpacity);
        return;
    }
    vec3 n = normalize(vNormal);
    float diffuse = max(dot(n, -normalize(uLightDir)), 0.0);
    vec3 lit = uColor * (0.35 + 0.65 * diffuse);
    FragColor = vec4(lit, uOpacity);
}
)";

std::vector<glm::vec3> ComputeVertexNormals(const scene::Geometry& geometry)
{
    std::vector<glm::vec3> normals(geometry.positions.size(), glm::vec3{0.0F});
    const std::size_t triangles = geometry.TriangleCount();
    for (std::size_t i = 0; i < triangles; ++i)
    {
        std::uint32_t ia = static_cast<std::uint32_t>(i * 3);
        std::uint32_t ib = ia + 1;
        std::uint32_t ic = ia + 2;
        if (!geometry.indices.empty())
        {
            ia = geometry.indices[ia];
            ib = geometry.indices[ib];
            ic = geometry.indices[ic];
        }
        if (ia >= normals.size() || ib >= normals.size() || ic >= normals.size())
        {
            continue;
        }
        const glm::vec3 faceNormal = glm::cross(
            geometry.positions[ib] - geometry.positions[ia],
            geometry.positions[ic] - geometry.positions[ia]);
        normals[ia] += faceNormal;
        normals[ib] += faceNormal;
        normals[ic] += faceNormal;
    }
    for (glm::vec3& n : normals)
    {
        n = glm::length(n) > 1.0e-6F ? glm::normalize(n) : glm::vec3{0.0F, 1.0F, 0.0F};
    }
    return normals;
}
} // namespace

Renderer::~Renderer()
{
    Shutdown();
}

bool Renderer::Initialize(int framebufferWidth, int framebufferHeight, std::string* outError)
{
    if (m_initialized)
    {
        return true;
    }

    glEnable(GL_DEPTH_TEST);
    m_lineVertices.reserve(4096);

    m_lineProgram = CreateProgram(kLineVertexShader, kLineFragmentShader);
    m_meshProgram = CreateProgram(kMeshVertexShader, kMeshFragmentShader);
    if (m_lineProgram == 0 || m_meshProgram == 0)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to build renderer shader programs.";
        }
        Shutdown();
        return false;
    }

    glGenVertexArrays(1, &m_lineVao);
    glGenBuffers(1, &m_lineVbo);
    glBindVertexArray(m_lineVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_lineVbo);
    m_lineVboCapacityBytes = 512U * 1024U;
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_lineVboCapacityBytes), nullptr, GL_STREAM_DRAW);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(LineVertex), reinterpret_cast<void*>(offsetof(LineVertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(LineVertex), reinterpret_cast<void*>(offsetof(LineVertex, color)));
    glEnableVertexAttribArray(1);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    m_lineViewProjLocation = glGetUniformLocation(m_lineProgram, "uViewProjection");
    m_meshViewProjLocation = glGetUniformLocation(m_meshProgram, "uViewProjection");
    m_meshModelLocation = glGetUniformLocation(m_meshProgram, "uModel");
    m_meshColorLocation = glGetUniformLocation(m_meshProgram, "uColor");
    m_meshOpacityLocation = glGetUniformLocation(m_meshProgram, "uOpacity");
    m_meshUnlitLocation = glGetUniformLocation(m_meshProgram, "uUnlit");
    m_meshLightDirLocation = glGetUniformLocation(m_meshProgram, "uLightDir");

    Resize(framebufferWidth, framebufferHeight);
    m_initialized = true;
    return true;
}

void Renderer::Resize(int framebufferWidth, int framebufferHeight)
{
    glViewport(0, 0, std::max(1, framebufferWidth), std::max(1, framebufferHeight));
}

const Renderer::GpuGeometry* Renderer::EnsureGpuGeometry(scene::GeometryId id, const scene::Geometry& geometry)
{
    const auto existing = m_gpuGeometries.find(id);
    if (existing != m_gpuGeometries.end())
    {
        return &existing->second;
    }
    if (geometry.positions.empty())
    {
        return nullptr;
    }

    std::vector<MeshVertex> vertices;
    vertices.reserve(geometry.positions.size());
    const std::vector<glm::vec3> fallbackNormals =
        geometry.normals.size() == geometry.positions.size() ? std::vector<glm::vec3>{} : ComputeVertexNormals(geometry);
    const std::vector<glm::vec3>& normals = fallbackNormals.empty() ? geometry.normals : fallbackNormals;
    for (std::size_t i = 0; i < geometry.positions.size(); ++i)
    {
        const glm::vec3 normal = i < normals.size() ? normals[i] : glm::vec3{0.0F, 1.0F, 0.0F};
        vertices.push_back(MeshVertex{geometry.positions[i], normal});
    }

    GpuGeometry gpu;
    gpu.lines = geometry.primitive == scene::PrimitiveType::Lines;
    gpu.indexed = !geometry.indices.empty();
    gpu.elementCount = static_cast<std::uint32_t>(gpu.indexed ? geometry.indices.size() : geometry.positions.size());

    glGenVertexArrays(1, &gpu.vao);
    glGenBuffers(1, &gpu.vbo);
    glBindVertexArray(gpu.vao);
    glBindBuffer(GL_ARRAY_BUFFER, gpu.vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertices.size() * sizeof(MeshVertex)), vertices.data(), GL_STATIC_DRAW);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(MeshVertex), reinterpret_cast<void*>(offsetof(MeshVertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(MeshVertex), reinterpret_cast<void*>(offsetof(MeshVertex, normal)));
    glEnableVertexAttribArray(1);
    if (gpu.indexed)
    {
        glGenBuffers(1, &gpu.ebo);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, gpu.ebo);
        glBufferData(
            GL_ELEMENT_ARRAY_BUFFER,
            static_cast<GLsizeiptr>(geometry.indices.size() * sizeof(std::uint32_t)),
            geometry.indices.data(),
            GL_STATIC_DRAW);
    }
    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    const auto [it, inserted] = m_gpuGeometries.emplace(id, gpu);
    (void)inserted;
    return &it->second;
}

void Renderer::FreeGpuGeometry(GpuGeometry& gpu)
{
    if (gpu.ebo != 0)
    {
        glDeleteBuffers(1, &gpu.ebo);
        gpu.ebo = 0;
    }
    if (gpu.vbo != 0)
    {
        glDeleteBuffers(1, &gpu.vbo);
        gpu.vbo = 0;
    }
    if (gpu.vao != 0)
    {
        glDeleteVertexArrays(1, &gpu.vao);
        gpu.vao = 0;
    }
}

void Renderer::PurgeReleasedGeometries(const scene::SceneGraph& scene)
{
    for (auto it = m_gpuGeometries.begin(); it != m_gpuGeometries.end();)
    {
        if (!scene.HasGeometry(it->first))
        {
            FreeGpuGeometry(it->second);
            it = m_gpuGeometries.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void Renderer::DrawPending(const PendingDraw& draw)
{
    const auto it = m_gpuGeometries.find(draw.geometry);
    if (it == m_gpuGeometries.end() || it->second.elementCount == 0)
    {
        return;
    }
    const GpuGeometry& gpu = it->second;

    glUniformMatrix4fv(m_meshModelLocation, 1, GL_FALSE, glm::value_ptr(draw.model));
    glUniform3fv(m_meshColorLocation, 1, glm::value_ptr(draw.material.color));
    glUniform1f(m_meshOpacityLocation, draw.material.transparent ? draw.material.opacity : 1.0F);
    glUniform1i(m_meshUnlitLocation, (draw.material.unlit || gpu.lines) ? 1 : 0);

    const GLenum mode = gpu.lines ? GL_LINES : GL_TRIANGLES;
    if (draw.material.wireframe && !gpu.lines)
    {
        glPolygonMode(GL_FRONT_AND_BACK, GL_LINE);
    }
    glBindVertexArray(gpu.vao);
    if (gpu.indexed)
    {
        glDrawElements(mode, static_cast<GLsizei>(gpu.elementCount), GL_UNSIGNED_INT, nullptr);
    }
    else
    {
        glDrawArrays(mode, 0, static_cast<GLsizei>(gpu.elementCount));
    }
    if (draw.material.wireframe && !gpu.lines)
    {
        glPolygonMode(GL_FRONT_AND_BACK, GL_FILL);
    }
}

void Renderer::Render(
    const scene::SceneGraph& scene,
    const scene::Camera& camera,
    const std::vector<scene::LineSegment>& overlayLines)
{
    if (!m_initialized)
    {
        return;
    }

    PurgeReleasedGeometries(scene);

    glClearColor(m_clearColor.r, m_clearColor.g, m_clearColor.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    const glm::mat4 view = camera.View();
    const glm::mat4 viewProjection = camera.ViewProjection();

    m_opaqueDraws.clear();
    m_transparentDraws.clear();
    scene.ForEachVisibleMesh([&](scene::NodeHandle node, const glm::mat4& world, const scene::Geometry& geometry, const scene::Material& material) {
        const scene::Node* meshNode = scene.Find(node);
        if (meshNode == nullptr || EnsureGpuGeometry(meshNode->geometry, geometry) == nullptr)
        {
            return;
        }
        PendingDraw draw;
        draw.geometry = meshNode->geometry;
        draw.model = world;
        draw.material = material;
        draw.viewDepth = (view * world[3]).z;
        (material.transparent ? m_transparentDraws : m_opaqueDraws).push_back(draw);
    });

    glUseProgram(m_meshProgram);
    glUniformMatrix4fv(m_meshViewProjLocation, 1, GL_FALSE, glm::value_ptr(viewProjection));
    glUniform3fv(m_meshLightDirLocation, 1, glm::value_ptr(m_lightDirection));
    for (const PendingDraw& draw : m_opaqueDraws)
    {
        DrawPending(draw);
    }

    if (!m_transparentDraws.empty())
    {
        // Back to front, no depth writes, so overlapping translucent quads blend in order.
        std::sort(m_transparentDraws.begin(), m_transparentDraws.end(), [](const PendingDraw& a, const PendingDraw& b) {
            return a.viewDepth < b.viewDepth;
        });
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glDepthMask(GL_FALSE);
        for (const PendingDraw& draw : m_transparentDraws)
        {
            DrawPending(draw);
        }
        glDepthMask(GL_TRUE);
        glDisable(GL_BLEND);
    }

    m_lineVertices.clear();
    for (const scene::LineSegment& line : overlayLines)
    {
        m_lineVertices.push_back(LineVertex{line.from, line.color});
        m_lineVertices.push_back(LineVertex{line.to, line.color});
    }
    if (!m_lineVertices.empty())
    {
        glUseProgram(m_lineProgram);
        glUniformMatrix4fv(m_lineViewProjLocation, 1, GL_FALSE, glm::value_ptr(viewProjection));
        glBindVertexArray(m_lineVao);
        glBindBuffer(GL_ARRAY_BUFFER, m_lineVbo);

        const std::size_t lineBytes = m_lineVertices.size() * sizeof(LineVertex);
        if (lineBytes > m_lineVboCapacityBytes)
        {
            std::size_t newCapacity = std::max<std::size_t>(m_lineVboCapacityBytes, 64U * 1024U);
            while (newCapacity < lineBytes)
            {
                newCapacity *= 2U;
            }
            m_lineVboCapacityBytes = newCapacity;
        }
        // Orphan the buffer to avoid GPU sync stalls.
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_lineVboCapacityBytes), nullptr, GL_STREAM_DRAW);
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(lineBytes), m_lineVertices.data());

        // Gizmo handles stay visible through geometry.
        glDisable(GL_DEPTH_TEST);
        glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(m_lineVertices.size()));
        glEnable(GL_DEPTH_TEST);
    }
    glBindVertexArray(0);
}

void Renderer::Shutdown()
{
    for (auto& [id, gpu] : m_gpuGeometries)
    {
        FreeGpuGeometry(gpu);
    }
    m_gpuGeometries.clear();

    if (m_lineVbo != 0)
    {
        glDeleteBuffers(1, &m_lineVbo);
        m_lineVbo = 0;
    }
    if (m_lineVao != 0)
    {
        glDeleteVertexArrays(1, &m_lineVao);
        m_lineVao = 0;
    }
    if (m_lineProgram != 0)
    {
        glDeleteProgram(m_lineProgram);
        m_lineProgram = 0;
    }
    if (m_meshProgram != 0)
    {
        glDeleteProgram(m_meshProgram);
        m_meshProgram = 0;
    }
    m_initialized = false;
}

unsigned int Renderer::CompileShader(unsigned int type, const char* source)
{
    const unsigned int shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<std::size_t>(std::max(logLength, 1)), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        std::cerr << "[Renderer] Shader compile error: " << log << "\n";
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

unsigned int Renderer::CreateProgram(const char* vertexSource, const char* fragmentSource)
{
    const unsigned int vertexShader = CompileShader(GL_VERTEX_SHADER, vertexSource);
    const unsigned int fragmentShader = CompileShader(GL_FRAGMENT_SHADER, fragmentSource);
    if (vertexShader == 0 || fragmentShader == 0)
    {
        if (vertexShader != 0)
        {
            glDeleteShader(vertexShader);
        }
        if (fragmentShader != 0)
        {
            glDeleteShader(fragmentShader);
        }
        return 0;
    }

    const unsigned int program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<std::size_t>(std::max(logLength, 1)), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        std::cerr << "[Renderer] Program link error: " << log << "\n";
        glDeleteProgram(program);
        return 0;
    }
    return program;
}
} // namespace placer::render
