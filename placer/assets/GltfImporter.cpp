#include "placer/assets/GltfImporter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_inverse.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/mat3x3.hpp>
#include <glm/mat4x4.hpp>

#include <nlohmann/json.hpp>

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_INCLUDE_JSON
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define STB_IMAGE_IMPLEMENTATION
#include <tiny_gltf.h>

namespace placer::assets
{
namespace
{
std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}

// Byte range of an accessor after buffer view validation.
struct AccessorSpan
{
    const std::uint8_t* base = nullptr;
    std::size_t stride = 0;
    std::size_t size = 0;
};

bool ResolveAccessor(
    const tinygltf::Model& model,
    const tinygltf::Accessor& accessor,
    std::size_t elementSize,
    AccessorSpan* outSpan,
    std::string* outError
)
{
    if (accessor.bufferView < 0 || accessor.bufferView >= static_cast<int>(model.bufferViews.size()))
    {
        SetError(outError, "Accessor has invalid buffer view.");
        return false;
    }
    const tinygltf::BufferView& view = model.bufferViews[static_cast<std::size_t>(accessor.bufferView)];
    if (view.buffer < 0 || view.buffer >= static_cast<int>(model.buffers.size()))
    {
        SetError(outError, "Buffer view references invalid buffer.");
        return false;
    }
    const tinygltf::Buffer& buffer = model.buffers[static_cast<std::size_t>(view.buffer)];

    const int byteStride = accessor.ByteStride(view);
    const std::size_t stride = byteStride > 0 ? static_cast<std::size_t>(byteStride) : elementSize;
    const std::size_t baseOffset = static_cast<std::size_t>(view.byteOffset + accessor.byteOffset);
    if (accessor.count > 0 && baseOffset + (accessor.count - 1) * stride + elementSize > buffer.data.size())
    {
        SetError(outError, "Accessor data out of range.");
        return false;
    }

    outSpan->base = buffer.data.data() + baseOffset;
    outSpan->stride = stride;
    outSpan->size = accessor.count;
    return true;
}

template <typename T>
T LoadUnaligned(const std::uint8_t* src)
{
    T value{};
    std::memcpy(&value, src, sizeof(T));
    return value;
}

// Index buffers may be u8, u16 or u32; all widen to u32.
bool ReadIndices(const tinygltf::Model& model, int accessorIndex, std::vector<std::uint32_t>* out, std::string* outError)
{
    if (accessorIndex < 0 || accessorIndex >= static_cast<int>(model.accessors.size()))
    {
        SetError(outError, "Primitive references a missing index accessor.");
        return false;
    }
    const tinygltf::Accessor& accessor = model.accessors[static_cast<std::size_t>(accessorIndex)];
    if (accessor.type != TINYGLTF_TYPE_SCALAR)
    {
        SetError(outError, "Index accessor is not scalar.");
        return false;
    }

    std::uint32_t (*widen)(const std::uint8_t*) = nullptr;
    std::size_t width = 0;
    switch (accessor.componentType)
    {
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE:
            widen = [](const std::uint8_t* src) { return static_cast<std::uint32_t>(*src); };
            width = 1;
            break;
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT:
            widen = [](const std::uint8_t* src) { return static_cast<std::uint32_t>(LoadUnaligned<std::uint16_t>(src)); };
            width = 2;
            break;
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT:
            widen = [](const std::uint8_t* src) { return LoadUnaligned<std::uint32_t>(src); };
            width = 4;
            break;
        default:
            SetError(outError, "Unsupported index component type " + std::to_string(accessor.componentType) + ".");
            return false;
    }

    AccessorSpan span;
    if (!ResolveAccessor(model, accessor, width, &span, outError))
    {
        return false;
    }
    out->resize(span.size);
    for (std::size_t i = 0; i < span.size; ++i)
    {
        (*out)[i] = widen(span.base + i * span.stride);
    }
    return true;
}

// POSITION and NORMAL attributes; only float vec3 layouts are accepted.
bool ReadVec3(const tinygltf::Model& model, int accessorIndex, std::vector<glm::vec3>* out, std::string* outError)
{
    if (accessorIndex < 0 || accessorIndex >= static_cast<int>(model.accessors.size()))
    {
        SetError(outError, "Primitive references a missing vertex accessor.");
        return false;
    }
    const tinygltf::Accessor& accessor = model.accessors[static_cast<std::size_t>(accessorIndex)];
    if (accessor.type != TINYGLTF_TYPE_VEC3 || accessor.componentType != TINYGLTF_COMPONENT_TYPE_FLOAT)
    {
        SetError(outError, "Vertex attribute must be a float vec3 accessor.");
        return false;
    }

    AccessorSpan span;
    if (!ResolveAccessor(model, accessor, sizeof(glm::vec3), &span, outError))
    {
        return false;
    }
    out->resize(span.size);
    for (std::size_t i = 0; i < span.size; ++i)
    {
        const auto raw = LoadUnaligned<std::array<float, 3>>(span.base + i * span.stride);
        (*out)[i] = glm::vec3{raw[0], raw[1], raw[2]};
    }
    return true;
}

glm::mat4 NodeLocalTransform(const tinygltf::Node& node)
{
    if (node.matrix.size() == 16U)
    {
        glm::mat4 m{1.0F};
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                // glTF stores matrices in column-major order.
                m[c][r] = static_cast<float>(node.matrix[static_cast<std::size_t>(c * 4 + r)]);
            }
        }
        return m;
    }

    glm::vec3 translation{0.0F};
    if (node.translation.size() == 3U)
    {
        translation = glm::vec3{
            static_cast<float>(node.translation[0]),
            static_cast<float>(node.translation[1]),
            static_cast<float>(node.translation[2]),
        };
    }

    glm::quat rotation = glm::quat{1.0F, 0.0F, 0.0F, 0.0F};
    if (node.rotation.size() == 4U)
    {
        rotation = glm::quat{
            static_cast<float>(node.rotation[3]),
            static_cast<float>(node.rotation[0]),
            static_cast<float>(node.rotation[1]),
            static_cast<float>(node.rotation[2]),
        };
        if (glm::length(rotation) > 1.0e-6F)
        {
            rotation = glm::normalize(rotation);
        }
    }

    glm::vec3 scale{1.0F};
    if (node.scale.size() == 3U)
    {
        scale = glm::vec3{
            static_cast<float>(node.scale[0]),
            static_cast<float>(node.scale[1]),
            static_cast<float>(node.scale[2]),
        };
    }

    const glm::mat4 identity{1.0F};
    return glm::translate(identity, translation) * glm::mat4_cast(rotation) * glm::scale(identity, scale);
}

void CollectNodeInstances(
    const tinygltf::Model& model,
    int nodeIndex,
    const glm::mat4& parentWorld,
    int depth,
    std::vector<std::vector<glm::mat4>>* outMeshInstances
)
{
    // Malformed files can contain node cycles.
    if (depth > 64 || nodeIndex < 0 || nodeIndex >= static_cast<int>(model.nodes.size()))
    {
        return;
    }

    const tinygltf::Node& node = model.nodes[static_cast<std::size_t>(nodeIndex)];
    const glm::mat4 world = parentWorld * NodeLocalTransform(node);
    if (node.mesh >= 0 && node.mesh < static_cast<int>(outMeshInstances->size()))
    {
        (*outMeshInstances)[static_cast<std::size_t>(node.mesh)].push_back(world);
    }
    for (int child : node.children)
    {
        CollectNodeInstances(model, child, world, depth + 1, outMeshInstances);
    }
}

std::vector<std::array<std::uint32_t, 3>> Triangulate(int mode, const std::vector<std::uint32_t>& indices)
{
    std::vector<std::array<std::uint32_t, 3>> triangles;
    triangles.reserve(indices.size() / 3U + 2U);
    if (mode == TINYGLTF_MODE_TRIANGLES)
    {
        for (std::size_t i = 0; i + 2 < indices.size(); i += 3)
        {
            triangles.push_back({indices[i], indices[i + 1], indices[i + 2]});
        }
    }
    else if (mode == TINYGLTF_MODE_TRIANGLE_STRIP)
    {
        for (std::size_t i = 2; i < indices.size(); ++i)
        {
            const bool odd = (i % 2U) == 1U;
            triangles.push_back(odd ? std::array<std::uint32_t, 3>{indices[i - 1], indices[i - 2], indices[i]}
                                    : std::array<std::uint32_t, 3>{indices[i - 2], indices[i - 1], indices[i]});
        }
    }
    else
    {
        for (std::size_t i = 2; i < indices.size(); ++i)
        {
            triangles.push_back({indices[0], indices[i - 1], indices[i]});
        }
    }
    return triangles;
}
} // namespace

bool ImportGltf(const std::filesystem::path& absolutePath, ModelData* outModel, std::string* outError)
{
    if (outModel == nullptr)
    {
        return false;
    }

    tinygltf::TinyGLTF loader;
    tinygltf::Model model;
    std::string warn;
    std::string err;

    const std::string ext = ToLower(absolutePath.extension().string());
    bool loaded = false;
    if (ext == ".glb")
    {
        loaded = loader.LoadBinaryFromFile(&model, &err, &warn, absolutePath.string());
    }
    else if (ext == ".gltf")
    {
        loaded = loader.LoadASCIIFromFile(&model, &err, &warn, absolutePath.string());
    }
    else
    {
        SetError(outError, "Model format not supported (supported: .gltf, .glb): " + absolutePath.generic_string());
        return false;
    }

    if (!loaded)
    {
        std::string message = "Failed to load glTF: " + absolutePath.generic_string();
        if (!err.empty())
        {
            message += " | " + err;
        }
        SetError(outError, message);
        return false;
    }

    std::vector<std::vector<glm::mat4>> meshInstances(model.meshes.size());
    if (!model.scenes.empty())
    {
        const int sceneIndex = (model.defaultScene >= 0 && model.defaultScene < static_cast<int>(model.scenes.size()))
                                   ? model.defaultScene
                                   : 0;
        for (int rootNode : model.scenes[static_cast<std::size_t>(sceneIndex)].nodes)
        {
            CollectNodeInstances(model, rootNode, glm::mat4{1.0F}, 0, &meshInstances);
        }
    }
    for (std::vector<glm::mat4>& instances : meshInstances)
    {
        if (instances.empty())
        {
            instances.emplace_back(1.0F);
        }
    }

    ModelData result;
    for (std::size_t meshIndex = 0; meshIndex < model.meshes.size(); ++meshIndex)
    {
        const tinygltf::Mesh& mesh = model.meshes[meshIndex];
        for (const tinygltf::Primitive& primitive : mesh.primitives)
        {
            const int mode = primitive.mode == -1 ? TINYGLTF_MODE_TRIANGLES : primitive.mode;
            if (mode != TINYGLTF_MODE_TRIANGLES && mode != TINYGLTF_MODE_TRIANGLE_STRIP && mode != TINYGLTF_MODE_TRIANGLE_FAN)
            {
                continue;
            }

            const auto posIt = primitive.attributes.find("POSITION");
            if (posIt == primitive.attributes.end())
            {
                continue;
            }
            std::vector<glm::vec3> positions;
            std::string readError;
            if (!ReadVec3(model, posIt->second, &positions, &readError))
            {
                SetError(outError, "Failed to read POSITION accessor: " + readError);
                return false;
            }
            if (positions.empty())
            {
                continue;
            }

            std::vector<glm::vec3> normals;
            const auto normalIt = primitive.attributes.find("NORMAL");
            // Unreadable normals are regenerated from the triangles below.
            if (normalIt != primitive.attributes.end() && !ReadVec3(model, normalIt->second, &normals, nullptr))
            {
                normals.clear();
            }

            glm::vec4 baseColorFactor{1.0F};
            if (primitive.material >= 0 && primitive.material < static_cast<int>(model.materials.size()))
            {
                const auto& pbr = model.materials[static_cast<std::size_t>(primitive.material)].pbrMetallicRoughness;
                if (pbr.baseColorFactor.size() == 4U)
                {
                    baseColorFactor = glm::vec4{
                        static_cast<float>(pbr.baseColorFactor[0]),
                        static_cast<float>(pbr.baseColorFactor[1]),
                        static_cast<float>(pbr.baseColorFactor[2]),
                        static_cast<float>(pbr.baseColorFactor[3]),
                    };
                }
            }

            std::vector<std::uint32_t> primitiveIndices;
            if (primitive.indices >= 0)
            {
                if (!ReadIndices(model, primitive.indices, &primitiveIndices, &readError))
                {
                    SetError(outError, "Failed to read index accessor: " + readError);
                    return false;
                }
            }
            else
            {
                primitiveIndices.resize(positions.size());
                std::iota(primitiveIndices.begin(), primitiveIndices.end(), 0U);
            }
            if (primitiveIndices.size() < 3)
            {
                continue;
            }
            const std::vector<std::array<std::uint32_t, 3>> triangles = Triangulate(mode, primitiveIndices);

            for (const glm::mat4& world : meshInstances[meshIndex])
            {
                const glm::mat3 normalTransform = glm::inverseTranspose(glm::mat3(world));
                const bool flipWinding = glm::determinant(glm::mat3(world)) < 0.0F;

                ModelPart part;
                part.color = glm::vec3(baseColorFactor);
                part.opacity = baseColorFactor.a;
                part.geometry.primitive = scene::PrimitiveType::Triangles;

                for (const auto& tri : triangles)
                {
                    const std::uint32_t ia = tri[0];
                    const std::uint32_t ib = flipWinding ? tri[2] : tri[1];
                    const std::uint32_t ic = flipWinding ? tri[1] : tri[2];
                    if (ia >= positions.size() || ib >= positions.size() || ic >= positions.size())
                    {
                        continue;
                    }
                    for (const std::uint32_t index : {ia, ib, ic})
                    {
                        const glm::vec3 p = glm::vec3(world * glm::vec4(positions[index], 1.0F));
                        glm::vec3 n = index < normals.size() ? normalTransform * normals[index] : glm::vec3{0.0F};
                        n = glm::length(n) > 1.0e-6F ? glm::normalize(n) : glm::vec3{0.0F};
                        part.geometry.positions.push_back(p);
                        part.geometry.normals.push_back(n);
                    }
                }
                if (part.geometry.positions.empty())
                {
                    continue;
                }

                // Fill missing normals from the face.
                for (std::size_t v = 0; v + 2 < part.geometry.positions.size(); v += 3)
                {
                    const glm::vec3& a = part.geometry.positions[v];
                    const glm::vec3 face = glm::cross(part.geometry.positions[v + 1] - a, part.geometry.positions[v + 2] - a);
                    const glm::vec3 faceNormal = glm::length(face) > 1.0e-6F ? glm::normalize(face) : glm::vec3{0.0F, 1.0F, 0.0F};
                    for (std::size_t k = v; k < v + 3; ++k)
                    {
                        if (glm::length(part.geometry.normals[k]) < 0.5F)
                        {
                            part.geometry.normals[k] = faceNormal;
                        }
                    }
                }

                part.geometry.ComputeBounds();
                result.bounds.Expand(part.geometry.bounds);
                result.parts.push_back(std::move(part));
            }
        }
    }

    if (result.parts.empty())
    {
        SetError(outError, "glTF contains no triangle geometry: " + absolutePath.generic_string());
        return false;
    }

    *outModel = std::move(result);
    return true;
}
} // namespace placer::assets
