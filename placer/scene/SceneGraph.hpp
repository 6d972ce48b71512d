#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include "placer/scene/Math.hpp"

namespace placer::scene
{
using NodeHandle = std::uint32_t;
using GeometryId = std::uint32_t;
using MaterialId = std::uint32_t;

constexpr NodeHandle kInvalidNode = 0;
constexpr GeometryId kInvalidGeometry = 0;
constexpr MaterialId kInvalidMaterial = 0;

enum class PrimitiveType
{
    Triangles,
    Lines
};

struct Geometry
{
    PrimitiveType primitive = PrimitiveType::Triangles;
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<std::uint32_t> indices;
    Aabb bounds;

    void ComputeBounds();
    [[nodiscard]] std::size_t TriangleCount() const;
    [[nodiscard]] bool Triangle(std::size_t index, glm::vec3* a, glm::vec3* b, glm::vec3* c) const;
};

struct Material
{
    glm::vec3 color{1.0F};
    float opacity = 1.0F;
    bool unlit = false;
    bool wireframe = false;
    bool transparent = false;
};

enum class NodeKind
{
    Group,
    Mesh,
    Lod
};

struct NodeTransform
{
    glm::vec3 position{0.0F};
    glm::vec3 rotation{0.0F};
    glm::vec3 scale{1.0F};
};

struct LodLevel
{
    NodeHandle node = kInvalidNode;
    float distance = 0.0F;
};

struct Node
{
    NodeKind kind = NodeKind::Group;
    std::string name;
    NodeTransform transform;
    NodeHandle parent = kInvalidNode;
    std::vector<NodeHandle> children;
    GeometryId geometry = kInvalidGeometry;
    MaterialId material = kInvalidMaterial;
    std::vector<LodLevel> lodLevels;
    bool visible = true;
    bool pickable = true;
};

struct RaycastHit
{
    NodeHandle target = kInvalidNode;
    NodeHandle mesh = kInvalidNode;
    glm::vec3 point{0.0F};
    float distance = 0.0F;
};

// Arena-backed scene graph. Geometries and materials are reference counted by the meshes that use
// them and released when the last mesh is destroyed.
class SceneGraph
{
public:
    SceneGraph();

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    [[nodiscard]] NodeHandle Root() const { return m_root; }

    NodeHandle CreateGroup(const std::string& name);
    NodeHandle CreateLod(const std::string& name);
    NodeHandle CreateMesh(GeometryId geometry, MaterialId material, const std::string& name);

    GeometryId CreateGeometry(Geometry geometry);
    MaterialId CreateMaterial(const Material& material);

    bool AddChild(NodeHandle parent, NodeHandle child);
    void Detach(NodeHandle node);
    bool AddLodLevel(NodeHandle lod, NodeHandle levelNode, float distance);

    // Removes the node and its subtree, releasing every geometry and material it referenced.
    void Destroy(NodeHandle node);

    [[nodiscard]] bool Contains(NodeHandle node) const;
    [[nodiscard]] Node* Find(NodeHandle node);
    [[nodiscard]] const Node* Find(NodeHandle node) const;

    [[nodiscard]] const Geometry* FindGeometry(GeometryId id) const;
    [[nodiscard]] const Material* FindMaterial(MaterialId id) const;
    [[nodiscard]] bool HasGeometry(GeometryId id) const { return m_geometries.count(id) != 0; }

    bool SetTransform(NodeHandle node, const NodeTransform& transform);
    [[nodiscard]] NodeTransform Transform(NodeHandle node) const;
    void SetVisible(NodeHandle node, bool visible);

    [[nodiscard]] glm::mat4 LocalMatrix(NodeHandle node) const;
    [[nodiscard]] glm::mat4 WorldMatrix(NodeHandle node) const;
    [[nodiscard]] glm::vec3 WorldPosition(NodeHandle node) const;

    // World bounds of every mesh below the node. LOD wrappers contribute only their most detailed level.
    [[nodiscard]] Aabb WorldBounds(NodeHandle node) const;
    // Bounds the node would have if its own local transform were replaced by the candidate.
    [[nodiscard]] Aabb WorldBoundsWithTransform(NodeHandle node, const NodeTransform& candidate) const;

    // Nearest triangle hit among the subtrees of the given targets; the hit reports which target owns it.
    [[nodiscard]] std::optional<RaycastHit> Raycast(const Ray& ray, const std::vector<NodeHandle>& targets) const;

    void UpdateLods(const glm::vec3& cameraPosition);

    using MeshVisitor = std::function<void(NodeHandle, const glm::mat4&, const Geometry&, const Material&)>;
    void ForEachVisibleMesh(const MeshVisitor& visitor) const;

    [[nodiscard]] std::size_t NodeCount() const { return m_nodes.size(); }
    [[nodiscard]] std::size_t LiveGeometryCount() const { return m_geometries.size(); }
    [[nodiscard]] std::size_t LiveMaterialCount() const { return m_materials.size(); }

private:
    struct GeometrySlot
    {
        Geometry geometry;
        std::size_t refCount = 0;
    };
    struct MaterialSlot
    {
        Material material;
        std::size_t refCount = 0;
    };

    NodeHandle Allocate(Node node);
    void AcquireGeometry(GeometryId id);
    void AcquireMaterial(MaterialId id);
    void ReleaseGeometry(GeometryId id);
    void ReleaseMaterial(MaterialId id);
    void DestroyRecursive(NodeHandle node);

    void AccumulateBounds(NodeHandle node, const glm::mat4& parentWorld, Aabb* bounds) const;
    void RaycastRecursive(NodeHandle node, const glm::mat4& parentWorld, const Ray& ray, NodeHandle target, std::optional<RaycastHit>* best) const;
    void VisitRecursive(NodeHandle node, const glm::mat4& parentWorld, const MeshVisitor& visitor) const;

    std::unordered_map<NodeHandle, Node> m_nodes;
    std::unordered_map<GeometryId, GeometrySlot> m_geometries;
    std::unordered_map<MaterialId, MaterialSlot> m_materials;
    // Handles and ids are never reused, so a stale handle can only miss.
    NodeHandle m_nextNode = 1;
    GeometryId m_nextGeometry = 1;
    MaterialId m_nextMaterial = 1;
    NodeHandle m_root = kInvalidNode;
};
} // namespace placer::scene
