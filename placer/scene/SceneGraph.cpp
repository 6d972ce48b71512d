#include "placer/scene/SceneGraph.hpp"

#include <algorithm>
#include <iostream>

#include <glm/geometric.hpp>

namespace placer::scene
{
namespace
{
bool IsSecondaryLodLevel(const Node& parent, NodeHandle child)
{
    if (parent.kind != NodeKind::Lod)
    {
        return false;
    }
    for (std::size_t i = 1; i < parent.lodLevels.size(); ++i)
    {
        if (parent.lodLevels[i].node == child)
        {
            return true;
        }
    }
    return false;
}
} // namespace

void Geometry::ComputeBounds()
{
    bounds = Aabb{};
    for (const glm::vec3& p : positions)
    {
        bounds.Expand(p);
    }
}

std::size_t Geometry::TriangleCount() const
{
    if (primitive != PrimitiveType::Triangles)
    {
        return 0;
    }
    return indices.empty() ? positions.size() / 3 : indices.size() / 3;
}

bool Geometry::Triangle(std::size_t index, glm::vec3* a, glm::vec3* b, glm::vec3* c) const
{
    std::size_t ia = index * 3;
    std::size_t ib = ia + 1;
    std::size_t ic = ia + 2;
    if (!indices.empty())
    {
        if (ic >= indices.size())
        {
            return false;
        }
        ia = indices[ia];
        ib = indices[ib];
        ic = indices[ic];
    }
    if (ia >= positions.size() || ib >= positions.size() || ic >= positions.size())
    {
        return false;
    }
    *a = positions[ia];
    *b = positions[ib];
    *c = positions[ic];
    return true;
}

SceneGraph::SceneGraph()
{
    m_root = CreateGroup("root");
}

NodeHandle SceneGraph::Allocate(Node node)
{
    const NodeHandle handle = m_nextNode++;
    m_nodes.emplace(handle, std::move(node));
    return handle;
}

NodeHandle SceneGraph::CreateGroup(const std::string& name)
{
    Node node;
    node.kind = NodeKind::Group;
    node.name = name;
    return Allocate(std::move(node));
}

NodeHandle SceneGraph::CreateLod(const std::string& name)
{
    Node node;
    node.kind = NodeKind::Lod;
    node.name = name;
    return Allocate(std::move(node));
}

NodeHandle SceneGraph::CreateMesh(GeometryId geometry, MaterialId material, const std::string& name)
{
    if (!HasGeometry(geometry) || m_materials.count(material) == 0)
    {
        std::cerr << "[SceneGraph] Mesh '" << name << "' references a released geometry or material\n";
        return kInvalidNode;
    }

    Node node;
    node.kind = NodeKind::Mesh;
    node.name = name;
    node.geometry = geometry;
    node.material = material;
    AcquireGeometry(geometry);
    AcquireMaterial(material);
    return Allocate(std::move(node));
}

GeometryId SceneGraph::CreateGeometry(Geometry geometry)
{
    if (!geometry.bounds.IsValid())
    {
        geometry.ComputeBounds();
    }
    const GeometryId id = m_nextGeometry++;
    m_geometries.emplace(id, GeometrySlot{std::move(geometry), 0});
    return id;
}

MaterialId SceneGraph::CreateMaterial(const Material& material)
{
    const MaterialId id = m_nextMaterial++;
    m_materials.emplace(id, MaterialSlot{material, 0});
    return id;
}

void SceneGraph::AcquireGeometry(GeometryId id)
{
    const auto it = m_geometries.find(id);
    if (it != m_geometries.end())
    {
        ++it->second.refCount;
    }
}

void SceneGraph::AcquireMaterial(MaterialId id)
{
    const auto it = m_materials.find(id);
    if (it != m_materials.end())
    {
        ++it->second.refCount;
    }
}

void SceneGraph::ReleaseGeometry(GeometryId id)
{
    const auto it = m_geometries.find(id);
    if (it == m_geometries.end())
    {
        return;
    }
    if (it->second.refCount <= 1)
    {
        m_geometries.erase(it);
        return;
    }
    --it->second.refCount;
}

void SceneGraph::ReleaseMaterial(MaterialId id)
{
    const auto it = m_materials.find(id);
    if (it == m_materials.end())
    {
        return;
    }
    if (it->second.refCount <= 1)
    {
        m_materials.erase(it);
        return;
    }
    --it->second.refCount;
}

bool SceneGraph::AddChild(NodeHandle parent, NodeHandle child)
{
    if (parent == child || !Contains(parent) || !Contains(child) || child == m_root)
    {
        return false;
    }
    Detach(child);
    m_nodes[parent].children.push_back(child);
    m_nodes[child].parent = parent;
    return true;
}

void SceneGraph::Detach(NodeHandle node)
{
    Node* self = Find(node);
    if (self == nullptr || self->parent == kInvalidNode)
    {
        return;
    }
    Node* parent = Find(self->parent);
    if (parent != nullptr)
    {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
        auto& levels = parent->lodLevels;
        levels.erase(
            std::remove_if(levels.begin(), levels.end(), [node](const LodLevel& level) { return level.node == node; }),
            levels.end());
    }
    self->parent = kInvalidNode;
}

bool SceneGraph::AddLodLevel(NodeHandle lod, NodeHandle levelNode, float distance)
{
    Node* wrapper = Find(lod);
    if (wrapper == nullptr || wrapper->kind != NodeKind::Lod || !AddChild(lod, levelNode))
    {
        return false;
    }
    wrapper = Find(lod);
    auto& levels = wrapper->lodLevels;
    const auto insertAt = std::find_if(levels.begin(), levels.end(), [distance](const LodLevel& level) {
        return level.distance > distance;
    });
    levels.insert(insertAt, LodLevel{levelNode, distance});
    // Before the first distance update only the most detailed level shows.
    for (std::size_t i = 0; i < levels.size(); ++i)
    {
        m_nodes[levels[i].node].visible = (i == 0);
    }
    return true;
}

void SceneGraph::Destroy(NodeHandle node)
{
    if (node == m_root || !Contains(node))
    {
        return;
    }
    Detach(node);
    DestroyRecursive(node);
}

void SceneGraph::DestroyRecursive(NodeHandle node)
{
    const auto it = m_nodes.find(node);
    if (it == m_nodes.end())
    {
        return;
    }
    const std::vector<NodeHandle> children = it->second.children;
    const GeometryId geometry = it->second.geometry;
    const MaterialId material = it->second.material;
    m_nodes.erase(it);

    for (NodeHandle child : children)
    {
        DestroyRecursive(child);
    }
    if (geometry != kInvalidGeometry)
    {
        ReleaseGeometry(geometry);
    }
    if (material != kInvalidMaterial)
    {
        ReleaseMaterial(material);
    }
}

bool SceneGraph::Contains(NodeHandle node) const
{
    return m_nodes.count(node) != 0;
}

Node* SceneGraph::Find(NodeHandle node)
{
    const auto it = m_nodes.find(node);
    return it == m_nodes.end() ? nullptr : &it->second;
}

const Node* SceneGraph::Find(NodeHandle node) const
{
    const auto it = m_nodes.find(node);
    return it == m_nodes.end() ? nullptr : &it->second;
}

const Geometry* SceneGraph::FindGeometry(GeometryId id) const
{
    const auto it = m_geometries.find(id);
    return it == m_geometries.end() ? nullptr : &it->second.geometry;
}

const Material* SceneGraph::FindMaterial(MaterialId id) const
{
    const auto it = m_materials.find(id);
    return it == m_materials.end() ? nullptr : &it->second.material;
}

bool SceneGraph::SetTransform(NodeHandle node, const NodeTransform& transform)
{
    Node* target = Find(node);
    if (target == nullptr)
    {
        return false;
    }
    target->transform = transform;
    return true;
}

NodeTransform SceneGraph::Transform(NodeHandle node) const
{
    const Node* target = Find(node);
    return target == nullptr ? NodeTransform{} : target->transform;
}

void SceneGraph::SetVisible(NodeHandle node, bool visible)
{
    Node* target = Find(node);
    if (target != nullptr)
    {
        target->visible = visible;
    }
}

glm::mat4 SceneGraph::LocalMatrix(NodeHandle node) const
{
    const Node* target = Find(node);
    if (target == nullptr)
    {
        return glm::mat4{1.0F};
    }
    return ComposeTransform(target->transform.position, target->transform.rotation, target->transform.scale);
}

glm::mat4 SceneGraph::WorldMatrix(NodeHandle node) const
{
    glm::mat4 world{1.0F};
    NodeHandle current = node;
    while (current != kInvalidNode)
    {
        const Node* target = Find(current);
        if (target == nullptr)
        {
            break;
        }
        world = LocalMatrix(current) * world;
        current = target->parent;
    }
    return world;
}

glm::vec3 SceneGraph::WorldPosition(NodeHandle node) const
{
    return glm::vec3(WorldMatrix(node)[3]);
}

Aabb SceneGraph::WorldBounds(NodeHandle node) const
{
    Aabb bounds;
    const Node* target = Find(node);
    if (target == nullptr)
    {
        return bounds;
    }
    const glm::mat4 parentWorld = target->parent != kInvalidNode ? WorldMatrix(target->parent) : glm::mat4{1.0F};
    AccumulateBounds(node, parentWorld, &bounds);
    return bounds;
}

Aabb SceneGraph::WorldBoundsWithTransform(NodeHandle node, const NodeTransform& candidate) const
{
    Aabb bounds;
    const Node* target = Find(node);
    if (target == nullptr)
    {
        return bounds;
    }
    const glm::mat4 parentWorld = target->parent != kInvalidNode ? WorldMatrix(target->parent) : glm::mat4{1.0F};
    const glm::mat4 world = parentWorld * ComposeTransform(candidate.position, candidate.rotation, candidate.scale);

    if (target->kind == NodeKind::Mesh)
    {
        const Geometry* geometry = FindGeometry(target->geometry);
        if (geometry != nullptr)
        {
            bounds.Expand(TransformAabb(geometry->bounds, world));
        }
    }
    for (NodeHandle child : target->children)
    {
        if (!IsSecondaryLodLevel(*target, child))
        {
            AccumulateBounds(child, world, &bounds);
        }
    }
    return bounds;
}

void SceneGraph::AccumulateBounds(NodeHandle node, const glm::mat4& parentWorld, Aabb* bounds) const
{
    const Node* target = Find(node);
    if (target == nullptr)
    {
        return;
    }
    const glm::mat4 world = parentWorld * LocalMatrix(node);
    if (target->kind == NodeKind::Mesh)
    {
        const Geometry* geometry = FindGeometry(target->geometry);
        if (geometry != nullptr)
        {
            bounds->Expand(TransformAabb(geometry->bounds, world));
        }
    }
    for (NodeHandle child : target->children)
    {
        if (!IsSecondaryLodLevel(*target, child))
        {
            AccumulateBounds(child, world, bounds);
        }
    }
}

std::optional<RaycastHit> SceneGraph::Raycast(const Ray& ray, const std::vector<NodeHandle>& targets) const
{
    std::optional<RaycastHit> best;
    for (NodeHandle target : targets)
    {
        const Node* node = Find(target);
        if (node == nullptr)
        {
            continue;
        }
        const glm::mat4 parentWorld = node->parent != kInvalidNode ? WorldMatrix(node->parent) : glm::mat4{1.0F};
        RaycastRecursive(target, parentWorld, ray, target, &best);
    }
    return best;
}

void SceneGraph::RaycastRecursive(NodeHandle node, const glm::mat4& parentWorld, const Ray& ray, NodeHandle target, std::optional<RaycastHit>* best) const
{
    const Node* self = Find(node);
    if (self == nullptr || !self->pickable)
    {
        return;
    }
    const glm::mat4 world = parentWorld * LocalMatrix(node);

    if (self->kind == NodeKind::Mesh)
    {
        const Geometry* geometry = FindGeometry(self->geometry);
        if (geometry != nullptr && geometry->primitive == PrimitiveType::Triangles)
        {
            const Aabb worldBounds = TransformAabb(geometry->bounds, world);
            float boxT = 0.0F;
            const bool boxHit = worldBounds.IsValid() && RayIntersectsAabb(ray, worldBounds.min, worldBounds.max, &boxT);
            if (boxHit && (!best->has_value() || boxT <= (*best)->distance))
            {
                const std::size_t triangles = geometry->TriangleCount();
                for (std::size_t i = 0; i < triangles; ++i)
                {
                    glm::vec3 a{0.0F};
                    glm::vec3 b{0.0F};
                    glm::vec3 c{0.0F};
                    if (!geometry->Triangle(i, &a, &b, &c))
                    {
                        continue;
                    }
                    a = glm::vec3(world * glm::vec4(a, 1.0F));
                    b = glm::vec3(world * glm::vec4(b, 1.0F));
                    c = glm::vec3(world * glm::vec4(c, 1.0F));
                    float t = 0.0F;
                    if (!RayIntersectsTriangle(ray, a, b, c, &t))
                    {
                        continue;
                    }
                    if (!best->has_value() || t < (*best)->distance)
                    {
                        *best = RaycastHit{target, node, ray.origin + ray.direction * t, t};
                    }
                }
            }
        }
    }

    for (NodeHandle child : self->children)
    {
        if (!IsSecondaryLodLevel(*self, child))
        {
            RaycastRecursive(child, world, ray, target, best);
        }
    }
}

void SceneGraph::UpdateLods(const glm::vec3& cameraPosition)
{
    for (auto& [handle, node] : m_nodes)
    {
        if (node.kind != NodeKind::Lod || node.lodLevels.empty())
        {
            continue;
        }
        const float distance = glm::length(cameraPosition - WorldPosition(handle));
        std::size_t active = 0;
        for (std::size_t i = 1; i < node.lodLevels.size(); ++i)
        {
            if (distance >= node.lodLevels[i].distance)
            {
                active = i;
            }
        }
        for (std::size_t i = 0; i < node.lodLevels.size(); ++i)
        {
            const auto levelIt = m_nodes.find(node.lodLevels[i].node);
            if (levelIt != m_nodes.end())
            {
                levelIt->second.visible = (i == active);
            }
        }
    }
}

void SceneGraph::ForEachVisibleMesh(const MeshVisitor& visitor) const
{
    VisitRecursive(m_root, glm::mat4{1.0F}, visitor);
}

void SceneGraph::VisitRecursive(NodeHandle node, const glm::mat4& parentWorld, const MeshVisitor& visitor) const
{
    const Node* self = Find(node);
    if (self == nullptr || !self->visible)
    {
        return;
    }
    const glm::mat4 world = parentWorld * LocalMatrix(node);
    if (self->kind == NodeKind::Mesh)
    {
        const Geometry* geometry = FindGeometry(self->geometry);
        const Material* material = FindMaterial(self->material);
        if (geometry != nullptr && material != nullptr)
        {
            visitor(node, world, *geometry, *material);
        }
    }
    for (NodeHandle child : self->children)
    {
        VisitRecursive(child, world, visitor);
    }
}
} // namespace placer::scene
