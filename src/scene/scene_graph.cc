#include "scene/scene_graph.h"

#include "core/log.h"

#include <algorithm>
#include <cstddef>
#include <set>
#include <string>
#include <utility>

namespace voxscene::scene {

namespace {

// Maps MagicaVoxel (x, y, z) to (-x, z, y).
constexpr int kBasisChange[3][3] = {
    {-1, 0, 0},
    {0, 0, 1},
    {0, 1, 0},
};

bool parseHiddenFlag(const vox::VoxDict& attributes, std::int32_t ownerId) {
    const std::string* value = vox::findDictValue(attributes, "_hidden");
    if (value == nullptr || *value == "0") {
        return false;
    }
    if (*value == "1") {
        return true;
    }
    VOXSCENE_LOGW("scene") << "invalid _hidden value '" << *value << "' on id " << ownerId;
    return false;
}

std::optional<std::string> parseName(const vox::VoxDict& attributes) {
    const std::string* value = vox::findDictValue(attributes, "_name");
    if (value == nullptr || value->empty()) {
        return std::nullopt;
    }
    return *value;
}

// Mirrors the layout MagicaVoxel itself writes: root transform -> group -> transform/shape per model.
void synthesizeDefaultNodes(SceneGraph& graph) {
    std::int32_t nextId = 0;
    vox::SceneNodeRecord root{};
    root.id = nextId++;
    root.kind = vox::SceneNodeKind::Transform;
    root.frames.push_back(vox::TransformFrame{});

    vox::SceneNodeRecord group{};
    group.id = nextId++;
    group.kind = vox::SceneNodeKind::Group;
    root.childId = group.id;

    std::vector<vox::SceneNodeRecord> created;
    for (const auto& [modelId, model] : graph.models) {
        (void)model;
        vox::SceneNodeRecord transform{};
        transform.id = nextId++;
        transform.kind = vox::SceneNodeKind::Transform;
        transform.frames.push_back(vox::TransformFrame{});

        vox::SceneNodeRecord shape{};
        shape.id = nextId++;
        shape.kind = vox::SceneNodeKind::Shape;
        shape.models.push_back(vox::ShapeModelRef{modelId, 0});

        transform.childId = shape.id;
        group.childIds.push_back(transform.id);
        created.push_back(std::move(transform));
        created.push_back(std::move(shape));
    }
    created.push_back(std::move(root));
    created.push_back(std::move(group));

    for (vox::SceneNodeRecord& node : created) {
        const std::int32_t id = node.id;
        graph.nodes.emplace(id, std::move(node));
    }
}

bool danglingReference(core::LoadError* outError, std::int32_t ownerId, const char* what, std::int32_t missingId) {
    return core::failLoad(
        outError,
        core::LoadErrorKind::DanglingReference,
        "node " + std::to_string(ownerId) + " references missing " + what + " " + std::to_string(missingId));
}

class TreeResolver {
public:
    TreeResolver(const SceneGraph& graph, core::LoadError* outError) : m_graph(graph), m_outError(outError) {}

    bool resolveNode(
        std::int32_t id,
        const std::optional<std::string>& parentPath,
        std::size_t depth,
        VoxelNode& outNode
    ) {
        const vox::SceneNodeRecord* record = visit(id);
        if (record == nullptr) {
            return false;
        }
        return resolveRecord(*record, parentPath, depth, outNode);
    }

private:
    bool resolveRecord(
        const vox::SceneNodeRecord& record,
        const std::optional<std::string>& parentPath,
        std::size_t depth,
        VoxelNode& outNode
    ) {
        outNode.nodeId = record.id;
        if (depth >= kMaxSceneDepth) {
            return core::failLoad(
                m_outError,
                core::LoadErrorKind::Parse,
                "scene nesting deeper than " + std::to_string(kMaxSceneDepth) + " at node " + std::to_string(record.id));
        }
        if (record.kind != vox::SceneNodeKind::Transform) {
            VOXSCENE_LOGW("scene") << "node " << record.id << " is a group or shape without a parent transform";
            return resolveChild(record, outNode, parentPath, depth);
        }

        std::optional<std::string> accumulated = parentPath;
        if (const std::optional<std::string> ownName = parseName(record.attributes)) {
            accumulated = parentPath ? (*parentPath + "/" + *ownName) : *ownName;
            outNode.name = accumulated;
        }
        if (!record.frames.empty()) {
            outNode.transform = transformFromFrame(record.frames.front());
        }
        outNode.hidden = parseHiddenFlag(record.attributes, record.id);
        outNode.layerId = record.layerId;

        const vox::SceneNodeRecord* child = visit(record.childId);
        if (child == nullptr) {
            return false;
        }
        return resolveChild(*child, outNode, accumulated, depth);
    }

    // Every record may be entered once; a second visit means a cycle or a shared child.
    const vox::SceneNodeRecord* visit(std::int32_t id) {
        const auto found = m_graph.nodes.find(id);
        if (found == m_graph.nodes.end()) {
            danglingReference(m_outError, id, "node", id);
            return nullptr;
        }
        if (!m_visited.insert(id).second) {
            core::failLoad(m_outError, core::LoadErrorKind::Parse, "node " + std::to_string(id) + " reached twice");
            return nullptr;
        }
        return &found->second;
    }

    bool resolveChild(
        const vox::SceneNodeRecord& record,
        VoxelNode& partialNode,
        const std::optional<std::string>& path,
        std::size_t depth
    ) {
        switch (record.kind) {
        case vox::SceneNodeKind::Transform: {
            VOXSCENE_LOGW("scene") << "nested transform node " << record.id;
            VoxelNode nested{};
            if (!resolveRecord(record, path, depth + 1u, nested)) {
                return false;
            }
            partialNode.children.push_back(std::move(nested));
            return true;
        }
        case vox::SceneNodeKind::Group:
            partialNode.children.reserve(record.childIds.size());
            for (const std::int32_t childId : record.childIds) {
                VoxelNode child{};
                if (!resolveNode(childId, path, depth + 1u, child)) {
                    return false;
                }
                partialNode.children.push_back(std::move(child));
            }
            return true;
        case vox::SceneNodeKind::Shape:
        default:
            partialNode.animationFrames = record.models;
            std::stable_sort(
                partialNode.animationFrames.begin(),
                partialNode.animationFrames.end(),
                [](const vox::ShapeModelRef& lhs, const vox::ShapeModelRef& rhs) {
                    return lhs.frameIndex < rhs.frameIndex;
                });
            partialNode.modelId = record.models.front().modelId;
            return true;
        }
    }

    const SceneGraph& m_graph;
    core::LoadError* m_outError;
    std::set<std::int32_t> m_visited;
};

} // namespace

bool buildSceneGraph(vox::VoxRecords&& records, SceneGraph& outGraph, core::LoadError* outError) {
    outGraph = SceneGraph{};
    SceneGraph graph{};

    for (std::size_t index = 0; index < records.models.size(); ++index) {
        graph.models.emplace(static_cast<std::int32_t>(index), std::move(records.models[index]));
    }

    for (vox::SceneNodeRecord& node : records.nodes) {
        const std::int32_t id = node.id;
        if (!graph.nodes.emplace(id, std::move(node)).second) {
            return core::failLoad(outError, core::LoadErrorKind::Parse, "duplicate node id " + std::to_string(id));
        }
    }

    for (const vox::LayerRecord& layer : records.layers) {
        LayerInfo info{};
        info.id = layer.id;
        info.name = parseName(layer.attributes);
        info.hidden = parseHiddenFlag(layer.attributes, layer.id);
        if (!graph.layers.emplace(layer.id, std::move(info)).second) {
            return core::failLoad(outError, core::LoadErrorKind::Parse, "duplicate layer id " + std::to_string(layer.id));
        }
    }

    if (graph.nodes.empty()) {
        VOXSCENE_LOGD("scene") << "no scene nodes, placing " << graph.models.size() << " models at the origin";
        synthesizeDefaultNodes(graph);
    }

    // References are checked only after every id is known; forward references are legal.
    std::set<std::int32_t> referenced;
    for (const auto& [id, node] : graph.nodes) {
        switch (node.kind) {
        case vox::SceneNodeKind::Transform:
            if (graph.nodes.find(node.childId) == graph.nodes.end()) {
                return danglingReference(outError, id, "child node", node.childId);
            }
            referenced.insert(node.childId);
            if (node.layerId >= 0 && graph.layers.find(node.layerId) == graph.layers.end()) {
                VOXSCENE_LOGD("scene") << "node " << id << " uses undeclared layer " << node.layerId;
            }
            break;
        case vox::SceneNodeKind::Group:
            for (const std::int32_t childId : node.childIds) {
                if (graph.nodes.find(childId) == graph.nodes.end()) {
                    return danglingReference(outError, id, "child node", childId);
                }
                referenced.insert(childId);
            }
            break;
        case vox::SceneNodeKind::Shape:
            if (node.models.empty()) {
                return core::failLoad(
                    outError, core::LoadErrorKind::Parse, "shape node " + std::to_string(id) + " has no models");
            }
            for (const vox::ShapeModelRef& model : node.models) {
                if (graph.models.find(model.modelId) == graph.models.end()) {
                    return danglingReference(outError, id, "model", model.modelId);
                }
            }
            break;
        }
    }

    for (const auto& [id, node] : graph.nodes) {
        (void)node;
        if (referenced.find(id) == referenced.end()) {
            graph.rootNodeIds.push_back(id);
        }
    }
    if (graph.rootNodeIds.empty()) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "scene graph has no root node");
    }

    outGraph = std::move(graph);
    return true;
}

bool resolveSceneTree(const SceneGraph& graph, VoxelNode& outRoot, core::LoadError* outError) {
    outRoot = VoxelNode{};
    TreeResolver resolver(graph, outError);

    if (graph.rootNodeIds.size() == 1u) {
        VoxelNode root{};
        if (!resolver.resolveNode(graph.rootNodeIds.front(), std::nullopt, 0u, root)) {
            return false;
        }
        outRoot = std::move(root);
        return true;
    }

    VoxelNode wrapper{};
    for (const std::int32_t rootId : graph.rootNodeIds) {
        VoxelNode child{};
        if (!resolver.resolveNode(rootId, std::nullopt, 0u, child)) {
            return false;
        }
        wrapper.children.push_back(std::move(child));
    }
    outRoot = std::move(wrapper);
    return true;
}

math::Matrix4 transformFromFrame(const vox::TransformFrame& frame) {
    int rotation[3][3]{};
    if (!vox::decodeRotation(frame.rotation, rotation)) {
        vox::decodeRotation(vox::kIdentityRotation, rotation);
    }

    // R' = C * R * C^T, where C is symmetric and its own inverse.
    float converted[3][3]{};
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            int sum = 0;
            for (int a = 0; a < 3; ++a) {
                for (int b = 0; b < 3; ++b) {
                    sum += kBasisChange[row][a] * rotation[a][b] * kBasisChange[col][b];
                }
            }
            converted[row][col] = static_cast<float>(sum);
        }
    }

    const math::Vector3 translation{
        static_cast<float>(-frame.translation[0]),
        static_cast<float>(frame.translation[2]),
        static_cast<float>(frame.translation[1])
    };
    return math::Matrix4::fromRotationTranslation(converted, translation);
}

const VoxelNode* findNodeByName(const VoxelNode& root, std::string_view name) {
    if (root.name && *root.name == name) {
        return &root;
    }
    for (const VoxelNode& child : root.children) {
        if (const VoxelNode* found = findNodeByName(child, name)) {
            return found;
        }
    }
    return nullptr;
}

bool isNodeVisible(const VoxelNode& node, const std::map<std::int32_t, LayerInfo>& layers) {
    if (node.hidden) {
        return false;
    }
    const auto layer = layers.find(node.layerId);
    return layer == layers.end() || !layer->second.hidden;
}

} // namespace voxscene::scene
