#pragma once

#include "core/load_error.h"
#include "math/math.h"
#include "vox/vox_records.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Scene Graph subsystem
// Responsible for: keying node/model/layer records by id, checking references, and
// resolving the arena into a named tree with Y-up local transforms.
// Should NOT do: touch voxel payloads or materials.
namespace voxscene::scene {

// Scene trees nested deeper than this fail to resolve with LoadErrorKind::Parse.
inline constexpr std::size_t kMaxSceneDepth = 1024;

struct LayerInfo {
    std::int32_t id = 0;
    std::optional<std::string> name;
    bool hidden = false;
};

// Flat arena keyed by the ids issued in the file.
struct SceneGraph {
    std::vector<std::int32_t> rootNodeIds;
    std::map<std::int32_t, vox::SceneNodeRecord> nodes;
    std::map<std::int32_t, vox::RawModel> models;
    std::map<std::int32_t, LayerInfo> layers;
};

struct VoxelNode {
    // Id of the record the node was resolved from; -1 for a synthetic wrapper.
    std::int32_t nodeId = -1;
    // Slash-separated path through named ancestors, e.g. "workstation/desk".
    std::optional<std::string> name;
    math::Matrix4 transform{};
    bool hidden = false;
    std::int32_t layerId = -1;
    std::optional<std::int32_t> modelId;
    // Every model the shape references, ordered by frame index.
    std::vector<vox::ShapeModelRef> animationFrames;
    std::vector<VoxelNode> children;
};

// Consumes the node, model and layer records. Materials and palette are left untouched.
bool buildSceneGraph(vox::VoxRecords&& records, SceneGraph& outGraph, core::LoadError* outError = nullptr);

bool resolveSceneTree(const SceneGraph& graph, VoxelNode& outRoot, core::LoadError* outError = nullptr);

// Converts a MagicaVoxel frame (Z-up, left-handed) to a Y-up right-handed local transform.
math::Matrix4 transformFromFrame(const vox::TransformFrame& frame);

// Depth-first, first match wins.
[[nodiscard]] const VoxelNode* findNodeByName(const VoxelNode& root, std::string_view name);

[[nodiscard]] bool isNodeVisible(const VoxelNode& node, const std::map<std::int32_t, LayerInfo>& layers);

} // namespace voxscene::scene
