#pragma once

#include <vellum/instances.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace vellum {

//=============================================================================
// Scene bridge
//
// Turns already laid-out scene nodes into rect instances. Node order is
// paint order: the node at index i gets z_index i, so later nodes draw on
// top and win hit tests.
//=============================================================================

enum class NodeKind : uint8_t {
    Rect,
    Ellipse,
    Text,
    Frame,
};

struct Bounds {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    bool contains(glm::vec2 p) const {
        return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
    }
};

struct SceneNode {
    uint64_t id = 0;
    NodeKind kind = NodeKind::Rect;
    Bounds bounds;
    std::optional<glm::vec4> color;  // unset: per-kind default
    float radius = 0.0f;
};

struct Interaction {
    std::optional<uint64_t> hovered;
    std::optional<uint64_t> selected;
};

// Overlay layer constants
inline constexpr float kHoverZ = 100.0f;
inline constexpr float kSelectionZ = 101.0f;
inline constexpr float kSelectionBorderZ = 102.0f;
inline constexpr float kSelectionBorderWidth = 2.0f;

glm::vec4 defaultColorFor(NodeKind kind);

// Appends one rect per node, z = index in `nodes`
void collectRects(const std::vector<SceneNode>& nodes, std::vector<RectInstance>& out);

// Raw (bounds, color) pairs, z = index
std::vector<RectInstance> collectDirect(const std::vector<std::pair<Bounds, glm::vec4>>& rects);

// Hover tint (skipped when hovering the selection), selection fill and a
// four-sided border drawn outside the selected bounds
void appendOverlays(const std::vector<SceneNode>& nodes, const Interaction& interaction,
                    std::vector<RectInstance>& out);

// Topmost node containing the world point
std::optional<uint64_t> hitTest(const std::vector<SceneNode>& nodes, glm::vec2 world);

} // namespace vellum
