#include <vellum/scene-bridge.h>
#include <algorithm>

namespace vellum {

namespace {

const glm::vec4 kRectColor{0.26f, 0.52f, 0.96f, 1.0f};
const glm::vec4 kEllipseColor{0.96f, 0.26f, 0.42f, 1.0f};
const glm::vec4 kTextColor{0.96f, 0.78f, 0.26f, 1.0f};
const glm::vec4 kFrameColor{0.22f, 0.22f, 0.24f, 0.8f};

const glm::vec4 kHoverColor{1.0f, 1.0f, 1.0f, 0.08f};
const glm::vec4 kSelectionColor{0.26f, 0.52f, 0.96f, 0.3f};
const glm::vec4 kSelectionBorderColor{0.26f, 0.52f, 0.96f, 1.0f};

RectInstance makeRect(float x, float y, float w, float h, glm::vec4 color, float z) {
    RectInstance r;
    r.position = {x, y};
    r.size = {w, h};
    r.color = color;
    r.zIndex = z;
    return r;
}

const SceneNode* findNode(const std::vector<SceneNode>& nodes, uint64_t id) {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [id](const SceneNode& n) { return n.id == id; });
    return it == nodes.end() ? nullptr : &*it;
}

} // namespace

glm::vec4 defaultColorFor(NodeKind kind) {
    switch (kind) {
        case NodeKind::Rect:    return kRectColor;
        case NodeKind::Ellipse: return kEllipseColor;
        case NodeKind::Text:    return kTextColor;
        case NodeKind::Frame:   return kFrameColor;
    }
    return kRectColor;
}

void collectRects(const std::vector<SceneNode>& nodes, std::vector<RectInstance>& out) {
    out.reserve(out.size() + nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        const SceneNode& n = nodes[i];
        RectInstance r = makeRect(n.bounds.x, n.bounds.y, n.bounds.width, n.bounds.height,
                                  n.color.value_or(defaultColorFor(n.kind)),
                                  static_cast<float>(i));
        // Ellipses render as full pills until there is an ellipse pipeline
        r.borderRadius = n.kind == NodeKind::Ellipse
            ? std::max(n.bounds.width, n.bounds.height)
            : n.radius;
        out.push_back(r);
    }
}

std::vector<RectInstance> collectDirect(const std::vector<std::pair<Bounds, glm::vec4>>& rects) {
    std::vector<RectInstance> out;
    out.reserve(rects.size());
    for (size_t i = 0; i < rects.size(); ++i) {
        const auto& [b, color] = rects[i];
        out.push_back(makeRect(b.x, b.y, b.width, b.height, color, static_cast<float>(i)));
    }
    return out;
}

void appendOverlays(const std::vector<SceneNode>& nodes, const Interaction& interaction,
                    std::vector<RectInstance>& out) {
    if (interaction.hovered && interaction.hovered != interaction.selected) {
        if (const SceneNode* n = findNode(nodes, *interaction.hovered)) {
            const Bounds& b = n->bounds;
            out.push_back(makeRect(b.x, b.y, b.width, b.height, kHoverColor, kHoverZ));
        }
    }

    if (!interaction.selected) return;
    const SceneNode* n = findNode(nodes, *interaction.selected);
    if (!n) return;

    const float x = n->bounds.x;
    const float y = n->bounds.y;
    const float w = n->bounds.width;
    const float h = n->bounds.height;
    const float bw = kSelectionBorderWidth;

    out.push_back(makeRect(x, y, w, h, kSelectionColor, kSelectionZ));
    // top, bottom, left, right
    out.push_back(makeRect(x - bw, y - bw, w + 2.0f * bw, bw, kSelectionBorderColor, kSelectionBorderZ));
    out.push_back(makeRect(x - bw, y + h, w + 2.0f * bw, bw, kSelectionBorderColor, kSelectionBorderZ));
    out.push_back(makeRect(x - bw, y, bw, h, kSelectionBorderColor, kSelectionBorderZ));
    out.push_back(makeRect(x + w, y, bw, h, kSelectionBorderColor, kSelectionBorderZ));
}

std::optional<uint64_t> hitTest(const std::vector<SceneNode>& nodes, glm::vec2 world) {
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        if (it->bounds.contains(world)) return it->id;
    }
    return std::nullopt;
}

} // namespace vellum
