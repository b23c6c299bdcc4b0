#pragma once

#include <vellum/atlas-image.h>
#include <vellum/camera.h>
#include <vellum/frame-snapshot.h>
#include <vellum/result.hpp>
#include <vellum/scene-bridge.h>
#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace vellum {

//-----------------------------------------------------------------------------
// BlockFont - 5x7 block letters baked into a coverage atlas
//
// Stand-in for a shaped font so the glyph pipeline has real atlas regions to
// sample. Covers the capitals and digits used by the demo labels.
//-----------------------------------------------------------------------------
class BlockFont {
public:
    static Result<BlockFont> create(uint32_t atlasSize);

    const AtlasImage& atlas() const { return _atlas; }

    bool hasGlyph(char c) const;

    // Advance of one glyph cell at the given cell height
    static float advance(float height);

    // Appends one instance per glyph; unknown characters only advance
    void layout(std::string_view text, glm::vec2 origin, float height,
                glm::vec4 color, std::vector<GlyphInstance>& out) const;

private:
    BlockFont() = default;

    AtlasImage _atlas;
    // uv_min in xy, uv_max in zw
    std::array<std::optional<glm::vec4>, 128> _regions{};
};

//-----------------------------------------------------------------------------
// DemoScene - canvas content for the desktop shell and headless export
//
// Twelve laid-out cards, a title and labels, and simulated collaborator
// cursors that move along closed curves.
//-----------------------------------------------------------------------------
class DemoScene {
public:
    struct Peer {
        uint64_t id;
        glm::vec2 center;
        glm::vec2 radius;
        float speed;
        float phase;
    };

    static Result<DemoScene> create(uint32_t atlasSize, uint32_t peerCount);

    const std::vector<SceneNode>& nodes() const { return _nodes; }
    const std::vector<Peer>& peers() const { return _peers; }
    const BlockFont& font() const { return _font; }

    Interaction& interaction() { return _interaction; }
    const Interaction& interaction() const { return _interaction; }

    // Hover / select whatever is under the world point
    bool updateHover(glm::vec2 world);
    bool selectAt(glm::vec2 world);

    glm::vec2 peerPosition(const Peer& peer, double time) const;

    // Full frame for the camera at `time` seconds
    FrameSnapshot::Ptr snapshot(const Camera& camera, double time, uint64_t frameId) const;

private:
    explicit DemoScene(BlockFont font) : _font(std::move(font)) {}

    std::vector<SceneNode> _nodes;
    std::vector<Peer> _peers;
    BlockFont _font;
    Interaction _interaction;
};

} // namespace vellum
