#include <vellum/demo-scene.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace vellum {

namespace {

constexpr uint32_t kGlyphCols = 5;
constexpr uint32_t kGlyphRows = 7;
// One blank glyph pixel around every glyph keeps linear filtering from
// bleeding into neighbours
constexpr uint32_t kCellCols = kGlyphCols + 2;
constexpr uint32_t kCellRows = kGlyphRows + 2;

struct BlockGlyph {
    char ch;
    std::array<const char*, kGlyphRows> rows;
};

const BlockGlyph kBlockGlyphs[] = {
    {'A', {"01110", "10001", "10001", "11111", "10001", "10001", "10001"}},
    {'C', {"01110", "10001", "10000", "10000", "10000", "10001", "01110"}},
    {'E', {"11111", "10000", "10000", "11110", "10000", "10000", "11111"}},
    {'L', {"10000", "10000", "10000", "10000", "10000", "10000", "11111"}},
    {'M', {"10001", "11011", "10101", "10101", "10001", "10001", "10001"}},
    {'N', {"10001", "11001", "10101", "10011", "10001", "10001", "10001"}},
    {'R', {"11110", "10001", "10001", "11110", "10100", "10010", "10001"}},
    {'S', {"01111", "10000", "10000", "01110", "00001", "00001", "11110"}},
    {'U', {"10001", "10001", "10001", "10001", "10001", "10001", "01110"}},
    {'V', {"10001", "10001", "10001", "10001", "10001", "01010", "00100"}},
    {'Y', {"10001", "10001", "01010", "00100", "00100", "00100", "00100"}},
    {'1', {"00100", "01100", "00100", "00100", "00100", "00100", "01110"}},
    {'2', {"01110", "10001", "00001", "00010", "00100", "01000", "11111"}},
    {'3', {"11110", "00001", "00001", "01110", "00001", "00001", "11110"}},
    {'4', {"00010", "00110", "01010", "10010", "11111", "00010", "00010"}},
    {'5', {"11111", "10000", "11110", "00001", "00001", "10001", "01110"}},
};

// Laid-out demo canvas: (bounds, color, radius)
struct DemoCard {
    Bounds bounds;
    glm::vec4 color;
    float radius;
};

const DemoCard kDemoCards[] = {
    {{60.0f, 40.0f, 680.0f, 480.0f},  {0.15f, 0.15f, 0.18f, 1.0f}, 8.0f},   // background card
    {{60.0f, 40.0f, 680.0f, 56.0f},   {0.26f, 0.52f, 0.96f, 1.0f}, 0.0f},   // header
    {{60.0f, 96.0f, 200.0f, 424.0f},  {0.18f, 0.18f, 0.22f, 1.0f}, 8.0f},   // sidebar
    {{280.0f, 116.0f, 200.0f, 160.0f}, {0.22f, 0.22f, 0.28f, 1.0f}, 8.0f},
    {{500.0f, 116.0f, 220.0f, 160.0f}, {0.24f, 0.24f, 0.30f, 1.0f}, 8.0f},
    {{280.0f, 296.0f, 440.0f, 100.0f}, {0.20f, 0.20f, 0.26f, 1.0f}, 8.0f},
    {{660.0f, 460.0f, 56.0f, 56.0f},  {0.96f, 0.26f, 0.42f, 1.0f}, 28.0f},  // action button
    {{80.0f, 120.0f, 160.0f, 32.0f},  {0.22f, 0.30f, 0.38f, 1.0f}, 6.0f},   // badges
    {{80.0f, 164.0f, 160.0f, 32.0f},  {0.22f, 0.28f, 0.36f, 1.0f}, 6.0f},
    {{80.0f, 208.0f, 160.0f, 32.0f},  {0.22f, 0.26f, 0.34f, 1.0f}, 6.0f},
    {{80.0f, 252.0f, 160.0f, 32.0f},  {0.22f, 0.24f, 0.32f, 1.0f}, 6.0f},
    {{80.0f, 296.0f, 160.0f, 32.0f},  {0.22f, 0.22f, 0.30f, 1.0f}, 6.0f},
};

constexpr size_t kHeaderIndex = 1;
constexpr size_t kFirstBadgeIndex = 7;

const glm::vec4 kTitleColor{1.0f, 1.0f, 1.0f, 1.0f};
const glm::vec4 kLabelColor{0.88f, 0.90f, 0.95f, 1.0f};

} // namespace

//=============================================================================
// BlockFont
//=============================================================================

Result<BlockFont> BlockFont::create(uint32_t atlasSize) {
    const uint32_t scale = std::max(1u, atlasSize / 64);
    const uint32_t cellW = kCellCols * scale;
    const uint32_t cellH = kCellRows * scale;
    const uint32_t perRow = atlasSize / cellW;
    const uint32_t rows = atlasSize / cellH;
    const uint32_t glyphCount = static_cast<uint32_t>(std::size(kBlockGlyphs));

    if (perRow * rows < glyphCount) {
        return Err<BlockFont>("BlockFont: atlas size " + std::to_string(atlasSize) +
                              " too small for " + std::to_string(glyphCount) + " glyphs");
    }

    std::vector<uint8_t> coverage(static_cast<size_t>(atlasSize) * atlasSize, 0);
    BlockFont font;
    const float inv = 1.0f / static_cast<float>(atlasSize);

    for (uint32_t g = 0; g < glyphCount; ++g) {
        const BlockGlyph& glyph = kBlockGlyphs[g];
        const uint32_t cellX = (g % perRow) * cellW;
        const uint32_t cellY = (g / perRow) * cellH;

        for (uint32_t row = 0; row < kGlyphRows; ++row) {
            for (uint32_t col = 0; col < kGlyphCols; ++col) {
                if (glyph.rows[row][col] != '1') continue;
                const uint32_t px = cellX + (col + 1) * scale;
                const uint32_t py = cellY + (row + 1) * scale;
                for (uint32_t y = 0; y < scale; ++y) {
                    for (uint32_t x = 0; x < scale; ++x) {
                        coverage[static_cast<size_t>(py + y) * atlasSize + px + x] = 255;
                    }
                }
            }
        }

        font._regions[static_cast<unsigned char>(glyph.ch)] = glm::vec4(
            cellX * inv, cellY * inv, (cellX + cellW) * inv, (cellY + cellH) * inv);
    }

    auto atlas = AtlasImage::fromCoverage(atlasSize, atlasSize, std::move(coverage));
    if (!atlas) {
        return Err<BlockFont>("BlockFont: failed to build atlas", atlas);
    }
    font._atlas = std::move(*atlas);

    ydebug("BlockFont: {} glyphs in {}x{} atlas, scale {}", glyphCount, atlasSize, atlasSize, scale);
    return Ok(std::move(font));
}

bool BlockFont::hasGlyph(char c) const {
    auto idx = static_cast<unsigned char>(c);
    return idx < _regions.size() && _regions[idx].has_value();
}

float BlockFont::advance(float height) {
    return height * static_cast<float>(kCellCols) / static_cast<float>(kCellRows);
}

void BlockFont::layout(std::string_view text, glm::vec2 origin, float height,
                       glm::vec4 color, std::vector<GlyphInstance>& out) const {
    const float width = advance(height);
    glm::vec2 pen = origin;
    for (char c : text) {
        if (hasGlyph(c)) {
            const glm::vec4& region = *_regions[static_cast<unsigned char>(c)];
            GlyphInstance g;
            g.position = pen;
            g.size = {width, height};
            g.uvMin = {region.x, region.y};
            g.uvMax = {region.z, region.w};
            g.color = color;
            out.push_back(g);
        }
        pen.x += width;
    }
}

//=============================================================================
// DemoScene
//=============================================================================

Result<DemoScene> DemoScene::create(uint32_t atlasSize, uint32_t peerCount) {
    auto font = BlockFont::create(atlasSize);
    if (!font) {
        return Err<DemoScene>("DemoScene: failed to create font", font);
    }

    DemoScene scene(std::move(*font));

    uint64_t id = 1;
    for (const DemoCard& card : kDemoCards) {
        SceneNode node;
        node.id = id++;
        node.kind = NodeKind::Rect;
        node.bounds = card.bounds;
        node.color = card.color;
        node.radius = card.radius;
        scene._nodes.push_back(node);
    }

    for (uint32_t i = 0; i < peerCount; ++i) {
        const float fi = static_cast<float>(i);
        scene._peers.push_back(Peer{
            .id = 13 + 97 * static_cast<uint64_t>(i),
            .center = {400.0f, 280.0f},
            .radius = {std::max(40.0f, 260.0f - 40.0f * fi), std::max(30.0f, 180.0f - 25.0f * fi)},
            .speed = 0.4f + 0.15f * fi,
            .phase = 1.3f * fi,
        });
    }

    return Ok(std::move(scene));
}

bool DemoScene::updateHover(glm::vec2 world) {
    auto hit = hitTest(_nodes, world);
    if (hit == _interaction.hovered) return false;
    _interaction.hovered = hit;
    return true;
}

bool DemoScene::selectAt(glm::vec2 world) {
    auto hit = hitTest(_nodes, world);
    if (hit == _interaction.selected) return false;
    _interaction.selected = hit;
    return true;
}

glm::vec2 DemoScene::peerPosition(const Peer& peer, double time) const {
    const float t = static_cast<float>(time) * peer.speed + peer.phase;
    return peer.center + glm::vec2(std::cos(t), std::sin(2.0f * t) * 0.5f) * peer.radius;
}

FrameSnapshot::Ptr DemoScene::snapshot(const Camera& camera, double time, uint64_t frameId) const {
    auto snap = std::make_shared<FrameSnapshot>();
    snap->frameId = frameId;
    snap->camera = camera.uniform();
    snap->viewportWidth = camera.width();
    snap->viewportHeight = camera.height();

    collectRects(_nodes, snap->rects);
    appendOverlays(_nodes, _interaction, snap->rects);

    const Bounds& header = _nodes[kHeaderIndex].bounds;
    const float titleHeight = 28.0f;
    _font.layout("VELLUM CANVAS",
                 {header.x + 20.0f, header.y + (header.height - titleHeight) * 0.5f},
                 titleHeight, kTitleColor, snap->glyphs);

    for (size_t i = kFirstBadgeIndex; i < _nodes.size(); ++i) {
        const Bounds& b = _nodes[i].bounds;
        const float labelHeight = 18.0f;
        std::string label = "LAYER " + std::to_string(i - kFirstBadgeIndex + 1);
        _font.layout(label, {b.x + 10.0f, b.y + (b.height - labelHeight) * 0.5f},
                     labelHeight, kLabelColor, snap->glyphs);
    }

    for (const Peer& peer : _peers) {
        CursorInstance c;
        c.position = peerPosition(peer, time);
        c.color = cursorColorForPeer(peer.id);
        snap->cursors.push_back(c);
    }

    return snap;
}

} // namespace vellum
