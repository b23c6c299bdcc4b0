#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vellum {

//=============================================================================
// Per-instance records
//
// Each record is uploaded verbatim into a vertex buffer stepped per instance.
// Layouts are 48 bytes with explicit padding so the CPU struct, the vertex
// attribute table and the WGSL input struct agree byte for byte.
//=============================================================================

struct RectInstance {
    glm::vec2 position{0.0f};
    glm::vec2 size{0.0f};
    glm::vec4 color{1.0f};
    float borderRadius = 0.0f;
    float zIndex = 0.0f;
    float _pad[2] = {0.0f, 0.0f};
};

struct GlyphInstance {
    glm::vec2 position{0.0f};
    glm::vec2 size{0.0f};
    glm::vec2 uvMin{0.0f};
    glm::vec2 uvMax{0.0f};
    glm::vec4 color{1.0f};
};

// Fixed 20 unit arrow anchored at its tip. selectionRect (x, y, w, h) is
// carried to the vertex input but not composited.
struct CursorInstance {
    glm::vec2 position{0.0f};
    glm::vec4 color{1.0f};
    glm::vec4 selectionRect{0.0f};
    float _pad[2] = {0.0f, 0.0f};
};

static_assert(sizeof(RectInstance) == 48, "RectInstance layout");
static_assert(sizeof(GlyphInstance) == 48, "GlyphInstance layout");
static_assert(sizeof(CursorInstance) == 48, "CursorInstance layout");

//=============================================================================
// Vertex layout description
//=============================================================================

// One shader input: location, float component count, byte offset
struct AttributeSpec {
    uint32_t location;
    uint32_t components;
    uint32_t offset;
};

inline constexpr std::array<AttributeSpec, 5> kRectAttributes = {{
    {1, 2, offsetof(RectInstance, position)},
    {2, 2, offsetof(RectInstance, size)},
    {3, 4, offsetof(RectInstance, color)},
    {4, 1, offsetof(RectInstance, borderRadius)},
    {5, 1, offsetof(RectInstance, zIndex)},
}};

inline constexpr std::array<AttributeSpec, 5> kGlyphAttributes = {{
    {1, 2, offsetof(GlyphInstance, position)},
    {2, 2, offsetof(GlyphInstance, size)},
    {3, 2, offsetof(GlyphInstance, uvMin)},
    {4, 2, offsetof(GlyphInstance, uvMax)},
    {5, 4, offsetof(GlyphInstance, color)},
}};

inline constexpr std::array<AttributeSpec, 3> kCursorAttributes = {{
    {1, 2, offsetof(CursorInstance, position)},
    {2, 4, offsetof(CursorInstance, color)},
    {3, 4, offsetof(CursorInstance, selectionRect)},
}};

// Unit quad shared by all pipelines, quad_pos at location 0
struct QuadVertex {
    float position[2];
};

inline constexpr std::array<QuadVertex, 4> kQuadVertices = {{
    {{0.0f, 0.0f}},
    {{1.0f, 0.0f}},
    {{0.0f, 1.0f}},
    {{1.0f, 1.0f}},
}};

inline constexpr std::array<uint16_t, 6> kQuadIndices = {0, 1, 2, 2, 1, 3};

//=============================================================================
// Sanitizing
//
// Non-finite geometry rejects the instance. Negative sizes collapse to zero
// area, color channels clamp to [0,1] (NaN becomes 0), negative or NaN radius
// becomes 0 and z_index clamps into the canvas depth range.
//=============================================================================

struct SanitizeStats {
    uint32_t rejected = 0;
    uint32_t clamped = 0;

    SanitizeStats& operator+=(const SanitizeStats& o) {
        rejected += o.rejected;
        clamped += o.clamped;
        return *this;
    }
};

// Returns false when the instance must be dropped. May modify the instance.
bool sanitize(RectInstance& rect, SanitizeStats& stats);
bool sanitize(GlyphInstance& glyph, SanitizeStats& stats);
bool sanitize(CursorInstance& cursor, SanitizeStats& stats);

// Copy the valid instances of src into dst (dst is cleared, capacity kept)
template<typename Instance>
SanitizeStats sanitizeInto(const std::vector<Instance>& src, std::vector<Instance>& dst) {
    SanitizeStats stats;
    dst.clear();
    dst.reserve(src.size());
    for (Instance inst : src) {
        if (sanitize(inst, stats)) dst.push_back(inst);
    }
    return stats;
}

//=============================================================================
// Capacity management
//=============================================================================

constexpr uint32_t kMinInstanceCapacity = 64;

// Capacity needed to hold `required` instances: current when it fits,
// otherwise required + required/4 (at least kMinInstanceCapacity)
uint32_t instanceCapacityFor(uint32_t required, uint32_t current);

//=============================================================================
// Cursor colors
//=============================================================================

inline const glm::vec4 kDefaultCursorColor{0.26f, 0.52f, 0.96f, 1.0f};

// Stable saturated color for a collaborator id
glm::vec4 cursorColorForPeer(uint64_t peerId);

glm::vec3 hslToRgb(float h, float s, float l);

} // namespace vellum
