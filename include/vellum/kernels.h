#pragma once

#include <vellum/instances.h>
#include <glm/glm.hpp>
#include <optional>

//=============================================================================
// CPU mirror of the fragment stages in src/vellum/shaders/*.wgsl
//
// Same operations in the same order, evaluated in float32. Used by the
// software rasterizer and by the unit tests. A discarded fragment is
// std::nullopt; a kept fragment is the un-blended (rgb, a) output.
//=============================================================================

namespace vellum::kernels {

constexpr float kRectDiscard = 0.001f;
constexpr float kGlyphDiscard = 0.004f;
constexpr float kCursorDiscard = 0.01f;
constexpr float kCursorSize = 20.0f;

using Fragment = std::optional<glm::vec4>;

//-----------------------------------------------------------------------------
// Rectangle
//-----------------------------------------------------------------------------

// Signed distance (pixel units) from uv*size to the rounded-rect boundary
float roundedRectDistance(glm::vec2 uv, glm::vec2 size, float borderRadius);

// 1 - smoothstep(-0.5, 0.5, d)
float rectCoverage(glm::vec2 uv, glm::vec2 size, float borderRadius);

Fragment shadeRect(const RectInstance& rect, glm::vec2 uv);

//-----------------------------------------------------------------------------
// Glyph
//-----------------------------------------------------------------------------

glm::vec2 glyphUv(const GlyphInstance& glyph, glm::vec2 quadPos);

Fragment shadeGlyph(const GlyphInstance& glyph, float atlasAlpha);

//-----------------------------------------------------------------------------
// Cursor arrow
//-----------------------------------------------------------------------------

struct CursorEdges {
    float e1;  // left margin
    float e2;  // bottom-left to tip diagonal
    float e3;  // top to tip diagonal
};

CursorEdges cursorEdges(glm::vec2 uv);

// Hard classification: step(0,e1) * step(0,0.65-e2) * step(0,e3) == 1
bool cursorInside(glm::vec2 uv);

float cursorCoverage(glm::vec2 uv);

float cursorBorder(glm::vec2 uv);

Fragment shadeCursor(const CursorInstance& cursor, glm::vec2 uv);

} // namespace vellum::kernels
