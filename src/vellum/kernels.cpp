#include <vellum/kernels.h>
#include <algorithm>

namespace vellum::kernels {

namespace {

// WGSL step(edge, x)
float step(float edge, float x) {
    return x < edge ? 0.0f : 1.0f;
}

} // namespace

float roundedRectDistance(glm::vec2 uv, glm::vec2 size, float borderRadius) {
    const glm::vec2 halfSize = size * 0.5f;
    const glm::vec2 center = uv * size - halfSize;
    const float r = std::min(borderRadius, std::min(halfSize.x, halfSize.y));
    const glm::vec2 q = glm::abs(center) - halfSize + glm::vec2(r);
    return glm::length(glm::max(q, glm::vec2(0.0f)))
         + std::min(std::max(q.x, q.y), 0.0f) - r;
}

float rectCoverage(glm::vec2 uv, glm::vec2 size, float borderRadius) {
    const float d = roundedRectDistance(uv, size, borderRadius);
    return 1.0f - glm::smoothstep(-0.5f, 0.5f, d);
}

Fragment shadeRect(const RectInstance& rect, glm::vec2 uv) {
    const float alpha = rectCoverage(uv, rect.size, rect.borderRadius);
    if (alpha < kRectDiscard) return std::nullopt;
    return glm::vec4(glm::vec3(rect.color), rect.color.a * alpha);
}

glm::vec2 glyphUv(const GlyphInstance& glyph, glm::vec2 quadPos) {
    return glm::mix(glyph.uvMin, glyph.uvMax, quadPos);
}

Fragment shadeGlyph(const GlyphInstance& glyph, float atlasAlpha) {
    if (atlasAlpha < kGlyphDiscard) return std::nullopt;
    return glm::vec4(glm::vec3(glyph.color), glyph.color.a * atlasAlpha);
}

CursorEdges cursorEdges(glm::vec2 uv) {
    return {
        uv.x - 0.05f,
        (uv.y - 0.05f) - uv.x * 1.5f,
        uv.x * 1.4f - (uv.y - 0.05f),
    };
}

bool cursorInside(glm::vec2 uv) {
    const CursorEdges e = cursorEdges(uv);
    return step(0.0f, e.e1) * step(0.0f, -e.e2 + 0.65f) * step(0.0f, e.e3) == 1.0f;
}

float cursorCoverage(glm::vec2 uv) {
    const CursorEdges e = cursorEdges(uv);
    return glm::smoothstep(-0.02f, 0.02f, e.e1)
         * glm::smoothstep(-0.02f, 0.02f, 0.65f - e.e2)
         * glm::smoothstep(-0.02f, 0.02f, e.e3);
}

float cursorBorder(glm::vec2 uv) {
    const CursorEdges e = cursorEdges(uv);
    const float edge = std::min(std::min(e.e1, 0.65f - e.e2), e.e3);
    return 1.0f - glm::smoothstep(0.0f, 0.06f, edge);
}

Fragment shadeCursor(const CursorInstance& cursor, glm::vec2 uv) {
    const float coverage = cursorCoverage(uv);
    if (coverage < kCursorDiscard) return std::nullopt;
    const float border = cursorBorder(uv);
    const glm::vec3 rgb = glm::mix(glm::vec3(cursor.color), glm::vec3(1.0f), border * 0.3f);
    return glm::vec4(rgb, coverage * cursor.color.a);
}

} // namespace vellum::kernels
