#include <vellum/software-rasterizer.h>
#include <vellum/kernels.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace vellum {

SoftwareRasterizer::SoftwareRasterizer(uint32_t width, uint32_t height)
    : _width(0), _height(0) {
    resize(width, height);
}

void SoftwareRasterizer::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return;
    _width = width;
    _height = height;
    _color = Image(width, height, _clearColor);
    _depth.assign(static_cast<size_t>(width) * height, 1.0f);
}

Result<FrameStats> SoftwareRasterizer::render(const FrameSnapshot& snapshot) {
    if (auto res = validateProjection(snapshot, _width, _height); !res) {
        ywarn("SoftwareRasterizer: dropping frame: {}", error_msg(res));
        FrameStats stats;
        stats.frameId = snapshot.frameId;
        stats.dropped = true;
        return Ok(stats);
    }

    BatchOptions options;
    options.sortRectsByZ = _sortRectsByZ;
    options.atlasBound = atlasBound();
    _batch.assemble(snapshot, options);

    _color.fill(_clearColor);
    std::fill(_depth.begin(), _depth.end(), 1.0f);

    for (const DrawCall& draw : _batch.drawList()) {
        switch (draw.pipeline) {
            case PipelineKind::Rect:   drawRects(_batch); break;
            case PipelineKind::Glyph:  drawGlyphs(_batch); break;
            case PipelineKind::Cursor: drawCursors(_batch); break;
        }
    }

    return Ok(_batch.stats());
}

template<typename Shade>
void SoftwareRasterizer::drawQuad(const CameraUniform& camera, const Quad& quad,
                                  DepthState depthState, Shade&& shade) {
    const float w = static_cast<float>(_width);
    const float h = static_cast<float>(_height);

    auto toPixel = [&](glm::vec2 world) {
        glm::vec4 clip = camera.project(world, quad.z);
        glm::vec3 ndc = glm::vec3(clip) / clip.w;
        return glm::vec3((ndc.x + 1.0f) * 0.5f * w, (1.0f - ndc.y) * 0.5f * h, ndc.z);
    };

    const glm::vec3 p00 = toPixel(quad.origin);
    const glm::vec3 p10 = toPixel(quad.origin + glm::vec2(quad.extent.x, 0.0f));
    const glm::vec3 p01 = toPixel(quad.origin + glm::vec2(0.0f, quad.extent.y));
    const glm::vec3 p11 = toPixel(quad.origin + quad.extent);

    // Outside the depth range the rasterizer clips the whole quad
    const float depth = p00.z;
    if (!(depth >= 0.0f && depth <= 1.0f)) return;

    const glm::vec2 a = glm::vec2(p10) - glm::vec2(p00);
    const glm::vec2 b = glm::vec2(p01) - glm::vec2(p00);
    const float det = a.x * b.y - a.y * b.x;
    if (std::abs(det) < 1e-12f) return;  // zero area

    const glm::vec2 lo = glm::min(glm::min(glm::vec2(p00), glm::vec2(p10)),
                                  glm::min(glm::vec2(p01), glm::vec2(p11)));
    const glm::vec2 hi = glm::max(glm::max(glm::vec2(p00), glm::vec2(p10)),
                                  glm::max(glm::vec2(p01), glm::vec2(p11)));
    const auto x0 = static_cast<uint32_t>(std::clamp(std::floor(lo.x), 0.0f, w));
    const auto y0 = static_cast<uint32_t>(std::clamp(std::floor(lo.y), 0.0f, h));
    const auto x1 = static_cast<uint32_t>(std::clamp(std::ceil(hi.x), 0.0f, w));
    const auto y1 = static_cast<uint32_t>(std::clamp(std::ceil(hi.y), 0.0f, h));

    for (uint32_t y = y0; y < y1; ++y) {
        for (uint32_t x = x0; x < x1; ++x) {
            const glm::vec2 c = glm::vec2(x + 0.5f, y + 0.5f) - glm::vec2(p00);
            const float u = (c.x * b.y - c.y * b.x) / det;
            const float v = (a.x * c.y - a.y * c.x) / det;
            if (u < 0.0f || u >= 1.0f || v < 0.0f || v >= 1.0f) continue;

            float& stored = _depth[static_cast<size_t>(y) * _width + x];
            if (depthState.compare == DepthCompare::LessEqual && !(depth <= stored)) continue;

            kernels::Fragment frag = shade(glm::vec2(u, v));
            if (!frag) continue;

            blend(x, y, *frag);
            if (depthState.write) stored = depth;
        }
    }
}

void SoftwareRasterizer::blend(uint32_t x, uint32_t y, glm::vec4 src) {
    // color: SrcAlpha / OneMinusSrcAlpha, alpha: One / OneMinusSrcAlpha
    glm::vec4& dst = _color.at(x, y);
    const float inv = 1.0f - src.a;
    dst = glm::vec4(glm::vec3(src) * src.a + glm::vec3(dst) * inv,
                    src.a + dst.a * inv);
}

void SoftwareRasterizer::drawRects(const FrameBatch& batch) {
    const DepthState depth = depthStateFor(PipelineKind::Rect);
    for (const RectInstance& rect : batch.rects()) {
        drawQuad(batch.camera(), {rect.position, rect.size, rect.zIndex}, depth,
                 [&rect](glm::vec2 uv) { return kernels::shadeRect(rect, uv); });
    }
}

void SoftwareRasterizer::drawGlyphs(const FrameBatch& batch) {
    const DepthState depth = depthStateFor(PipelineKind::Glyph);
    const AtlasImage& atlas = *_atlas;
    for (const GlyphInstance& glyph : batch.glyphs()) {
        drawQuad(batch.camera(), {glyph.position, glyph.size, 0.0f}, depth,
                 [&glyph, &atlas](glm::vec2 quadPos) {
                     float coverage = atlas.sample(kernels::glyphUv(glyph, quadPos));
                     return kernels::shadeGlyph(glyph, coverage);
                 });
    }
}

void SoftwareRasterizer::drawCursors(const FrameBatch& batch) {
    const DepthState depth = depthStateFor(PipelineKind::Cursor);
    const glm::vec2 extent(kernels::kCursorSize);
    for (const CursorInstance& cursor : batch.cursors()) {
        drawQuad(batch.camera(), {cursor.position, extent, kCursorZ}, depth,
                 [&cursor](glm::vec2 uv) { return kernels::shadeCursor(cursor, uv); });
    }
}

} // namespace vellum
