#include <vellum/frame-batch.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <string>

namespace vellum {

std::string_view pipelineName(PipelineKind kind) {
    switch (kind) {
        case PipelineKind::Rect:   return "rect";
        case PipelineKind::Glyph:  return "glyph";
        case PipelineKind::Cursor: return "cursor";
    }
    return "unknown";
}

Result<void> validateProjection(const FrameSnapshot& snapshot,
                                uint32_t targetWidth, uint32_t targetHeight) {
    if (snapshot.viewportWidth != targetWidth || snapshot.viewportHeight != targetHeight) {
        return Err<void>("stale projection: frame " + std::to_string(snapshot.frameId) +
                         " laid out for " + std::to_string(snapshot.viewportWidth) + "x" +
                         std::to_string(snapshot.viewportHeight) + ", target is " +
                         std::to_string(targetWidth) + "x" + std::to_string(targetHeight));
    }
    return Ok();
}

void FrameBatch::reset() {
    _frameId = 0;
    _camera = CameraUniform{};
    _rects.clear();
    _glyphs.clear();
    _cursors.clear();
    _draws.clear();
    _sanitize = {};
    _glyphsSkipped = false;
}

void FrameBatch::assemble(const FrameSnapshot& snapshot, const BatchOptions& options) {
    _frameId = snapshot.frameId;
    _camera = snapshot.camera;
    _sanitize = {};
    _draws.clear();

    _sanitize += sanitizeInto(snapshot.rects, _rects);
    _sanitize += sanitizeInto(snapshot.cursors, _cursors);

    _glyphsSkipped = false;
    if (options.atlasBound) {
        _sanitize += sanitizeInto(snapshot.glyphs, _glyphs);
    } else {
        _glyphs.clear();
        _glyphsSkipped = !snapshot.glyphs.empty();
        if (_glyphsSkipped) {
            ydebug("FrameBatch: no atlas bound, skipping {} glyphs in frame {}",
                   snapshot.glyphs.size(), snapshot.frameId);
        }
    }

    // Depth resolves occlusion; ascending z keeps translucent edges blending
    // over what is underneath
    if (options.sortRectsByZ) {
        std::stable_sort(_rects.begin(), _rects.end(),
            [](const RectInstance& a, const RectInstance& b) {
                return a.zIndex < b.zIndex;
            });
    }

    if (!_rects.empty()) {
        _draws.push_back({PipelineKind::Rect, static_cast<uint32_t>(_rects.size())});
    }
    if (!_glyphs.empty()) {
        _draws.push_back({PipelineKind::Glyph, static_cast<uint32_t>(_glyphs.size())});
    }
    if (!_cursors.empty()) {
        _draws.push_back({PipelineKind::Cursor, static_cast<uint32_t>(_cursors.size())});
    }

    if (_sanitize.rejected > 0) {
        ywarn("FrameBatch: frame {} rejected {} malformed instances",
              _frameId, _sanitize.rejected);
    }
}

FrameStats FrameBatch::stats() const {
    FrameStats s;
    s.frameId = _frameId;
    s.rects = static_cast<uint32_t>(_rects.size());
    s.glyphs = static_cast<uint32_t>(_glyphs.size());
    s.cursors = static_cast<uint32_t>(_cursors.size());
    s.drawCalls = static_cast<uint32_t>(_draws.size());
    s.rejected = _sanitize.rejected;
    s.glyphsSkipped = _glyphsSkipped;
    return s;
}

} // namespace vellum
