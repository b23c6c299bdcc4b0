#pragma once

#include <vellum/frame-snapshot.h>
#include <vellum/instances.h>
#include <vellum/result.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

namespace vellum {

enum class PipelineKind : uint8_t {
    Rect = 0,
    Glyph = 1,
    Cursor = 2,
};

std::string_view pipelineName(PipelineKind kind);

struct DrawCall {
    PipelineKind pipeline;
    uint32_t instanceCount;
};

enum class DepthCompare : uint8_t {
    Always,
    LessEqual,
};

// Depth buffer is cleared to 1.0 every frame. Rects resolve overlap by
// z_index, glyphs composite over every rect, cursors test against the
// constant cursor depth without writing it.
struct DepthState {
    DepthCompare compare;
    bool write;
};

constexpr DepthState depthStateFor(PipelineKind kind) {
    switch (kind) {
        case PipelineKind::Rect:   return {DepthCompare::LessEqual, true};
        case PipelineKind::Glyph:  return {DepthCompare::Always, false};
        case PipelineKind::Cursor: return {DepthCompare::LessEqual, false};
    }
    return {DepthCompare::Always, false};
}

//-----------------------------------------------------------------------------
// FrameStats - what one render() call did
//-----------------------------------------------------------------------------
struct FrameStats {
    uint64_t frameId = 0;
    uint32_t rects = 0;
    uint32_t glyphs = 0;
    uint32_t cursors = 0;
    uint32_t drawCalls = 0;
    uint32_t rejected = 0;       // instances dropped by sanitizing
    bool glyphsSkipped = false;  // glyphs present but no atlas bound
    bool dropped = false;        // nothing submitted for this snapshot
    bool recovered = false;      // GPU resources were rebuilt this call
};

struct BatchOptions {
    bool sortRectsByZ = true;
    bool atlasBound = false;
};

// A snapshot laid out for another viewport would draw every primitive
// uniformly misaligned. Err when the camera is stale for the target.
Result<void> validateProjection(const FrameSnapshot& snapshot,
                                uint32_t targetWidth, uint32_t targetHeight);

//-----------------------------------------------------------------------------
// FrameBatch - per-frame CPU arenas feeding the pipelines
//
// assemble() copies sanitized instances out of a snapshot into arenas that
// keep their capacity from frame to frame, then derives the draw list:
// rect, glyph, cursor, one call per non-empty list.
//-----------------------------------------------------------------------------
class FrameBatch {
public:
    void assemble(const FrameSnapshot& snapshot, const BatchOptions& options);
    void reset();

    const CameraUniform& camera() const { return _camera; }
    const std::vector<RectInstance>& rects() const { return _rects; }
    const std::vector<GlyphInstance>& glyphs() const { return _glyphs; }
    const std::vector<CursorInstance>& cursors() const { return _cursors; }

    const std::vector<DrawCall>& drawList() const { return _draws; }

    uint64_t frameId() const { return _frameId; }
    const SanitizeStats& sanitizeStats() const { return _sanitize; }
    bool glyphsSkipped() const { return _glyphsSkipped; }

    // Counters for the draw list as built
    FrameStats stats() const;

private:
    uint64_t _frameId = 0;
    CameraUniform _camera;
    std::vector<RectInstance> _rects;
    std::vector<GlyphInstance> _glyphs;
    std::vector<CursorInstance> _cursors;
    std::vector<DrawCall> _draws;
    SanitizeStats _sanitize;
    bool _glyphsSkipped = false;
};

} // namespace vellum
