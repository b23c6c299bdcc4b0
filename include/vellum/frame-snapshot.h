#pragma once

#include <vellum/camera.h>
#include <vellum/instances.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace vellum {

//-----------------------------------------------------------------------------
// FrameSnapshot - one frame's resolved primitives plus the camera they were
// laid out for. Immutable once published.
//-----------------------------------------------------------------------------
struct FrameSnapshot {
    using Ptr = std::shared_ptr<const FrameSnapshot>;

    uint64_t frameId = 0;

    CameraUniform camera;
    // Viewport the camera projection was computed for
    uint32_t viewportWidth = 0;
    uint32_t viewportHeight = 0;

    std::vector<RectInstance> rects;
    std::vector<GlyphInstance> glyphs;
    std::vector<CursorInstance> cursors;
};

} // namespace vellum
