#pragma once

#include <vellum/atlas-image.h>
#include <vellum/frame-batch.h>
#include <vellum/image.h>
#include <vellum/result.hpp>
#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace vellum {

//-----------------------------------------------------------------------------
// SoftwareRasterizer - CPU reference compositor
//
// Runs a snapshot through the same FrameBatch as the GPU path and shades
// each covered pixel center with the kernels from kernels.h. Depth and blend
// states match the GPU pipelines. Used for headless export without an
// adapter and as the oracle in unit tests.
//-----------------------------------------------------------------------------
class SoftwareRasterizer {
public:
    SoftwareRasterizer(uint32_t width, uint32_t height);

    void resize(uint32_t width, uint32_t height);

    void setClearColor(glm::vec4 color) { _clearColor = color; }
    void setSortRectsByZ(bool sort) { _sortRectsByZ = sort; }

    void bindAtlas(AtlasImage atlas) { _atlas = std::move(atlas); }
    void unbindAtlas() { _atlas.reset(); }
    bool atlasBound() const { return _atlas.has_value(); }

    // Stale projection drops the frame: Ok with stats.dropped set
    Result<FrameStats> render(const FrameSnapshot& snapshot);

    const Image& image() const { return _color; }
    float depthAt(uint32_t x, uint32_t y) const { return _depth[static_cast<size_t>(y) * _width + x]; }

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

private:
    struct Quad {
        glm::vec2 origin;
        glm::vec2 extent;
        float z;
    };

    template<typename Shade>
    void drawQuad(const CameraUniform& camera, const Quad& quad,
                  DepthState depth, Shade&& shade);

    void drawRects(const FrameBatch& batch);
    void drawGlyphs(const FrameBatch& batch);
    void drawCursors(const FrameBatch& batch);

    void blend(uint32_t x, uint32_t y, glm::vec4 src);

    uint32_t _width;
    uint32_t _height;
    Image _color;
    std::vector<float> _depth;
    glm::vec4 _clearColor{0.0f};
    bool _sortRectsByZ = true;
    std::optional<AtlasImage> _atlas;
    FrameBatch _batch;
};

} // namespace vellum
