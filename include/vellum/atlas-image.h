#pragma once

#include <vellum/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace vellum {

//-----------------------------------------------------------------------------
// AtlasImage - CPU copy of the single-channel glyph coverage atlas
//
// Uploaded to an R8Unorm texture. Packing and glyph caching belong to the
// text shaping side; this only carries pixels.
//-----------------------------------------------------------------------------
struct AtlasImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> coverage;  // width * height, row-major

    static Result<AtlasImage> fromCoverage(uint32_t width, uint32_t height,
                                           std::vector<uint8_t> coverage);

    // Keeps the alpha channel of tightly packed RGBA8 pixels
    static Result<AtlasImage> fromRgba(uint32_t width, uint32_t height,
                                       const std::vector<uint8_t>& rgba);

    bool empty() const { return width == 0 || height == 0; }

    uint8_t at(uint32_t x, uint32_t y) const { return coverage[y * width + x]; }

    // Linear filter, clamp-to-edge addressing (matches the atlas sampler)
    float sample(glm::vec2 uv) const;
};

} // namespace vellum
