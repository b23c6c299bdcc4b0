#pragma once

#include <vellum/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vellum {

//-----------------------------------------------------------------------------
// Image - linear float RGBA framebuffer
//-----------------------------------------------------------------------------
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<glm::vec4> pixels;

    Image() = default;
    Image(uint32_t w, uint32_t h, glm::vec4 fill = glm::vec4(0.0f))
        : width(w), height(h), pixels(static_cast<size_t>(w) * h, fill) {}

    glm::vec4& at(uint32_t x, uint32_t y) { return pixels[static_cast<size_t>(y) * width + x]; }
    const glm::vec4& at(uint32_t x, uint32_t y) const { return pixels[static_cast<size_t>(y) * width + x]; }

    void fill(glm::vec4 color);

    // Round-to-nearest quantization, as an RGBA8Unorm target stores it
    std::vector<uint8_t> toRgba8() const;
};

// Tightly packed RGBA8 rows
Result<void> writePng(const std::string& path, uint32_t width, uint32_t height,
                      const std::vector<uint8_t>& rgba);

} // namespace vellum
