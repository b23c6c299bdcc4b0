#include <vellum/image.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace vellum {

void Image::fill(glm::vec4 color) {
    std::fill(pixels.begin(), pixels.end(), color);
}

std::vector<uint8_t> Image::toRgba8() const {
    std::vector<uint8_t> out(pixels.size() * 4);
    for (size_t i = 0; i < pixels.size(); ++i) {
        for (int c = 0; c < 4; ++c) {
            float v = std::clamp(pixels[i][c], 0.0f, 1.0f);
            out[i * 4 + c] = static_cast<uint8_t>(std::lround(v * 255.0f));
        }
    }
    return out;
}

Result<void> writePng(const std::string& path, uint32_t width, uint32_t height,
                      const std::vector<uint8_t>& rgba) {
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        return Err<void>("writePng: pixel buffer does not match " +
                         std::to_string(width) + "x" + std::to_string(height));
    }
    int stride = static_cast<int>(width * 4);
    if (!stbi_write_png(path.c_str(), static_cast<int>(width), static_cast<int>(height),
                        4, rgba.data(), stride)) {
        return Err<void>("writePng: failed to write " + path);
    }
    yinfo("Wrote {}x{} frame to {}", width, height, path);
    return Ok();
}

} // namespace vellum
