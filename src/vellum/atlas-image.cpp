#include <vellum/atlas-image.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace vellum {

Result<AtlasImage> AtlasImage::fromCoverage(uint32_t width, uint32_t height,
                                            std::vector<uint8_t> coverage) {
    if (width == 0 || height == 0) {
        return Err<AtlasImage>("AtlasImage: empty atlas");
    }
    if (coverage.size() != static_cast<size_t>(width) * height) {
        return Err<AtlasImage>("AtlasImage: expected " +
                               std::to_string(static_cast<size_t>(width) * height) +
                               " coverage bytes, got " + std::to_string(coverage.size()));
    }
    AtlasImage img;
    img.width = width;
    img.height = height;
    img.coverage = std::move(coverage);
    return Ok(std::move(img));
}

Result<AtlasImage> AtlasImage::fromRgba(uint32_t width, uint32_t height,
                                        const std::vector<uint8_t>& rgba) {
    const size_t pixels = static_cast<size_t>(width) * height;
    if (rgba.size() != pixels * 4) {
        return Err<AtlasImage>("AtlasImage: expected " + std::to_string(pixels * 4) +
                               " RGBA bytes, got " + std::to_string(rgba.size()));
    }
    std::vector<uint8_t> alpha(pixels);
    for (size_t i = 0; i < pixels; ++i) {
        alpha[i] = rgba[i * 4 + 3];
    }
    return fromCoverage(width, height, std::move(alpha));
}

float AtlasImage::sample(glm::vec2 uv) const {
    if (empty()) return 0.0f;

    const float tx = uv.x * static_cast<float>(width) - 0.5f;
    const float ty = uv.y * static_cast<float>(height) - 0.5f;
    const float fx = std::floor(tx);
    const float fy = std::floor(ty);
    const float ax = tx - fx;
    const float ay = ty - fy;

    auto texel = [this](float x, float y) {
        const float maxX = static_cast<float>(width - 1);
        const float maxY = static_cast<float>(height - 1);
        const auto ix = static_cast<uint32_t>(std::clamp(x, 0.0f, maxX));
        const auto iy = static_cast<uint32_t>(std::clamp(y, 0.0f, maxY));
        return static_cast<float>(at(ix, iy)) / 255.0f;
    };

    const float top = glm::mix(texel(fx, fy), texel(fx + 1.0f, fy), ax);
    const float bottom = glm::mix(texel(fx, fy + 1.0f), texel(fx + 1.0f, fy + 1.0f), ax);
    return glm::mix(top, bottom, ay);
}

} // namespace vellum
