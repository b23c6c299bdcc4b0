#include <vellum/instances.h>
#include <vellum/camera.h>
#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

bool finite(glm::vec2 v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

// Negative extents collapse to zero area
bool clampSize(glm::vec2& size) {
    bool changed = false;
    for (int i = 0; i < 2; ++i) {
        if (size[i] < 0.0f) {
            size[i] = 0.0f;
            changed = true;
        }
    }
    return changed;
}

bool clampColor(glm::vec4& color) {
    bool changed = false;
    for (int i = 0; i < 4; ++i) {
        float c = color[i];
        float fixed = std::isnan(c) ? 0.0f : std::clamp(c, 0.0f, 1.0f);
        if (fixed != c || std::isnan(c)) {
            color[i] = fixed;
            changed = true;
        }
    }
    return changed;
}

} // namespace

bool sanitize(RectInstance& rect, SanitizeStats& stats) {
    if (!finite(rect.position) || !finite(rect.size) || !std::isfinite(rect.zIndex)) {
        stats.rejected++;
        return false;
    }

    bool changed = clampSize(rect.size);
    changed |= clampColor(rect.color);

    if (std::isnan(rect.borderRadius) || rect.borderRadius < 0.0f) {
        rect.borderRadius = 0.0f;
        changed = true;
    }
    // +inf radius is fine: the fragment stage clamps it to a pill

    float z = std::clamp(rect.zIndex, 0.0f, kMaxCanvasZ);
    if (z != rect.zIndex) {
        rect.zIndex = z;
        changed = true;
    }

    if (changed) stats.clamped++;
    return true;
}

bool sanitize(GlyphInstance& glyph, SanitizeStats& stats) {
    if (!finite(glyph.position) || !finite(glyph.size) ||
        !finite(glyph.uvMin) || !finite(glyph.uvMax)) {
        stats.rejected++;
        return false;
    }

    bool changed = clampSize(glyph.size);
    changed |= clampColor(glyph.color);

    if (changed) stats.clamped++;
    return true;
}

bool sanitize(CursorInstance& cursor, SanitizeStats& stats) {
    if (!finite(cursor.position)) {
        stats.rejected++;
        return false;
    }

    if (clampColor(cursor.color)) stats.clamped++;
    return true;
}

uint32_t instanceCapacityFor(uint32_t required, uint32_t current) {
    if (required <= current) return current;
    return std::max(required + required / 4, kMinInstanceCapacity);
}

glm::vec3 hslToRgb(float h, float s, float l) {
    if (s == 0.0f) return glm::vec3(l);

    const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
    const float p = 2.0f * l - q;

    auto hueToRgb = [p, q](float t) {
        if (t < 0.0f) t += 1.0f;
        if (t > 1.0f) t -= 1.0f;
        if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
        if (t < 1.0f / 2.0f) return q;
        if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
        return p;
    };

    return glm::vec3(hueToRgb(h + 1.0f / 3.0f), hueToRgb(h), hueToRgb(h - 1.0f / 3.0f));
}

glm::vec4 cursorColorForPeer(uint64_t peerId) {
    const float hue = static_cast<float>(peerId % 360) / 360.0f;
    return glm::vec4(hslToRgb(hue, 0.7f, 0.6f), 1.0f);
}

} // namespace vellum
