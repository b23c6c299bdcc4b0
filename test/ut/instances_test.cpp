//=============================================================================
// Instance Record Tests
//
// Byte layouts shared with the WGSL inputs, sanitizing, buffer growth policy
// and collaborator cursor colors.
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/instances.h>
#include <vellum/camera.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace boost::ut;
using namespace vellum;

namespace {

bool near(float a, float b, float eps = 1e-3f) {
    return std::abs(a - b) < eps;
}

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
constexpr float kInf = std::numeric_limits<float>::infinity();

} // namespace

suite instance_layout_tests = [] {
    "records are 48 bytes"_test = [] {
        expect(sizeof(RectInstance) == 48_u);
        expect(sizeof(GlyphInstance) == 48_u);
        expect(sizeof(CursorInstance) == 48_u);
    };

    "rect attribute offsets"_test = [] {
        expect(kRectAttributes[0].offset == 0_u);
        expect(kRectAttributes[1].offset == 8_u);
        expect(kRectAttributes[2].offset == 16_u);
        expect(kRectAttributes[3].offset == 32_u);
        expect(kRectAttributes[4].offset == 36_u);
    };

    "glyph attribute offsets"_test = [] {
        expect(kGlyphAttributes[2].offset == 16_u);
        expect(kGlyphAttributes[3].offset == 24_u);
        expect(kGlyphAttributes[4].offset == 32_u);
        expect(kGlyphAttributes[4].components == 4_u);
    };

    "cursor attribute offsets"_test = [] {
        expect(kCursorAttributes[1].offset == 8_u);
        expect(kCursorAttributes[2].offset == 24_u);
    };

    "instance attributes start after the quad position"_test = [] {
        for (const auto& a : kRectAttributes) expect(a.location >= 1_u);
        for (const auto& a : kGlyphAttributes) expect(a.location >= 1_u);
        for (const auto& a : kCursorAttributes) expect(a.location >= 1_u);
    };

    "unit quad is two triangles"_test = [] {
        expect(kQuadIndices.size() == 6_u);
        expect(kQuadIndices[0] == 0_u and kQuadIndices[1] == 1_u and kQuadIndices[2] == 2_u);
        expect(kQuadIndices[3] == 2_u and kQuadIndices[4] == 1_u and kQuadIndices[5] == 3_u);
        expect(kQuadVertices[3].position[0] == 1.0_f);
        expect(kQuadVertices[3].position[1] == 1.0_f);
    };
};

suite sanitize_tests = [] {
    "valid rect passes untouched"_test = [] {
        RectInstance r;
        r.position = {10.0f, 20.0f};
        r.size = {30.0f, 40.0f};
        r.color = {0.5f, 0.5f, 0.5f, 1.0f};
        r.borderRadius = 4.0f;
        r.zIndex = 7.0f;
        SanitizeStats stats;
        expect(sanitize(r, stats));
        expect(stats.rejected == 0_u);
        expect(stats.clamped == 0_u);
        expect(r.zIndex == 7.0_f);
    };

    "non-finite geometry is rejected"_test = [] {
        SanitizeStats stats;
        RectInstance a;
        a.position = {kNaN, 0.0f};
        RectInstance b;
        b.size = {kInf, 1.0f};
        RectInstance c;
        c.zIndex = kNaN;
        expect(!sanitize(a, stats));
        expect(!sanitize(b, stats));
        expect(!sanitize(c, stats));
        expect(stats.rejected == 3_u);
    };

    "rect fields are clamped"_test = [] {
        RectInstance r;
        r.size = {-5.0f, 10.0f};
        r.color = {2.0f, -1.0f, kNaN, 0.5f};
        r.borderRadius = -3.0f;
        r.zIndex = 1.0e9f;
        SanitizeStats stats;
        expect(sanitize(r, stats));
        expect(stats.clamped == 1_u);
        expect(r.size.x == 0.0_f);
        expect(r.color.r == 1.0_f);
        expect(r.color.g == 0.0_f);
        expect(r.color.b == 0.0_f);
        expect(r.borderRadius == 0.0_f);
        expect(r.zIndex == kMaxCanvasZ);
    };

    "negative z clamps to zero"_test = [] {
        RectInstance r;
        r.zIndex = -10.0f;
        SanitizeStats stats;
        expect(sanitize(r, stats));
        expect(r.zIndex == 0.0_f);
    };

    "glyph with non-finite uv is rejected"_test = [] {
        GlyphInstance g;
        g.uvMax = {kInf, 1.0f};
        SanitizeStats stats;
        expect(!sanitize(g, stats));
        expect(stats.rejected == 1_u);
    };

    "cursor only needs a finite position"_test = [] {
        CursorInstance ok;
        ok.selectionRect = {kNaN, kNaN, kNaN, kNaN};
        CursorInstance bad;
        bad.position = {0.0f, kInf};
        SanitizeStats stats;
        expect(sanitize(ok, stats));
        expect(!sanitize(bad, stats));
    };

    "sanitizeInto keeps valid instances in order"_test = [] {
        std::vector<RectInstance> src(4);
        src[0].zIndex = 1.0f;
        src[1].position = {kNaN, 0.0f};
        src[2].zIndex = 2.0f;
        src[3].zIndex = 3.0f;
        std::vector<RectInstance> dst(10);
        SanitizeStats stats = sanitizeInto(src, dst);
        expect(dst.size() == 3_u);
        expect(stats.rejected == 1_u);
        expect(dst[0].zIndex == 1.0_f);
        expect(dst[2].zIndex == 3.0_f);
    };
};

suite capacity_tests = [] {
    "fitting requests keep the current capacity"_test = [] {
        expect(instanceCapacityFor(10, 64) == 64_u);
        expect(instanceCapacityFor(64, 64) == 64_u);
        expect(instanceCapacityFor(0, 0) == 0_u);
    };

    "growth adds a quarter"_test = [] {
        expect(instanceCapacityFor(100, 64) == 125_u);
        expect(instanceCapacityFor(1000, 125) == 1250_u);
    };

    "growth never goes below the minimum"_test = [] {
        expect(instanceCapacityFor(1, 0) == kMinInstanceCapacity);
        expect(instanceCapacityFor(50, 10) == kMinInstanceCapacity);
    };
};

suite cursor_color_tests = [] {
    "peer zero is red"_test = [] {
        glm::vec4 c = cursorColorForPeer(0);
        expect(near(c.r, 0.88f));
        expect(near(c.g, 0.32f));
        expect(near(c.b, 0.32f));
        expect(c.a == 1.0_f);
    };

    "hue wraps every 360 ids"_test = [] {
        glm::vec4 a = cursorColorForPeer(42);
        glm::vec4 b = cursorColorForPeer(402);
        expect(near(a.r, b.r) and near(a.g, b.g) and near(a.b, b.b));
    };

    "distinct peers get distinct colors"_test = [] {
        glm::vec4 a = cursorColorForPeer(13);
        glm::vec4 b = cursorColorForPeer(110);
        expect(glm::length(glm::vec3(a) - glm::vec3(b)) > 0.1f);
    };

    "grey when unsaturated"_test = [] {
        glm::vec3 c = hslToRgb(0.3f, 0.0f, 0.4f);
        expect(c.r == 0.4_f and c.g == 0.4_f and c.b == 0.4_f);
    };
};
