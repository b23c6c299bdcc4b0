//=============================================================================
// SoftwareRasterizer Tests
//
// End-to-end frames through the CPU compositor: pixel coverage, depth
// resolution between and across pipelines, glyph sampling and frame drops.
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/software-rasterizer.h>
#include <cmath>
#include <cstring>
#include <vector>

using namespace boost::ut;
using namespace vellum;

namespace {

constexpr uint32_t kWidth = 100;
constexpr uint32_t kHeight = 80;

const glm::vec4 kRed{1.0f, 0.0f, 0.0f, 1.0f};
const glm::vec4 kGreen{0.0f, 1.0f, 0.0f, 1.0f};
const glm::vec4 kBlue{0.0f, 0.0f, 1.0f, 1.0f};
const glm::vec4 kWhite{1.0f, 1.0f, 1.0f, 1.0f};
const glm::vec4 kClear{0.0f, 0.0f, 0.0f, 0.0f};

bool same(glm::vec4 a, glm::vec4 b, float eps = 1e-4f) {
    glm::vec4 d = glm::abs(a - b);
    return d.r < eps && d.g < eps && d.b < eps && d.a < eps;
}

FrameSnapshot emptyFrame(uint64_t frameId = 1) {
    FrameSnapshot snap;
    snap.frameId = frameId;
    snap.viewportWidth = kWidth;
    snap.viewportHeight = kHeight;
    snap.camera = CameraUniform::identity(static_cast<float>(kWidth), static_cast<float>(kHeight));
    return snap;
}

RectInstance rect(glm::vec2 pos, glm::vec2 size, glm::vec4 color, float z = 0.0f, float radius = 0.0f) {
    RectInstance r;
    r.position = pos;
    r.size = size;
    r.color = color;
    r.zIndex = z;
    r.borderRadius = radius;
    return r;
}

CursorInstance cursor(glm::vec2 pos, glm::vec4 color) {
    CursorInstance c;
    c.position = pos;
    c.color = color;
    return c;
}

AtlasImage solidAtlas(uint32_t size, uint8_t value) {
    std::vector<uint8_t> coverage(static_cast<size_t>(size) * size, value);
    return *AtlasImage::fromCoverage(size, size, std::move(coverage));
}

GlyphInstance fullGlyph(glm::vec2 pos, glm::vec2 size, glm::vec4 color) {
    GlyphInstance g;
    g.position = pos;
    g.size = size;
    g.uvMin = {0.0f, 0.0f};
    g.uvMax = {1.0f, 1.0f};
    g.color = color;
    return g;
}

} // namespace

suite software_rect_tests = [] {
    "rounded rect covers its interior only"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({10.0f, 10.0f}, {50.0f, 30.0f}, kRed, 0.0f, 5.0f));

        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(stats->rects == 1_u);
        expect(stats->drawCalls == 1_u);

        const Image& img = raster.image();
        expect(same(img.at(35, 25), kRed));
        // Rounded away
        expect(same(img.at(10, 10), kClear));
        // Outside the quad
        expect(same(img.at(5, 5), kClear));
        expect(same(img.at(70, 25), kClear));
    };

    "clear color fills uncovered pixels"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        raster.setClearColor({0.1f, 0.2f, 0.3f, 1.0f});
        auto stats = raster.render(emptyFrame());
        expect(stats.has_value());
        expect(stats->drawCalls == 0_u);
        expect(same(raster.image().at(50, 40), {0.1f, 0.2f, 0.3f, 1.0f}));
    };

    "higher z wins regardless of submission order"_test = [] {
        for (bool sorted : {true, false}) {
            SoftwareRasterizer raster(kWidth, kHeight);
            raster.setSortRectsByZ(sorted);
            auto snap = emptyFrame();
            snap.rects.push_back(rect({0.0f, 0.0f}, {40.0f, 40.0f}, kRed, 2.0f));
            snap.rects.push_back(rect({20.0f, 20.0f}, {40.0f, 40.0f}, kGreen, 1.0f));
            expect(raster.render(snap).has_value());

            const Image& img = raster.image();
            expect(same(img.at(30, 30), kRed));
            expect(same(img.at(50, 50), kGreen));
            expect(same(img.at(10, 10), kRed));
        }
    };

    "translucent rect blends over the one below"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({0.0f, 0.0f}, {50.0f, 50.0f}, kRed, 1.0f));
        snap.rects.push_back(rect({0.0f, 0.0f}, {50.0f, 50.0f}, {0.0f, 0.0f, 1.0f, 0.5f}, 2.0f));
        expect(raster.render(snap).has_value());
        expect(same(raster.image().at(25, 25), {0.5f, 0.0f, 0.5f, 1.0f}));
    };

    "rendering the same snapshot twice is idempotent"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({5.0f, 5.0f}, {30.0f, 30.0f}, {0.0f, 0.5f, 1.0f, 0.5f}, 3.0f, 6.0f));
        snap.cursors.push_back(cursor({40.0f, 40.0f}, kBlue));

        expect(raster.render(snap).has_value());
        Image first = raster.image();
        expect(raster.render(snap).has_value());
        const Image& second = raster.image();
        expect(first.pixels.size() == second.pixels.size());
        // Bit-identical float output, not just equal after quantization
        expect(std::memcmp(first.pixels.data(), second.pixels.data(),
                           first.pixels.size() * sizeof(glm::vec4)) == 0_i);
    };

    "rect depth is written"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({0.0f, 0.0f}, {10.0f, 10.0f}, kRed, 0.0f));
        expect(raster.render(snap).has_value());
        expect(raster.depthAt(5, 5) < 1.0f);
        expect(raster.depthAt(50, 50) == 1.0_f);
    };
};

suite software_cursor_tests = [] {
    "cursor arrow pixels"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.cursors.push_back(cursor({0.0f, 0.0f}, kBlue));

        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(stats->cursors == 1_u);

        const Image& img = raster.image();
        expect(same(img.at(3, 2), kBlue));
        expect(same(img.at(1, 17), kClear));
        expect(same(img.at(0, 10), kClear));
    };

    "cursor draws above the topmost canvas rect"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({0.0f, 0.0f}, {30.0f, 30.0f}, kRed, kMaxCanvasZ));
        snap.cursors.push_back(cursor({0.0f, 0.0f}, kBlue));
        expect(raster.render(snap).has_value());
        expect(same(raster.image().at(3, 2), kBlue));
        expect(same(raster.image().at(25, 25), kRed));
    };

    "cursor does not write depth"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.cursors.push_back(cursor({0.0f, 0.0f}, kBlue));
        expect(raster.render(snap).has_value());
        expect(raster.depthAt(3, 2) == 1.0_f);
    };
};

suite software_glyph_tests = [] {
    "glyph samples the bound atlas"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        raster.bindAtlas(solidAtlas(4, 255));
        auto snap = emptyFrame();
        snap.glyphs.push_back(fullGlyph({10.0f, 10.0f}, {8.0f, 8.0f}, kWhite));

        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(stats->glyphs == 1_u);
        expect(same(raster.image().at(14, 14), kWhite));
        expect(same(raster.image().at(30, 30), kClear));
    };

    "empty atlas coverage is discarded"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        raster.bindAtlas(solidAtlas(4, 0));
        auto snap = emptyFrame();
        snap.glyphs.push_back(fullGlyph({10.0f, 10.0f}, {8.0f, 8.0f}, kWhite));
        expect(raster.render(snap).has_value());
        expect(same(raster.image().at(14, 14), kClear));
    };

    "glyphs draw over rects of any z"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        raster.bindAtlas(solidAtlas(4, 255));
        auto snap = emptyFrame();
        snap.rects.push_back(rect({0.0f, 0.0f}, {50.0f, 50.0f}, kRed, 500.0f));
        snap.glyphs.push_back(fullGlyph({10.0f, 10.0f}, {8.0f, 8.0f}, kWhite));
        expect(raster.render(snap).has_value());
        expect(same(raster.image().at(14, 14), kWhite));
        expect(same(raster.image().at(30, 30), kRed));
    };

    "glyphs skipped while no atlas is bound"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({0.0f, 0.0f}, {50.0f, 50.0f}, kRed));
        snap.glyphs.push_back(fullGlyph({10.0f, 10.0f}, {8.0f, 8.0f}, kWhite));

        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(stats->glyphsSkipped);
        expect(stats->glyphs == 0_u);
        expect(stats->drawCalls == 1_u);
        expect(same(raster.image().at(14, 14), kRed));
    };
};

suite software_frame_tests = [] {
    "stale projection drops the frame"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame(9);
        snap.viewportWidth = kWidth * 2;
        snap.rects.push_back(rect({0.0f, 0.0f}, {50.0f, 50.0f}, kRed));

        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(stats->dropped);
        expect(stats->frameId == 9_u);
        expect(same(raster.image().at(10, 10), kClear));
    };

    "resized target accepts matching snapshots"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        raster.resize(40, 30);
        FrameSnapshot snap;
        snap.viewportWidth = 40;
        snap.viewportHeight = 30;
        snap.camera = CameraUniform::identity(40.0f, 30.0f);
        snap.rects.push_back(rect({0.0f, 0.0f}, {40.0f, 30.0f}, kGreen));

        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(!stats->dropped);
        expect(raster.image().width == 40_u);
        expect(same(raster.image().at(39, 29), kGreen));
    };

    "malformed instances do not stop the frame"_test = [] {
        SoftwareRasterizer raster(kWidth, kHeight);
        auto snap = emptyFrame();
        snap.rects.push_back(rect({NAN, 0.0f}, {10.0f, 10.0f}, kRed));
        snap.rects.push_back(rect({20.0f, 20.0f}, {10.0f, 10.0f}, kGreen));
        auto stats = raster.render(snap);
        expect(stats.has_value());
        expect(stats->rejected == 1_u);
        expect(same(raster.image().at(25, 25), kGreen));
    };
};
