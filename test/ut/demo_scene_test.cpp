//=============================================================================
// DemoScene Tests
//
// Block font atlas, scene snapshot contents and interaction through the
// snapshot path.
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/demo-scene.h>
#include <vellum/software-rasterizer.h>
#include <algorithm>
#include <cmath>
#include <vector>

using namespace boost::ut;
using namespace vellum;

suite block_font_tests = [] {
    "atlas has the requested size and some coverage"_test = [] {
        auto font = BlockFont::create(256);
        expect(font.has_value());
        const AtlasImage& atlas = font->atlas();
        expect(atlas.width == 256_u);
        expect(atlas.height == 256_u);
        expect(std::any_of(atlas.coverage.begin(), atlas.coverage.end(),
                           [](uint8_t c) { return c == 255; }));
    };

    "too small an atlas is an error"_test = [] {
        auto font = BlockFont::create(16);
        expect(!font.has_value());
    };

    "known and unknown glyphs"_test = [] {
        auto font = BlockFont::create(128);
        expect(font.has_value());
        expect(font->hasGlyph('A'));
        expect(font->hasGlyph('5'));
        expect(!font->hasGlyph('Z'));
        expect(!font->hasGlyph(' '));
    };

    "layout advances over unknown characters"_test = [] {
        auto font = BlockFont::create(128);
        std::vector<GlyphInstance> glyphs;
        font->layout("A A", {10.0f, 20.0f}, 18.0f, {1.0f, 1.0f, 1.0f, 1.0f}, glyphs);
        expect(glyphs.size() == 2_u);
        expect(glyphs[0].position.x == 10.0_f);
        float adv = BlockFont::advance(18.0f);
        expect(std::abs(glyphs[1].position.x - (10.0f + 2.0f * adv)) < 1e-4f);
        expect(glyphs[0].size.y == 18.0_f);
    };

    "glyph regions lie inside the atlas"_test = [] {
        auto font = BlockFont::create(256);
        std::vector<GlyphInstance> glyphs;
        font->layout("VELLUM 12345", {0.0f, 0.0f}, 10.0f, {1.0f, 1.0f, 1.0f, 1.0f}, glyphs);
        for (const auto& g : glyphs) {
            expect(g.uvMin.x >= 0.0f and g.uvMin.y >= 0.0f);
            expect(g.uvMax.x <= 1.0f and g.uvMax.y <= 1.0f);
            expect(g.uvMin.x < g.uvMax.x and g.uvMin.y < g.uvMax.y);
        }
    };
};

suite demo_scene_tests = [] {
    "scene content"_test = [] {
        auto scene = DemoScene::create(256, 3);
        expect(scene.has_value());
        expect(scene->nodes().size() == 12_u);
        expect(scene->peers().size() == 3_u);
    };

    "snapshot carries the camera viewport"_test = [] {
        auto scene = DemoScene::create(256, 2);
        Camera cam(320, 200);
        auto snap = scene->snapshot(cam, 0.0, 17);
        expect(snap->frameId == 17_u);
        expect(snap->viewportWidth == 320_u);
        expect(snap->viewportHeight == 200_u);
        expect(snap->rects.size() == 12_u);
        // Title (12 letters) and five 6-character badge labels
        expect(snap->glyphs.size() == 42_u);
        expect(snap->cursors.size() == 2_u);
    };

    "peer cursors use their peer color"_test = [] {
        auto scene = DemoScene::create(256, 1);
        auto snap = scene->snapshot(Camera(100, 100), 1.5, 1);
        const auto& peer = scene->peers()[0];
        expect(snap->cursors[0].color == cursorColorForPeer(peer.id));
        glm::vec2 pos = scene->peerPosition(peer, 1.5);
        expect(snap->cursors[0].position == pos);
    };

    "peers move over time"_test = [] {
        auto scene = DemoScene::create(256, 1);
        const auto& peer = scene->peers()[0];
        expect(scene->peerPosition(peer, 0.0) != scene->peerPosition(peer, 1.0));
    };

    "selection shows up in the next snapshot"_test = [] {
        auto scene = DemoScene::create(256, 0);
        // Inside the action button only
        expect(scene->selectAt({688.0f, 488.0f}));
        expect(scene->interaction().selected.value_or(0) == 7u);
        auto snap = scene->snapshot(Camera(800, 600), 0.0, 1);
        expect(snap->rects.size() == 17_u);
        // Selecting the same node again changes nothing
        expect(!scene->selectAt({688.0f, 488.0f}));
    };

    "hover tracks the topmost node"_test = [] {
        auto scene = DemoScene::create(256, 0);
        expect(scene->updateHover({100.0f, 130.0f}));
        expect(scene->interaction().hovered.value_or(0) == 8u);
        expect(scene->updateHover({5.0f, 5.0f}));
        expect(!scene->interaction().hovered.has_value());
    };

    "snapshots are independent of later edits"_test = [] {
        auto scene = DemoScene::create(256, 0);
        auto before = scene->snapshot(Camera(800, 600), 0.0, 1);
        scene->selectAt({688.0f, 488.0f});
        expect(before->rects.size() == 12_u);
    };

    "software render of the demo frame"_test = [] {
        auto scene = DemoScene::create(256, 3);
        Camera cam(800, 600);
        SoftwareRasterizer raster(800, 600);
        raster.bindAtlas(scene->font().atlas());
        auto stats = raster.render(*scene->snapshot(cam, 0.25, 1));
        expect(stats.has_value());
        expect(stats->drawCalls == 3_u);
        expect(stats->rejected == 0_u);
        expect(!stats->dropped);
    };
};
