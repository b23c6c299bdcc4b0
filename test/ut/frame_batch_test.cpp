//=============================================================================
// FrameBatch Tests
//
// Draw order, empty-list skipping, glyph skip without an atlas, z sorting and
// stale projection detection.
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/frame-batch.h>
#include <limits>

using namespace boost::ut;
using namespace vellum;

namespace {

RectInstance rectAt(float z) {
    RectInstance r;
    r.size = {10.0f, 10.0f};
    r.zIndex = z;
    return r;
}

FrameSnapshot makeSnapshot(size_t rects, size_t glyphs, size_t cursors) {
    FrameSnapshot snap;
    snap.frameId = 42;
    snap.viewportWidth = 100;
    snap.viewportHeight = 80;
    snap.camera = CameraUniform::identity(100.0f, 80.0f);
    snap.rects.assign(rects, rectAt(0.0f));
    snap.glyphs.assign(glyphs, GlyphInstance{});
    snap.cursors.assign(cursors, CursorInstance{});
    return snap;
}

BatchOptions withAtlas() {
    BatchOptions options;
    options.atlasBound = true;
    return options;
}

} // namespace

suite frame_batch_order_tests = [] {
    "draws are rect, glyph, cursor"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(3, 5, 2), withAtlas());

        const auto& draws = batch.drawList();
        expect(draws.size() == 3_u);
        expect(draws[0].pipeline == PipelineKind::Rect);
        expect(draws[0].instanceCount == 3_u);
        expect(draws[1].pipeline == PipelineKind::Glyph);
        expect(draws[1].instanceCount == 5_u);
        expect(draws[2].pipeline == PipelineKind::Cursor);
        expect(draws[2].instanceCount == 2_u);
        expect(batch.frameId() == 42_u);
    };

    "empty lists issue no draw"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(0, 4, 1), withAtlas());
        const auto& draws = batch.drawList();
        expect(draws.size() == 2_u);
        expect(draws[0].pipeline == PipelineKind::Glyph);
        expect(draws[1].pipeline == PipelineKind::Cursor);
    };

    "empty frame has an empty draw list"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(0, 0, 0), withAtlas());
        expect(batch.drawList().empty());
        expect(batch.stats().drawCalls == 0_u);
    };

    "arenas shrink to the next frame"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(100, 50, 3), withAtlas());
        batch.assemble(makeSnapshot(2, 0, 1), withAtlas());
        expect(batch.rects().size() == 2_u);
        expect(batch.glyphs().empty());
        expect(batch.cursors().size() == 1_u);
        expect(batch.drawList().size() == 2_u);
    };

    "reset clears everything"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(1, 1, 1), withAtlas());
        batch.reset();
        expect(batch.drawList().empty());
        expect(batch.rects().empty());
        expect(batch.frameId() == 0_u);
    };

    "pipeline names"_test = [] {
        expect(pipelineName(PipelineKind::Rect) == "rect");
        expect(pipelineName(PipelineKind::Glyph) == "glyph");
        expect(pipelineName(PipelineKind::Cursor) == "cursor");
    };
};

suite frame_batch_glyph_tests = [] {
    "glyphs are skipped without an atlas"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(1, 6, 1), BatchOptions{});
        expect(batch.glyphsSkipped());
        expect(batch.glyphs().empty());

        const auto& draws = batch.drawList();
        expect(draws.size() == 2_u);
        expect(draws[0].pipeline == PipelineKind::Rect);
        expect(draws[1].pipeline == PipelineKind::Cursor);
        expect(batch.stats().glyphsSkipped);
    };

    "no glyphs means nothing skipped"_test = [] {
        FrameBatch batch;
        batch.assemble(makeSnapshot(1, 0, 0), BatchOptions{});
        expect(!batch.glyphsSkipped());
    };

    "binding the atlas restores glyphs"_test = [] {
        FrameBatch batch;
        auto snap = makeSnapshot(0, 3, 0);
        batch.assemble(snap, BatchOptions{});
        expect(batch.drawList().empty());
        batch.assemble(snap, withAtlas());
        expect(batch.drawList().size() == 1_u);
        expect(!batch.glyphsSkipped());
    };
};

suite frame_batch_sanitize_tests = [] {
    "rects sort by z with stable ties"_test = [] {
        FrameSnapshot snap = makeSnapshot(0, 0, 0);
        snap.rects = {rectAt(5.0f), rectAt(1.0f), rectAt(3.0f), rectAt(1.0f)};
        snap.rects[1].color = {1.0f, 0.0f, 0.0f, 1.0f};
        snap.rects[3].color = {0.0f, 1.0f, 0.0f, 1.0f};

        FrameBatch batch;
        batch.assemble(snap, withAtlas());
        const auto& rects = batch.rects();
        expect(rects[0].zIndex == 1.0_f);
        expect(rects[0].color.r == 1.0_f);
        expect(rects[1].zIndex == 1.0_f);
        expect(rects[1].color.g == 1.0_f);
        expect(rects[2].zIndex == 3.0_f);
        expect(rects[3].zIndex == 5.0_f);
    };

    "submission order kept when sorting is off"_test = [] {
        FrameSnapshot snap = makeSnapshot(0, 0, 0);
        snap.rects = {rectAt(5.0f), rectAt(1.0f)};
        BatchOptions options = withAtlas();
        options.sortRectsByZ = false;

        FrameBatch batch;
        batch.assemble(snap, options);
        expect(batch.rects()[0].zIndex == 5.0_f);
        expect(batch.rects()[1].zIndex == 1.0_f);
    };

    "malformed instances are dropped and counted"_test = [] {
        FrameSnapshot snap = makeSnapshot(2, 0, 2);
        snap.rects[0].position.x = std::numeric_limits<float>::quiet_NaN();
        snap.cursors[1].position.y = std::numeric_limits<float>::infinity();

        FrameBatch batch;
        batch.assemble(snap, withAtlas());
        FrameStats stats = batch.stats();
        expect(stats.rects == 1_u);
        expect(stats.cursors == 1_u);
        expect(stats.rejected == 2_u);
    };

    "snapshot is not modified"_test = [] {
        FrameSnapshot snap = makeSnapshot(1, 0, 0);
        snap.rects[0].zIndex = -4.0f;
        FrameBatch batch;
        batch.assemble(snap, withAtlas());
        expect(snap.rects[0].zIndex == -4.0_f);
        expect(batch.rects()[0].zIndex == 0.0_f);
    };
};

suite projection_tests = [] {
    "matching viewport is valid"_test = [] {
        auto snap = makeSnapshot(1, 0, 0);
        expect(validateProjection(snap, 100, 80).has_value());
    };

    "stale viewport is rejected"_test = [] {
        auto snap = makeSnapshot(1, 0, 0);
        auto res = validateProjection(snap, 200, 80);
        expect(!res.has_value());
        expect(res.error().message().find("stale projection") != std::string::npos);
    };

    "depth states per pipeline"_test = [] {
        auto rect = depthStateFor(PipelineKind::Rect);
        expect(rect.compare == DepthCompare::LessEqual);
        expect(rect.write);

        auto glyph = depthStateFor(PipelineKind::Glyph);
        expect(glyph.compare == DepthCompare::Always);
        expect(!glyph.write);

        auto cursor = depthStateFor(PipelineKind::Cursor);
        expect(cursor.compare == DepthCompare::LessEqual);
        expect(!cursor.write);
    };
};
