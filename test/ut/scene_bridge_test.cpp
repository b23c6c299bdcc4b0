//=============================================================================
// Scene Bridge Tests
//
// Node to rect conversion, interaction overlays and hit testing.
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/scene-bridge.h>
#include <vector>

using namespace boost::ut;
using namespace vellum;

namespace {

SceneNode node(uint64_t id, NodeKind kind, Bounds bounds) {
    SceneNode n;
    n.id = id;
    n.kind = kind;
    n.bounds = bounds;
    return n;
}

std::vector<SceneNode> twoNodes() {
    return {
        node(10, NodeKind::Rect, {0.0f, 0.0f, 100.0f, 100.0f}),
        node(20, NodeKind::Frame, {50.0f, 50.0f, 100.0f, 60.0f}),
    };
}

} // namespace

suite collect_tests = [] {
    "z follows node order"_test = [] {
        auto nodes = twoNodes();
        std::vector<RectInstance> rects;
        collectRects(nodes, rects);
        expect(rects.size() == 2_u);
        expect(rects[0].zIndex == 0.0_f);
        expect(rects[1].zIndex == 1.0_f);
        expect(rects[1].position.x == 50.0_f);
        expect(rects[1].size.y == 60.0_f);
    };

    "unset color uses the kind default"_test = [] {
        auto nodes = twoNodes();
        nodes[0].color = glm::vec4(0.1f, 0.2f, 0.3f, 1.0f);
        std::vector<RectInstance> rects;
        collectRects(nodes, rects);
        expect(rects[0].color.g == 0.2_f);
        expect(rects[1].color == defaultColorFor(NodeKind::Frame));
    };

    "ellipse renders as a pill"_test = [] {
        std::vector<SceneNode> nodes = {node(1, NodeKind::Ellipse, {0.0f, 0.0f, 80.0f, 40.0f})};
        std::vector<RectInstance> rects;
        collectRects(nodes, rects);
        expect(rects[0].borderRadius >= 40.0f);
    };

    "appends after existing rects"_test = [] {
        std::vector<RectInstance> rects(3);
        collectRects(twoNodes(), rects);
        expect(rects.size() == 5_u);
    };

    "direct rects keep caller colors"_test = [] {
        auto rects = collectDirect({
            {Bounds{1.0f, 2.0f, 3.0f, 4.0f}, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f)},
            {Bounds{5.0f, 6.0f, 7.0f, 8.0f}, glm::vec4(0.0f, 1.0f, 0.0f, 1.0f)},
        });
        expect(rects.size() == 2_u);
        expect(rects[1].position.x == 5.0_f);
        expect(rects[1].color.g == 1.0_f);
        expect(rects[1].zIndex == 1.0_f);
    };
};

suite overlay_tests = [] {
    "no interaction adds nothing"_test = [] {
        std::vector<RectInstance> rects;
        appendOverlays(twoNodes(), Interaction{}, rects);
        expect(rects.empty());
    };

    "hover adds a tint over the node"_test = [] {
        Interaction ia;
        ia.hovered = 20;
        std::vector<RectInstance> rects;
        appendOverlays(twoNodes(), ia, rects);
        expect(rects.size() == 1_u);
        expect(rects[0].zIndex == kHoverZ);
        expect(rects[0].position.x == 50.0_f);
        expect(rects[0].color.a < 0.5f);
    };

    "selection adds a fill and four border strips"_test = [] {
        Interaction ia;
        ia.selected = 10;
        std::vector<RectInstance> rects;
        appendOverlays(twoNodes(), ia, rects);
        expect(rects.size() == 5_u);
        expect(rects[0].zIndex == kSelectionZ);

        const RectInstance& top = rects[1];
        expect(top.zIndex == kSelectionBorderZ);
        expect(top.position.x == -kSelectionBorderWidth);
        expect(top.position.y == -kSelectionBorderWidth);
        expect(top.size.x == 100.0f + 2.0f * kSelectionBorderWidth);
        expect(top.size.y == kSelectionBorderWidth);

        const RectInstance& right = rects[4];
        expect(right.position.x == 100.0_f);
        expect(right.size.y == 100.0_f);
    };

    "hovering the selection draws no tint"_test = [] {
        Interaction ia;
        ia.hovered = 10;
        ia.selected = 10;
        std::vector<RectInstance> rects;
        appendOverlays(twoNodes(), ia, rects);
        expect(rects.size() == 5_u);
        for (const auto& r : rects) expect(r.zIndex != kHoverZ);
    };

    "unknown ids are ignored"_test = [] {
        Interaction ia;
        ia.hovered = 99;
        ia.selected = 98;
        std::vector<RectInstance> rects;
        appendOverlays(twoNodes(), ia, rects);
        expect(rects.empty());
    };
};

suite hit_test_tests = [] {
    "topmost node wins"_test = [] {
        auto hit = hitTest(twoNodes(), {75.0f, 75.0f});
        expect(hit.has_value());
        expect(*hit == 20_u);
    };

    "lower node hit outside the overlap"_test = [] {
        auto hit = hitTest(twoNodes(), {10.0f, 10.0f});
        expect(hit.has_value());
        expect(*hit == 10_u);
    };

    "empty canvas misses"_test = [] {
        expect(!hitTest(twoNodes(), {500.0f, 500.0f}).has_value());
        expect(!hitTest({}, {0.0f, 0.0f}).has_value());
    };

    "bounds include their edges"_test = [] {
        Bounds b{0.0f, 0.0f, 10.0f, 10.0f};
        expect(b.contains({0.0f, 0.0f}));
        expect(b.contains({10.0f, 10.0f}));
        expect(!b.contains({10.1f, 5.0f}));
    };
};
