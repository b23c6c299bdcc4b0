//=============================================================================
// AtlasImage Tests
//=============================================================================

#include <boost/ut.hpp>
#include <vellum/atlas-image.h>
#include <vellum/image.h>
#include <cmath>
#include <vector>

using namespace boost::ut;
using namespace vellum;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) < eps;
}

} // namespace

suite atlas_image_tests = [] {
    "coverage size must match"_test = [] {
        expect(!AtlasImage::fromCoverage(4, 4, std::vector<uint8_t>(15)).has_value());
        expect(!AtlasImage::fromCoverage(0, 4, {}).has_value());
        expect(AtlasImage::fromCoverage(4, 4, std::vector<uint8_t>(16)).has_value());
    };

    "rgba keeps the alpha channel"_test = [] {
        std::vector<uint8_t> rgba = {
            255, 255, 255, 10,
            0, 0, 0, 200,
        };
        auto atlas = AtlasImage::fromRgba(2, 1, rgba);
        expect(atlas.has_value());
        expect(atlas->at(0, 0) == 10_u);
        expect(atlas->at(1, 0) == 200_u);
        expect(!AtlasImage::fromRgba(2, 2, rgba).has_value());
    };

    "linear filtering between texel centers"_test = [] {
        auto atlas = AtlasImage::fromCoverage(2, 1, {0, 255});
        expect(atlas.has_value());
        expect(near(atlas->sample({0.25f, 0.5f}), 0.0f));
        expect(near(atlas->sample({0.5f, 0.5f}), 0.5f));
        expect(near(atlas->sample({0.75f, 0.5f}), 1.0f));
    };

    "addressing clamps to the edge"_test = [] {
        auto atlas = AtlasImage::fromCoverage(2, 1, {0, 255});
        expect(near(atlas->sample({0.0f, 0.5f}), 0.0f));
        expect(near(atlas->sample({1.0f, 0.5f}), 1.0f));
        expect(near(atlas->sample({-3.0f, 7.0f}), 0.0f));
    };

    "empty atlas samples zero"_test = [] {
        AtlasImage empty;
        expect(empty.empty());
        expect(empty.sample({0.5f, 0.5f}) == 0.0_f);
    };
};

suite image_tests = [] {
    "rgba8 rounds to nearest"_test = [] {
        Image img(2, 1, {0.0f, 0.5f, 1.0f, 1.0f});
        img.at(1, 0) = {2.0f, -1.0f, 0.25f, 0.0f};
        auto bytes = img.toRgba8();
        expect(bytes.size() == 8_u);
        expect(bytes[0] == 0_u);
        expect(bytes[1] == 128_u);
        expect(bytes[2] == 255_u);
        expect(bytes[3] == 255_u);
        expect(bytes[4] == 255_u);
        expect(bytes[5] == 0_u);
        expect(bytes[6] == 64_u);
        expect(bytes[7] == 0_u);
    };

    "fill overwrites every pixel"_test = [] {
        Image img(3, 3);
        img.fill({0.2f, 0.2f, 0.2f, 1.0f});
        expect(img.at(2, 2).a == 1.0_f);
        expect(img.at(0, 1).r == 0.2_f);
    };
};
