#include <gtest/gtest.h>
#include "colorcpp/ycbcr.hpp"
#include "test_helpers.hpp"
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

using colorcpp::BareYCbCr;
using colorcpp::OutOfGamutMode;
using colorcpp::Rgb;
using colorcpp::YCbCrModel;

namespace {

// Minimal model: passes values through unchanged. Exercises the static model contract.
struct IdentityModel {
    cv::Matx33d forward_transform() const { return cv::Matx33d::eye(); }
    cv::Matx33d inverse_transform() const { return cv::Matx33d::eye(); }
    cv::Vec3d shift() const { return cv::Vec3d(0.0, 0.0, 0.0); }
};

} // namespace

class YCbCrConversionTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (double r = 0.0; r <= 1.0; r += 0.2) {
            for (double g = 0.0; g <= 1.0; g += 0.25) {
                for (double b = 0.0; b <= 1.0; b += 0.5) {
                    samples_.push_back(Rgb<double>::from_channels(r, g, b));
                }
            }
        }
    }

    std::vector<Rgb<double>> samples_;
};

TEST_F(YCbCrConversionTest, JpegKnownValuesFloat) {
    const auto model = YCbCrModel<float>::jpeg();
    const auto red = BareYCbCr<float>::from_rgb_and_model(Rgb<float>::from_channels(1.0f, 0.0f, 0.0f), model);
    EXPECT_TRUE(CompareColors(red, BareYCbCr<float>::from_channels(0.299f, -0.168736f, 0.5f), 1e-5));

    const auto white = BareYCbCr<float>::from_rgb_and_model(Rgb<float>::broadcast(1.0f), model);
    EXPECT_TRUE(CompareColors(white, BareYCbCr<float>::from_channels(1.0f, 0.0f, 0.0f), 1e-6));
}

TEST_F(YCbCrConversionTest, JpegKnownValues8Bit) {
    const auto model = YCbCrModel<std::uint8_t>::jpeg();
    EXPECT_EQ(BareYCbCr<std::uint8_t>::from_rgb_and_model(Rgb<std::uint8_t>::broadcast(255), model),
              BareYCbCr<std::uint8_t>::from_channels(255, 128, 128));
    EXPECT_EQ(BareYCbCr<std::uint8_t>::from_rgb_and_model(Rgb<std::uint8_t>::broadcast(0), model),
              BareYCbCr<std::uint8_t>::from_channels(0, 128, 128));
    // Cr of pure red is 255.5 before saturation.
    EXPECT_EQ(BareYCbCr<std::uint8_t>::from_rgb_and_model(Rgb<std::uint8_t>::from_channels(255, 0, 0), model),
              BareYCbCr<std::uint8_t>::from_channels(76, 85, 255));
}

TEST_F(YCbCrConversionTest, RoundTripPreservesRgbForAllModels) {
    const std::vector<YCbCrModel<double>> models = {
        YCbCrModel<double>::jpeg(), YCbCrModel<double>::bt709(),
        YCbCrModel<double>::bt2020(), YCbCrModel<double>::yiq()
    };
    for (const auto& model : models) {
        for (const auto& rgb : samples_) {
            const auto ycbcr = BareYCbCr<double>::from_rgb_and_model(rgb, model);
            EXPECT_TRUE(CompareColors(ycbcr.to_rgb(model, OutOfGamutMode::Preserve), rgb, 1e-6));
        }
    }
}

TEST_F(YCbCrConversionTest, RoundTripFloatStorage) {
    const auto model = YCbCrModel<float>::bt709();
    for (const auto& sample : samples_) {
        const auto rgb = sample.color_cast<float>();
        const auto ycbcr = BareYCbCr<float>::from_rgb_and_model(rgb, model);
        EXPECT_TRUE(CompareColors(ycbcr.to_rgb(model, OutOfGamutMode::Preserve), rgb, 1e-5));
    }
}

TEST_F(YCbCrConversionTest, RoundTrip8BitWithinRounding) {
    const auto model = YCbCrModel<std::uint8_t>::jpeg();
    for (int r = 0; r <= 255; r += 51) {
        for (int g = 0; g <= 255; g += 51) {
            for (int b = 0; b <= 255; b += 51) {
                const auto rgb = Rgb<std::uint8_t>::from_channels(
                    static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g), static_cast<std::uint8_t>(b));
                const auto ycbcr = BareYCbCr<std::uint8_t>::from_rgb_and_model(rgb, model);
                EXPECT_TRUE(CompareColors(ycbcr.to_rgb(model, OutOfGamutMode::Preserve), rgb, 1.0));
            }
        }
    }
}

TEST_F(YCbCrConversionTest, ClipAlwaysNormalizes) {
    const auto model = YCbCrModel<float>::jpeg();
    const auto out_of_gamut = BareYCbCr<float>::from_channels(1.0f, 0.5f, 0.5f);
    EXPECT_FALSE(out_of_gamut.to_rgb(model, OutOfGamutMode::Preserve).is_normalized());
    EXPECT_TRUE(out_of_gamut.to_rgb(model, OutOfGamutMode::Clip).is_normalized());

    for (float y = 0.0f; y <= 1.0f; y += 0.25f) {
        for (float cb = -0.5f; cb <= 0.5f; cb += 0.25f) {
            for (float cr = -0.5f; cr <= 0.5f; cr += 0.25f) {
                const auto color = BareYCbCr<float>::from_channels(y, cb, cr);
                EXPECT_TRUE(color.to_rgb(model, OutOfGamutMode::Clip).is_normalized()) << color;
            }
        }
    }
}

TEST_F(YCbCrConversionTest, IntegerOutputSaturates) {
    const auto model = YCbCrModel<std::uint8_t>::jpeg();
    const auto rgb = BareYCbCr<std::uint8_t>::from_channels(255, 255, 255).to_rgb(model, OutOfGamutMode::Preserve);
    EXPECT_TRUE(rgb.is_normalized());
    EXPECT_EQ(rgb.red(), 255);
    EXPECT_EQ(rgb.blue(), 255);
}

TEST_F(YCbCrConversionTest, AcceptsAnyModelType) {
    const auto rgb = Rgb<float>::from_channels(0.1f, 0.2f, 0.3f);
    const auto ycbcr = BareYCbCr<float>::from_rgb_and_model(rgb, IdentityModel());
    EXPECT_EQ(ycbcr, BareYCbCr<float>::from_channels(0.1f, 0.2f, 0.3f));
    EXPECT_EQ(ycbcr.to_rgb(IdentityModel(), OutOfGamutMode::Preserve), rgb);
}

TEST_F(YCbCrConversionTest, BundledModel) {
    const auto model = YCbCrModel<double>::bt2020();
    const auto rgb = Rgb<double>::from_channels(0.25, 0.5, 0.75);
    const auto ycbcr = colorcpp::YCbCr<double>::from_rgb(rgb, model);
    EXPECT_EQ(ycbcr.color(), BareYCbCr<double>::from_rgb_and_model(rgb, model));
    EXPECT_TRUE(CompareColors(ycbcr.to_rgb(OutOfGamutMode::Preserve), rgb, 1e-9));

    const auto rebound = ycbcr.color().with_model(model);
    EXPECT_DOUBLE_EQ(rebound.luma(), ycbcr.luma());
    EXPECT_DOUBLE_EQ(rebound.cb(), ycbcr.cb());
    EXPECT_DOUBLE_EQ(rebound.cr(), ycbcr.cr());
}

// --- Channel-wise operations ---

TEST(BareYCbCrTest, AccessorsAndSetters) {
    auto color = BareYCbCr<std::uint8_t>::from_channels(10, 20, 30);
    EXPECT_EQ(color.luma(), 10);
    EXPECT_EQ(color.cb(), 20);
    EXPECT_EQ(color.cr(), 30);
    color.luma_mut() = 11;
    color.cb_mut() = 21;
    color.set_cr(31);
    EXPECT_EQ(color, BareYCbCr<std::uint8_t>::from_channels(11, 21, 31));
    color.set_luma(1);
    color.set_cb(2);
    color.cr_mut() = 3;
    EXPECT_EQ(color, BareYCbCr<std::uint8_t>::from_channels(1, 2, 3));
    EXPECT_EQ(BareYCbCr<std::uint8_t>(), BareYCbCr<std::uint8_t>::from_channels(0, 0, 0));
}

TEST(BareYCbCrTest, InvertUsesChannelKinds) {
    EXPECT_EQ(BareYCbCr<float>::from_channels(0.25f, 0.5f, -0.25f).invert(),
              BareYCbCr<float>::from_channels(0.75f, -0.5f, 0.25f));
    EXPECT_EQ(BareYCbCr<std::uint8_t>::from_channels(10, 128, 0).invert(),
              BareYCbCr<std::uint8_t>::from_channels(245, 127, 255));

    const auto color = BareYCbCr<std::int16_t>::from_channels(-300, 12, 32767);
    EXPECT_EQ(color.invert().invert(), color);
}

TEST(BareYCbCrTest, NormalizeUsesChannelKinds) {
    const auto color = BareYCbCr<float>::from_channels(1.2f, -1.5f, 0.3f);
    EXPECT_FALSE(color.is_normalized());
    EXPECT_EQ(color.normalize(), BareYCbCr<float>::from_channels(1.0f, -1.0f, 0.3f));
    EXPECT_TRUE(color.normalize().is_normalized());

    // Negative chroma is in range, negative luma is not.
    EXPECT_TRUE(BareYCbCr<float>::from_channels(0.5f, -0.9f, 0.9f).is_normalized());
    EXPECT_FALSE(BareYCbCr<float>::from_channels(-0.1f, 0.0f, 0.0f).is_normalized());
}

TEST(BareYCbCrTest, Lerp) {
    const auto a = BareYCbCr<std::uint8_t>::from_channels(0, 0, 255);
    const auto b = BareYCbCr<std::uint8_t>::from_channels(255, 255, 0);
    EXPECT_EQ(a.lerp(b, 0.5), BareYCbCr<std::uint8_t>::from_channels(127, 127, 128));
    EXPECT_EQ(a.lerp(b, 0.0), a);
    EXPECT_EQ(a.lerp(b, 1.0), b);

    const auto c = BareYCbCr<double>::from_channels(0.0, -1.0, 1.0);
    const auto d = BareYCbCr<double>::from_channels(1.0, 1.0, -1.0);
    EXPECT_TRUE(c.lerp(d, 0.25).ulps_eq(BareYCbCr<double>::from_channels(0.25, -0.5, 0.5)));
}

TEST(BareYCbCrTest, SliceRoundTrip) {
    const std::vector<float> values = {0.5f, -0.25f, 0.125f};
    const auto color = BareYCbCr<float>::from_slice(values);
    EXPECT_EQ(color, BareYCbCr<float>::from_channels(0.5f, -0.25f, 0.125f));

    const cv::Vec3f slice = color.as_slice();
    EXPECT_EQ(slice[0], 0.5f);
    EXPECT_EQ(slice[1], -0.25f);
    EXPECT_EQ(slice[2], 0.125f);
    EXPECT_EQ(BareYCbCr<float>::from_tuple(color.to_tuple()), color);

    EXPECT_THROW(BareYCbCr<float>::from_slice(slice.val, 2), std::invalid_argument);
}

TEST(BareYCbCrTest, ToleranceEquality) {
    const auto a = BareYCbCr<double>::from_channels(0.1 + 0.2, 0.0, -0.5);
    const auto b = BareYCbCr<double>::from_channels(0.3, 0.0, -0.5);
    EXPECT_TRUE(a.ulps_eq(b));
    EXPECT_TRUE(a.relative_eq(b));
    EXPECT_FALSE(a.relative_eq(BareYCbCr<double>::from_channels(0.3, 0.0, -0.49)));
}

TEST(BareYCbCrTest, ColorCast) {
    const auto bytes = BareYCbCr<std::uint8_t>::from_channels(255, 0, 255);
    EXPECT_TRUE(CompareColors(bytes.color_cast<float>(), BareYCbCr<float>::from_channels(1.0f, -1.0f, 1.0f), 1e-6));
    EXPECT_EQ(bytes.color_cast<float>().color_cast<std::uint8_t>(), bytes);
}

TEST(BareYCbCrTest, ColorCastKeepsNeutralChroma) {
    const auto neutral = BareYCbCr<std::uint8_t>::from_channels(90, 128, 128);

    const auto floats = neutral.color_cast<float>();
    EXPECT_EQ(floats.cb(), 0.0f);
    EXPECT_EQ(floats.cr(), 0.0f);

    const auto words = neutral.color_cast<std::uint16_t>();
    EXPECT_EQ(words.cb(), 32768);
    EXPECT_EQ(words.cr(), 32768);
    EXPECT_EQ(words.color_cast<std::uint8_t>(), neutral);

    // A gray converted in 8 bits and cast to float decodes as gray with the float model.
    const auto gray = Rgb<std::uint8_t>::from_channels(90, 90, 90);
    const auto ycbcr = BareYCbCr<std::uint8_t>::from_rgb_and_model(gray, YCbCrModel<std::uint8_t>::jpeg());
    const auto decoded = ycbcr.color_cast<float>().to_rgb(YCbCrModel<float>::jpeg(), OutOfGamutMode::Preserve);
    EXPECT_TRUE(CompareColors(decoded, gray.color_cast<float>(), 1e-6));
}

TEST(BareYCbCrTest, Prints) {
    std::ostringstream os;
    os << BareYCbCr<std::uint8_t>::from_channels(255, 128, 128);
    EXPECT_EQ(os.str(), "YCbCr(255, 128, 128)");
}
