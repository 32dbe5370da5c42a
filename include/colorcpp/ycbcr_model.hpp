// File: include/colorcpp/ycbcr_model.hpp
// Purpose: Parameter sets (forward matrix, inverse matrix, shift) for RGB <-> Y'CbCr.

#ifndef COLORCPP_YCBCR_MODEL_HPP
#define COLORCPP_YCBCR_MODEL_HPP

#include <opencv2/core.hpp>

#include "colorcpp/scalar_traits.hpp"

namespace colorcpp {

// Luma coefficients of the supported standards.
struct LumaCoefficients {
    double kr;
    double kb;
};

constexpr LumaCoefficients kBt601Coefficients{0.299, 0.114};
constexpr LumaCoefficients kBt709Coefficients{0.2126, 0.0722};
constexpr LumaCoefficients kBt2020Coefficients{0.2627, 0.0593};

/**
 * @brief Full-range RGB -> Y'CbCr matrix for the given luma coefficients.
 * Y = kr R + (1 - kr - kb) G + kb B, Cb = (B - Y) / (2 (1 - kb)), Cr = (R - Y) / (2 (1 - kr)).
 * @throws std::invalid_argument if kr or kb is outside (0, 1) or kr + kb >= 1
 */
cv::Matx33d luma_chroma_transform(double kr, double kb);

/**
 * @brief RGB -> YIQ matrix (NTSC).
 */
cv::Matx33d yiq_transform();

/**
 * @brief Numerical inverse of a forward transform.
 * @throws std::invalid_argument if the matrix is singular
 */
cv::Matx33d inverse_transform_of(const cv::Matx33d& forward);

/**
 * @brief Checks that forward * inverse is the identity within @p tolerance per element.
 * @throws std::invalid_argument if it is not
 */
void check_inverse_pair(const cv::Matx33d& forward, const cv::Matx33d& inverse, double tolerance = 1e-6);

/**
 * @brief Immutable RGB <-> Y'CbCr parameters for channel storage type T.
 *
 * The shift moves Cb/Cr onto the zero point of T's bipolar channels
 * (128 for uint8_t, 0 for signed and floating storage). Luma is never shifted.
 * Any other type exposing forward_transform(), inverse_transform() and shift()
 * with the same return types can be used in its place.
 */
template <typename T>
class YCbCrModel {
public:
    static YCbCrModel from_luma_coefficients(double kr, double kb) {
        const cv::Matx33d forward = luma_chroma_transform(kr, kb);
        return YCbCrModel(forward, inverse_transform_of(forward), default_shift());
    }

    static YCbCrModel from_luma_coefficients(const LumaCoefficients& coefficients) {
        return from_luma_coefficients(coefficients.kr, coefficients.kb);
    }

    // JPEG / JFIF: BT.601 coefficients, full range.
    static YCbCrModel jpeg() { return from_luma_coefficients(kBt601Coefficients); }
    static YCbCrModel bt709() { return from_luma_coefficients(kBt709Coefficients); }
    static YCbCrModel bt2020() { return from_luma_coefficients(kBt2020Coefficients); }

    static YCbCrModel yiq() {
        const cv::Matx33d forward = yiq_transform();
        return YCbCrModel(forward, inverse_transform_of(forward), default_shift());
    }

    static YCbCrModel custom(const cv::Matx33d& forward) {
        return YCbCrModel(forward, inverse_transform_of(forward), default_shift());
    }

    static YCbCrModel custom(const cv::Matx33d& forward, const cv::Matx33d& inverse) {
        check_inverse_pair(forward, inverse);
        return YCbCrModel(forward, inverse, default_shift());
    }

    static cv::Vec3d default_shift() {
        const double zero = static_cast<double>(ChannelScalarTraits<T>::bipolar_zero());
        return cv::Vec3d(0.0, zero, zero);
    }

    const cv::Matx33d& forward_transform() const { return forward_; }
    const cv::Matx33d& inverse_transform() const { return inverse_; }
    const cv::Vec3d& shift() const { return shift_; }

private:
    YCbCrModel(const cv::Matx33d& forward, const cv::Matx33d& inverse, const cv::Vec3d& shift)
        : forward_(forward), inverse_(inverse), shift_(shift) {}

    cv::Matx33d forward_;
    cv::Matx33d inverse_;
    cv::Vec3d shift_;
};

} // namespace colorcpp

#endif // COLORCPP_YCBCR_MODEL_HPP
