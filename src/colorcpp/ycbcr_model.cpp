#include "colorcpp/ycbcr_model.hpp"
#include "colorcpp/logging.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace colorcpp {

namespace {

// Below this |det| a transform is treated as singular.
const double kSingularDeterminant = 1e-12;

// RGB to YIQ conversion matrix (NTSC)
const cv::Matx33d RGB2YIQ_MATRIX = {
    0.299,       0.587,       0.114,
    0.59590059, -0.27455667, -0.32134392,
    0.21153661, -0.52273617,  0.31119955
};

} // namespace

cv::Matx33d luma_chroma_transform(double kr, double kb) {
    if (!(kr > 0.0 && kr < 1.0) || !(kb > 0.0 && kb < 1.0)) {
        throw std::invalid_argument("Luma coefficients kr and kb must lie in (0, 1).");
    }
    if (kr + kb >= 1.0) {
        throw std::invalid_argument("Luma coefficients must satisfy kr + kb < 1.");
    }

    const double kg = 1.0 - kr - kb;
    const double cb_scale = 0.5 / (1.0 - kb);
    const double cr_scale = 0.5 / (1.0 - kr);
    COLORCPP_LOG("Building Y'CbCr transform: kr=" << kr << ", kg=" << kg << ", kb=" << kb);

    return cv::Matx33d(
        kr,             kg,             kb,
        -kr * cb_scale, -kg * cb_scale, 0.5,
        0.5,            -kg * cr_scale, -kb * cr_scale);
}

cv::Matx33d yiq_transform() {
    return RGB2YIQ_MATRIX;
}

cv::Matx33d inverse_transform_of(const cv::Matx33d& forward) {
    const double det = cv::determinant(forward);
    if (!std::isfinite(det) || std::abs(det) < kSingularDeterminant) {
        std::ostringstream msg;
        msg << "Forward transform is singular (determinant " << det << ").";
        throw std::invalid_argument(msg.str());
    }

    bool ok = false;
    const cv::Matx33d inverse = forward.inv(cv::DECOMP_LU, &ok);
    if (!ok) {
        throw std::invalid_argument("Forward transform could not be inverted.");
    }
    COLORCPP_LOG("Inverted forward transform, determinant " << det);
    return inverse;
}

void check_inverse_pair(const cv::Matx33d& forward, const cv::Matx33d& inverse, double tolerance) {
    const cv::Matx33d product = forward * inverse;
    const cv::Matx33d identity = cv::Matx33d::eye();
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            const double diff = std::abs(product(r, c) - identity(r, c));
            if (!(diff <= tolerance)) {
                std::ostringstream msg;
                msg << "Inverse transform does not invert the forward transform: element ("
                    << r << ", " << c << ") of forward * inverse differs from identity by " << diff
                    << " (tolerance " << tolerance << ").";
                throw std::invalid_argument(msg.str());
            }
        }
    }
}

} // namespace colorcpp
