#ifndef COLORCPP_COLORCPP_HPP
#define COLORCPP_COLORCPP_HPP

#include "colorcpp/angle.hpp"
#include "colorcpp/approx.hpp"
#include "colorcpp/channel.hpp"
#include "colorcpp/color.hpp"
#include "colorcpp/logging.hpp"
#include "colorcpp/rgb.hpp"
#include "colorcpp/scalar_traits.hpp"
#include "colorcpp/ycbcr.hpp"
#include "colorcpp/ycbcr_model.hpp"

#endif // COLORCPP_COLORCPP_HPP
