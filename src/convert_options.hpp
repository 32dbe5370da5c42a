// File: src/convert_options.hpp
// Purpose: Command-line configuration of the colorcpp_convert tool.

#ifndef COLORCPP_CONVERT_OPTIONS_HPP
#define COLORCPP_CONVERT_OPTIONS_HPP

#include <array>
#include <cmath>
#include <iostream>
#include <string>

#include "colorcpp/channel.hpp"
#include "colorcpp/scalar_traits.hpp"
#include "colorcpp/ycbcr.hpp"

// --- Default Configuration Values ---
// These can be overridden by command-line arguments
struct Config {
    std::string input_kind = "rgb";             // "rgb" or "ycbcr"
    std::array<double, 3> values = {0.0, 0.0, 0.0};
    bool values_set = false;                    // false: use the format's pure red
    std::string model = "jpeg";                 // jpeg, bt709, bt2020, yiq
    std::string format = "u8";                  // u8, u16, f32, f64
    colorcpp::OutOfGamutMode gamut = colorcpp::OutOfGamutMode::Clip;
    bool verbose = false;
};

enum class ParseResult { Ok, Help, Error };

void printUsage(const char* prog_name);

// Parses "a,b,c" into three finite doubles.
bool parseTriple(const std::string& text, std::array<double, 3>& out);

ParseResult parseArgs(int argc, char* argv[], Config& config);

// The values given on the command line, or pure red in T's channel range.
template <typename T>
std::array<double, 3> inputValues(const Config& config) {
    if (config.values_set) {
        return config.values;
    }
    return {static_cast<double>(colorcpp::ChannelScalarTraits<T>::unit_max()), 0.0, 0.0};
}

/**
 * @brief Casts a command-line value into a channel of storage T and kind Kind.
 * Warns on std::cerr when integer storage rounds or saturates the value, or when
 * a floating value lies outside the kind's canonical range.
 */
template <typename T, typename Kind>
T toChannelValue(double value) {
    const T result = colorcpp::ChannelScalarTraits<T>::from_double(value);
    if (colorcpp::ChannelScalarTraits<T>::is_integer) {
        if (static_cast<double>(result) != value) {
            std::cerr << "Warning: Value " << value << " stored as " << +result << "." << std::endl;
        }
    } else if (!colorcpp::Channel<T, Kind>(result).is_normalized()) {
        std::cerr << "Warning: Value " << value << " is outside the channel range ["
                  << +colorcpp::Channel<T, Kind>::min_bound() << ", "
                  << +colorcpp::Channel<T, Kind>::max_bound() << "]." << std::endl;
    }
    return result;
}

#endif // COLORCPP_CONVERT_OPTIONS_HPP
