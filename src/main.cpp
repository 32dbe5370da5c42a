#include <array>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

#include "colorcpp/colorcpp.hpp"
#include "convert_options.hpp"

template <typename T>
colorcpp::YCbCrModel<T> makeModel(const std::string& name) {
    if (name == "bt709") return colorcpp::YCbCrModel<T>::bt709();
    if (name == "bt2020") return colorcpp::YCbCrModel<T>::bt2020();
    if (name == "yiq") return colorcpp::YCbCrModel<T>::yiq();
    return colorcpp::YCbCrModel<T>::jpeg();
}

template <typename T>
int runConversion(const Config& config) {
    const colorcpp::YCbCrModel<T> model = makeModel<T>(config.model);
    const std::array<double, 3> values = inputValues<T>(config);

    if (config.input_kind == "rgb") {
        const auto rgb = colorcpp::Rgb<T>::from_channels(toChannelValue<T, colorcpp::BoundedKind>(values[0]),
                                                         toChannelValue<T, colorcpp::BoundedKind>(values[1]),
                                                         toChannelValue<T, colorcpp::BoundedKind>(values[2]));
        const auto ycbcr = colorcpp::BareYCbCr<T>::from_rgb_and_model(rgb, model);
        const auto round_trip = ycbcr.to_rgb(model, config.gamut);
        const auto hue = rgb.template color_cast<double>().template get_hue<colorcpp::Degrees<double>>();

        std::cout << "Input:      " << rgb << std::endl;
        std::cout << "YCbCr:      " << ycbcr << std::endl;
        std::cout << "Round trip: " << round_trip << std::endl;
        std::cout << "Chroma:     " << +rgb.get_chroma() << std::endl;
        std::cout << "Hue:        " << hue.value << " deg" << std::endl;
    } else {
        const auto ycbcr = colorcpp::BareYCbCr<T>::from_channels(toChannelValue<T, colorcpp::PosNormalKind>(values[0]),
                                                                 toChannelValue<T, colorcpp::BipolarKind>(values[1]),
                                                                 toChannelValue<T, colorcpp::BipolarKind>(values[2]));
        const auto rgb = ycbcr.to_rgb(model, config.gamut);
        const auto round_trip = colorcpp::BareYCbCr<T>::from_rgb_and_model(rgb, model);

        std::cout << "Input:      " << ycbcr << std::endl;
        std::cout << "RGB:        " << rgb << (rgb.is_normalized() ? "" : " (out of gamut)") << std::endl;
        std::cout << "Round trip: " << round_trip << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Config config;
    switch (parseArgs(argc, argv, config)) {
        case ParseResult::Help:
            return 0;
        case ParseResult::Error:
            return 1;
        case ParseResult::Ok:
            break;
    }

    colorcpp::set_logging_enabled(config.verbose);
    COLORCPP_LOG("Using OpenCV version: " << CV_VERSION);
    COLORCPP_LOG("Input: " << config.input_kind << ", model: " << config.model << ", format: " << config.format
                 << ", gamut: " << (config.gamut == colorcpp::OutOfGamutMode::Clip ? "clip" : "preserve"));

    try {
        if (config.format == "u16") {
            return runConversion<std::uint16_t>(config);
        } else if (config.format == "f32") {
            return runConversion<float>(config);
        } else if (config.format == "f64") {
            return runConversion<double>(config);
        }
        return runConversion<std::uint8_t>(config);
    } catch (const std::exception& e) {
        std::cerr << "Error during conversion: " << e.what() << std::endl;
        return 1;
    }
}
