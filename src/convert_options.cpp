#include "convert_options.hpp"

#include <sstream>
#include <stdexcept>

void printUsage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options]\n\n"
              << "Options:\n"
              << "  --rgb <r,g,b>        Convert an RGB color (default: pure red in the chosen format)\n"
              << "  --ycbcr <y,cb,cr>    Convert a Y'CbCr color instead\n"
              << "  --model <name>       jpeg, bt709, bt2020 or yiq (default: jpeg)\n"
              << "  --format <name>      Channel storage: u8, u16, f32 or f64 (default: u8)\n"
              << "                       Floating formats take RGB and luma in [0,1], chroma in [-1,1]\n"
              << "  --gamut <mode>       Out-of-gamut handling: preserve or clip (default: clip)\n"
              << "  --verbose            Enable library logging\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

bool parseTriple(const std::string& text, std::array<double, 3>& out) {
    std::stringstream ss(text);
    std::string value_str;
    size_t count = 0;
    while (std::getline(ss, value_str, ',')) {
        if (count >= out.size()) {
            return false;
        }
        try {
            size_t consumed = 0;
            const double value = std::stod(value_str, &consumed);
            if (consumed != value_str.size() || !std::isfinite(value)) {
                return false;
            }
            out[count] = value;
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
        ++count;
    }
    return count == out.size();
}

ParseResult parseArgs(int argc, char* argv[], Config& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return ParseResult::Help;
        } else if ((arg == "--rgb" || arg == "--ycbcr") && i + 1 < argc) {
            config.input_kind = arg.substr(2);
            if (!parseTriple(argv[++i], config.values)) {
                std::cerr << "Error: " << arg << " expects three comma separated finite numbers\n";
                return ParseResult::Error;
            }
            config.values_set = true;
        } else if (arg == "--model" && i + 1 < argc) {
            config.model = argv[++i];
            if (config.model != "jpeg" && config.model != "bt709" && config.model != "bt2020" && config.model != "yiq") {
                std::cerr << "Error: Invalid model '" << config.model << "'. Must be jpeg, bt709, bt2020 or yiq.\n";
                return ParseResult::Error;
            }
        } else if (arg == "--format" && i + 1 < argc) {
            config.format = argv[++i];
            if (config.format != "u8" && config.format != "u16" && config.format != "f32" && config.format != "f64") {
                std::cerr << "Error: Invalid format '" << config.format << "'. Must be u8, u16, f32 or f64.\n";
                return ParseResult::Error;
            }
        } else if (arg == "--gamut" && i + 1 < argc) {
            std::string mode = argv[++i];
            if (mode == "preserve") {
                config.gamut = colorcpp::OutOfGamutMode::Preserve;
            } else if (mode == "clip") {
                config.gamut = colorcpp::OutOfGamutMode::Clip;
            } else {
                std::cerr << "Error: Invalid gamut mode '" << mode << "'. Must be 'preserve' or 'clip'.\n";
                return ParseResult::Error;
            }
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            std::cerr << "Error: Unknown or invalid argument: " << arg << std::endl;
            printUsage(argv[0]);
            return ParseResult::Error;
        }
    }
    return ParseResult::Ok;
}
