#ifndef COLORCPP_LOGGING_HPP
#define COLORCPP_LOGGING_HPP

#include <iostream>

namespace colorcpp {

// Verbose logging is off by default; the CLI turns it on with --verbose.
void set_logging_enabled(bool enabled);
bool logging_enabled();

} // namespace colorcpp

#define COLORCPP_LOG(message)                                              \
    do {                                                                   \
        if (::colorcpp::logging_enabled()) {                               \
            std::cout << "[COLORCPP LOG] " << message << std::endl;        \
        }                                                                  \
    } while (0)

#endif // COLORCPP_LOGGING_HPP
