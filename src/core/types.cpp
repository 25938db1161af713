#include "photomosaic/core/types.hpp"
#include "photomosaic/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace photomosaic {

std::string color_mode_to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::RGB: return "RGB";
        case ColorMode::GRAYSCALE: return "GRAYSCALE";
        default: return "UNKNOWN";
    }
}

ColorMode string_to_color_mode(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (norm == "RGB") return ColorMode::RGB;
    if (norm == "GRAYSCALE" || norm == "L" || norm == "GRAY" || norm == "GREY") {
        return ColorMode::GRAYSCALE;
    }
    throw ConfigError("unknown color mode '" + s + "' (expected RGB or GRAYSCALE)");
}

} // namespace photomosaic
