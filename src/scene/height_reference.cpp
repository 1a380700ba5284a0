/**
 * @file height_reference.cpp
 * @brief Height reference name conversions
 */

#include "geoclamp/scene/height_reference.h"
#include <algorithm>
#include <cctype>

namespace geoclamp::scene {

const char* height_reference_name(HeightReference reference)
{
    switch (reference) {
        case HeightReference::None:             return "NONE";
        case HeightReference::ClampToGround:    return "CLAMP_TO_GROUND";
        case HeightReference::RelativeToGround: return "RELATIVE_TO_GROUND";
    }
    return "UNKNOWN";
}

std::optional<HeightReference> parse_height_reference(const std::string& name)
{
    std::string v(name);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(c == '-' ? '_' : std::toupper(c));
    });

    if (v == "NONE") return HeightReference::None;
    if (v == "CLAMP_TO_GROUND") return HeightReference::ClampToGround;
    if (v == "RELATIVE_TO_GROUND") return HeightReference::RelativeToGround;
    return std::nullopt;
}

} // namespace geoclamp::scene
