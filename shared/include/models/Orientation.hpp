/**
 * @file Orientation.hpp
 * Artwork orientation, also the key of the mockup catalog.
 */
#pragma once
#include <optional>
#include <string>

namespace mockup {

enum class Orientation
{
    Vertical = 0,
    Horizontal = 1,
};

inline const char* toString(Orientation o)
{
    return o == Orientation::Vertical ? "vertical" : "horizontal";
}

inline std::optional<Orientation> parseOrientation(const std::string& tag)
{
    if (tag == "vertical") return Orientation::Vertical;
    if (tag == "horizontal") return Orientation::Horizontal;
    return std::nullopt;
}

}
