/**
 * @file Orientation.hpp
 * Viewing angle of a trimmed vehicle cutout, derived from its width/height ratio.
 * Switches over Orientation are written without a default branch so a new value
 * shows up as a -Wswitch warning everywhere it is consumed.
 */
#pragma once
#include <optional>
#include <string>

enum class Orientation
{
    Side = 0,          // broadside view, much wider than tall
    FrontOrBack = 1,   // head-on or tail view
    ThreeQuarter = 2,  // diagonal marketing angle
};

inline const char* toString(Orientation o)
{
    switch (o)
    {
        case Orientation::Side: return "side";
        case Orientation::FrontOrBack: return "front_or_back";
        case Orientation::ThreeQuarter: return "three_quarter";
    }
    return "unknown";
}

// Accepts the names produced by toString() plus the short CLI spellings.
inline std::optional<Orientation> parseOrientation(const std::string& s)
{
    if (s == "side") return Orientation::Side;
    if (s == "front_or_back" || s == "front" || s == "back") return Orientation::FrontOrBack;
    if (s == "three_quarter" || s == "3/4") return Orientation::ThreeQuarter;
    return std::nullopt;
}
