#ifndef SVG_GEOMETRY_COORD_UNITS_HPP
#define SVG_GEOMETRY_COORD_UNITS_HPP

#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"

namespace svggeo {

// patternUnits, patternContentUnits, clipPathUnits, ...
enum class CoordUnits {
    kUserSpaceOnUse,
    kObjectBoundingBox,
};

std::optional<CoordUnits> ParseCoordUnits(const std::string& text, ValueError& error);

} // namespace svggeo

#endif
