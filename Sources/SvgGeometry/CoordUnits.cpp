#include "SvgGeometry/CoordUnits.hpp"

#include "SvgGeometry/ValueParser.hpp"

namespace svggeo {

std::optional<CoordUnits> ParseCoordUnits(const std::string& text, ValueError& error) {
    ValueParser parser(text);
    const auto keyword = parser.ParseIdent(error);
    if (!keyword.has_value()) {
        return std::nullopt;
    }

    std::optional<CoordUnits> units;
    if (*keyword == "userSpaceOnUse") {
        units = CoordUnits::kUserSpaceOnUse;
    } else if (*keyword == "objectBoundingBox") {
        units = CoordUnits::kObjectBoundingBox;
    }

    if (!units.has_value() || !parser.IsExhausted()) {
        error = ValueError::Parse("expected userSpaceOnUse or objectBoundingBox");
        return std::nullopt;
    }
    return units;
}

} // namespace svggeo
