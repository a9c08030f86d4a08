#include "SvgGeometry/Length.hpp"

#include "SvgGeometry/ValueParser.hpp"

namespace svggeo {

bool Unsigned::Validate(double value, ValueError& error) {
    if (value >= 0.0) {
        return true;
    }
    error = ValueError::Value("value must be non-negative");
    return false;
}

std::optional<RawLength> ParseRawLength(const std::string& text, ValueError& error) {
    ValueParser parser(text);

    const auto number = parser.ParseNumber(error);
    if (!number.has_value()) {
        return std::nullopt;
    }

    RawLength length;
    length.length = *number;

    // The unit has to follow the number directly: "10 px" is two tokens.
    if (parser.ConsumeChar('%')) {
        length.length = *number / 100.0;
        length.unit = LengthUnit::kPercent;
    } else if (parser.AtIdentStart()) {
        const auto unit = parser.ParseIdent(error);
        if (!unit.has_value()) {
            return std::nullopt;
        }
        if (*unit == "px") {
            length.unit = LengthUnit::kPx;
        } else if (*unit == "em") {
            length.unit = LengthUnit::kEm;
        } else if (*unit == "ex") {
            length.unit = LengthUnit::kEx;
        } else if (*unit == "in") {
            length.unit = LengthUnit::kIn;
        } else if (*unit == "cm") {
            length.unit = LengthUnit::kCm;
        } else if (*unit == "mm") {
            length.unit = LengthUnit::kMm;
        } else if (*unit == "pt") {
            length.unit = LengthUnit::kPt;
        } else if (*unit == "pc") {
            length.unit = LengthUnit::kPc;
        } else {
            error = ValueError::Parse("unknown length unit: " + *unit);
            return std::nullopt;
        }
    }

    if (!parser.IsExhausted()) {
        error = ValueError::Parse("unexpected trailing data: " + parser.Remaining());
        return std::nullopt;
    }
    return length;
}

double NormalizeRawLength(const RawLength& length, double viewport_basis, double dpi_basis, double font_size) {
    switch (length.unit) {
    case LengthUnit::kPx:
        return length.length;
    case LengthUnit::kPercent:
        return length.length * viewport_basis;
    case LengthUnit::kEm:
        return length.length * font_size;
    case LengthUnit::kEx:
        return length.length * font_size / 2.0;
    case LengthUnit::kIn:
        return length.length * dpi_basis;
    case LengthUnit::kCm:
        return length.length * dpi_basis / kCmPerInch;
    case LengthUnit::kMm:
        return length.length * dpi_basis / kMmPerInch;
    case LengthUnit::kPt:
        return length.length * dpi_basis / kPointsPerInch;
    case LengthUnit::kPc:
        return length.length * dpi_basis / kPicaPerInch;
    }
    return length.length;
}

} // namespace svggeo
