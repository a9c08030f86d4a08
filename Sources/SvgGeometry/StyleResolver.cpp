#include "SvgGeometry/StyleResolver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <unordered_map>
#include <vector>

#include "SvgGeometry/Log.hpp"

namespace svggeo {
namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitCssFunctionArgs(const std::string& args) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : args) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c)) || c == '/') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<float> ParseColorComponent(const std::string& value, float scale) {
    char* end_ptr = nullptr;
    const float parsed = std::strtof(value.c_str(), &end_ptr);
    if (end_ptr == value.c_str()) {
        return std::nullopt;
    }
    if (*end_ptr == '%') {
        return std::clamp(parsed / 100.0f, 0.0f, 1.0f);
    }
    if (*end_ptr != '\0') {
        return std::nullopt;
    }
    return std::clamp(parsed / scale, 0.0f, 1.0f);
}

std::optional<Color> ParseFunctionColor(const std::string& lower) {
    const auto open = lower.find('(');
    const auto close = lower.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close <= open + 1 || close + 1 != lower.size()) {
        return std::nullopt;
    }

    const auto name = Trim(lower.substr(0, open));
    const auto args = SplitCssFunctionArgs(lower.substr(open + 1, close - open - 1));
    if ((name != "rgb" && name != "rgba") || args.size() < 3 || args.size() > 4) {
        return std::nullopt;
    }

    Color color;
    color.is_valid = true;
    const auto r = ParseColorComponent(args[0], 255.0f);
    const auto g = ParseColorComponent(args[1], 255.0f);
    const auto b = ParseColorComponent(args[2], 255.0f);
    const auto a = args.size() == 4 ? ParseColorComponent(args[3], 1.0f) : std::optional<float>(1.0f);
    if (!r || !g || !b || !a) {
        return std::nullopt;
    }
    color.r = *r;
    color.g = *g;
    color.b = *b;
    color.a = *a;
    return color;
}

std::optional<Color> ParseHexColor(const std::string& lower) {
    const std::string digits = lower.substr(1);
    if (digits.find_first_not_of("0123456789abcdef") != std::string::npos) {
        return std::nullopt;
    }

    auto channel = [&](size_t index, size_t width) {
        const std::string hex = width == 1 ? std::string(2, digits[index]) : digits.substr(index * 2, 2);
        return static_cast<float>(std::stoi(hex, nullptr, 16)) / 255.0f;
    };

    Color color;
    color.is_valid = true;
    if (digits.size() == 3 || digits.size() == 4) {
        color.r = channel(0, 1);
        color.g = channel(1, 1);
        color.b = channel(2, 1);
        color.a = digits.size() == 4 ? channel(3, 1) : 1.0f;
        return color;
    }
    if (digits.size() == 6 || digits.size() == 8) {
        color.r = channel(0, 2);
        color.g = channel(1, 2);
        color.b = channel(2, 2);
        color.a = digits.size() == 8 ? channel(3, 2) : 1.0f;
        return color;
    }
    return std::nullopt;
}

Color NamedColor(float r, float g, float b, float a = 1.0f) {
    Color color;
    color.is_valid = true;
    color.r = r;
    color.g = g;
    color.b = b;
    color.a = a;
    return color;
}

std::optional<Color> ParseNamedColor(const std::string& lower) {
    static const std::unordered_map<std::string, Color> kNamedColors = {
        {"black", NamedColor(0.0f, 0.0f, 0.0f)},
        {"white", NamedColor(1.0f, 1.0f, 1.0f)},
        {"red", NamedColor(1.0f, 0.0f, 0.0f)},
        {"green", NamedColor(0.0f, 0.5019608f, 0.0f)},
        {"blue", NamedColor(0.0f, 0.0f, 1.0f)},
        {"yellow", NamedColor(1.0f, 1.0f, 0.0f)},
        {"orange", NamedColor(1.0f, 0.64705884f, 0.0f)},
        {"purple", NamedColor(0.5019608f, 0.0f, 0.5019608f)},
        {"gray", NamedColor(0.5019608f, 0.5019608f, 0.5019608f)},
        {"grey", NamedColor(0.5019608f, 0.5019608f, 0.5019608f)},
        {"cyan", NamedColor(0.0f, 1.0f, 1.0f)},
        {"aqua", NamedColor(0.0f, 1.0f, 1.0f)},
        {"magenta", NamedColor(1.0f, 0.0f, 1.0f)},
        {"fuchsia", NamedColor(1.0f, 0.0f, 1.0f)},
        {"lime", NamedColor(0.0f, 1.0f, 0.0f)},
        {"navy", NamedColor(0.0f, 0.0f, 0.5019608f)},
        {"maroon", NamedColor(0.5019608f, 0.0f, 0.0f)},
        {"olive", NamedColor(0.5019608f, 0.5019608f, 0.0f)},
        {"teal", NamedColor(0.0f, 0.5019608f, 0.5019608f)},
        {"silver", NamedColor(0.7529412f, 0.7529412f, 0.7529412f)},
    };

    const auto it = kNamedColors.find(lower);
    if (it == kNamedColors.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Absolute size keywords step by a factor of 1.2 around medium (12pt).
Length<Both> KeywordSize(double step) {
    return Length<Both>(12.0 * std::pow(1.2, step) / kPointsPerInch, LengthUnit::kIn);
}

std::optional<double> ParseOpacity(const std::string& value) {
    const auto trimmed = Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    char* end_ptr = nullptr;
    double parsed = std::strtod(trimmed.c_str(), &end_ptr);
    if (end_ptr == trimmed.c_str()) {
        return std::nullopt;
    }
    if (*end_ptr == '%') {
        parsed /= 100.0;
        ++end_ptr;
    }
    if (*end_ptr != '\0' || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return std::clamp(parsed, 0.0, 1.0);
}

} // namespace

double ComputedValues::FontSizePx(const Dpi& dpi) const {
    const double length = font_size.length();
    const double basis = Both::Normalize(dpi.x, dpi.y);

    switch (font_size.unit()) {
    case LengthUnit::kPx:
    case LengthUnit::kPercent:
        return length;
    // A computed font size is never relative; if one slips through, assume
    // the 12px default.
    case LengthUnit::kEm:
        return length * 12.0;
    case LengthUnit::kEx:
        return length * 12.0 / 2.0;
    case LengthUnit::kIn:
        return length * basis;
    case LengthUnit::kCm:
        return length * basis / kCmPerInch;
    case LengthUnit::kMm:
        return length * basis / kMmPerInch;
    case LengthUnit::kPt:
        return length * basis / kPointsPerInch;
    case LengthUnit::kPc:
        return length * basis / kPicaPerInch;
    }
    return length;
}

std::optional<Color> StyleResolver::ParseColor(const std::string& value) {
    const auto lower = Lower(Trim(value));
    if (lower.empty()) {
        return std::nullopt;
    }
    if (lower == "currentcolor") {
        Color color;
        color.is_valid = true;
        color.is_current_color = true;
        return color;
    }
    if (lower == "transparent") {
        return NamedColor(0.0f, 0.0f, 0.0f, 0.0f);
    }
    if (lower[0] == '#') {
        return ParseHexColor(lower);
    }
    if (lower.rfind("rgb", 0) == 0) {
        return ParseFunctionColor(lower);
    }
    return ParseNamedColor(lower);
}

std::optional<Length<Both>> StyleResolver::ComputeFontSize(const std::string& value, const Length<Both>& parent) {
    const auto keyword = Lower(Trim(value));
    if (keyword == "smaller") {
        return Length<Both>(parent.length() / 1.2, parent.unit());
    }
    if (keyword == "larger") {
        return Length<Both>(parent.length() * 1.2, parent.unit());
    }
    if (keyword == "xx-small") {
        return KeywordSize(-3.0);
    }
    if (keyword == "x-small") {
        return KeywordSize(-2.0);
    }
    if (keyword == "small") {
        return KeywordSize(-1.0);
    }
    if (keyword == "medium") {
        return KeywordSize(0.0);
    }
    if (keyword == "large") {
        return KeywordSize(1.0);
    }
    if (keyword == "x-large") {
        return KeywordSize(2.0);
    }
    if (keyword == "xx-large") {
        return KeywordSize(3.0);
    }

    ValueError error;
    const auto size = ULength<Both>::Parse(value, error);
    if (!size.has_value()) {
        Log()->debug("ignoring font-size \"{}\": {}", value, error.ToString());
        return std::nullopt;
    }

    switch (size->unit()) {
    case LengthUnit::kPercent:
    case LengthUnit::kEm:
        return Length<Both>(parent.length() * size->length(), parent.unit());
    case LengthUnit::kEx:
        return Length<Both>(parent.length() * size->length() / 2.0, parent.unit());
    default:
        return Length<Both>(size->length(), size->unit());
    }
}

std::map<std::string, std::string> StyleResolver::ParseInlineStyle(const std::string& style_text) {
    std::map<std::string, std::string> out;
    std::stringstream stream(style_text);
    std::string token;
    while (std::getline(stream, token, ';')) {
        const auto separator = token.find(':');
        if (separator == std::string::npos) {
            continue;
        }
        const auto key = Lower(Trim(token.substr(0, separator)));
        const auto value = Trim(token.substr(separator + 1));
        if (!key.empty() && !value.empty()) {
            out[key] = value;
        }
    }
    return out;
}

ComputedValues StyleResolver::Resolve(const std::map<std::string, std::string>& attributes,
                                      const ComputedValues* parent,
                                      const RenderOptions& options) const {
    ComputedValues values;
    if (parent != nullptr) {
        values = *parent;
    } else {
        values.font_size = Length<Both>(options.default_font_size, LengthUnit::kPx);
    }
    // opacity is not inherited.
    values.opacity = 1.0;

    const auto style_it = attributes.find("style");
    const auto inline_style = style_it != attributes.end() ? ParseInlineStyle(style_it->second) : std::map<std::string, std::string>{};

    auto read_value = [&](const std::string& key) -> std::optional<std::string> {
        const auto inline_it = inline_style.find(key);
        if (inline_it != inline_style.end()) {
            return inline_it->second;
        }
        const auto attr_it = attributes.find(key);
        if (attr_it != attributes.end()) {
            return attr_it->second;
        }
        return std::nullopt;
    };

    if (const auto font_size = read_value("font-size"); font_size.has_value() && Trim(*font_size) != "inherit") {
        const auto computed = ComputeFontSize(*font_size, values.font_size);
        if (computed.has_value()) {
            values.font_size = *computed;
        }
    }

    if (const auto opacity = read_value("opacity"); opacity.has_value()) {
        const auto parsed = ParseOpacity(*opacity);
        if (parsed.has_value()) {
            values.opacity = *parsed;
        } else {
            Log()->debug("ignoring opacity \"{}\"", *opacity);
        }
    }

    if (const auto color = read_value("color"); color.has_value()) {
        const auto parsed = ParseColor(*color);
        if (parsed.has_value() && !parsed->is_current_color) {
            values.color = *parsed;
        } else if (!parsed.has_value()) {
            Log()->debug("ignoring color \"{}\"", *color);
        }
    }

    if (const auto fill = read_value("fill"); fill.has_value() && Trim(*fill) != "inherit") {
        values.fill_paint = Trim(*fill);
    }
    if (const auto stroke = read_value("stroke"); stroke.has_value() && Trim(*stroke) != "inherit") {
        values.stroke_paint = Trim(*stroke);
    }

    return values;
}

} // namespace svggeo
