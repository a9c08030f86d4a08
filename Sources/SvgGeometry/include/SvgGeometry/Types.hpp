#ifndef SVG_GEOMETRY_TYPES_HPP
#define SVG_GEOMETRY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "SvgGeometry/Limits.hpp"

namespace svggeo {

enum class RenderErrorCode : int32_t {
    kNone = 0,
    kInvalidDocument = 1,
    kExternalResourceBlocked = 2,
    kExternalResourceFailed = 3,
    kLimitExceeded = 4,
    kIdNotFound = 5,
    kInvalidId = 6,
    kRenderFailed = 7,
};

struct RenderError {
    RenderErrorCode code = RenderErrorCode::kNone;
    std::string message;
};

struct RenderOptions {
    int32_t viewport_width = 0;
    int32_t viewport_height = 0;
    double dpi_x = 96.0;
    double dpi_y = 96.0;
    double default_font_size = 12.0;
    size_t max_referenced_elements = kMaxReferencedElements;
    size_t max_loaded_elements = kMaxLoadedElements;
    bool enable_external_resources = false;
    bool enable_logging = false;
};

struct Point {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

struct Color {
    bool is_valid = false;
    bool is_current_color = false;
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.is_valid == b.is_valid && a.is_current_color == b.is_current_color && a.r == b.r && a.g == b.g &&
           a.b == b.b && a.a == b.a;
}

struct Dpi {
    double x = 96.0;
    double y = 96.0;
};

struct XmlNode {
    std::string name;
    std::map<std::string, std::string> attributes;
    std::vector<XmlNode> children;
    std::string text;
};

} // namespace svggeo

#endif
