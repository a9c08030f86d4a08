#ifndef SVG_GEOMETRY_ATTRIBUTES_HPP
#define SVG_GEOMETRY_ATTRIBUTES_HPP

#include <map>
#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/Log.hpp"

namespace svggeo {

using AttributeMap = std::map<std::string, std::string>;

// Parses attribute |name| with T::Parse. Missing and invalid values both come
// back empty; invalid ones are logged.
template <typename T>
std::optional<T> ParseAttribute(const AttributeMap& attributes, const std::string& name) {
    const auto it = attributes.find(name);
    if (it == attributes.end()) {
        return std::nullopt;
    }

    ValueError error;
    auto value = T::Parse(it->second, error);
    if (!value.has_value()) {
        Log()->debug("ignoring attribute with invalid value: {}", AttributeError{name, error}.ToString());
    }
    return value;
}

template <typename T>
T ParseAttributeOr(const AttributeMap& attributes, const std::string& name, const T& fallback) {
    return ParseAttribute<T>(attributes, name).value_or(fallback);
}

} // namespace svggeo

#endif
