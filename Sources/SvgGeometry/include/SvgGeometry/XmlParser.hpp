#ifndef SVG_GEOMETRY_XML_PARSER_HPP
#define SVG_GEOMETRY_XML_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "SvgGeometry/Limits.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

// Small non-validating XML reader producing the element tree SvgDom builds
// documents from. Internal DTD entities are expanded; everything else in the
// DOCTYPE is ignored.
class XmlParser {
public:
    XmlParser(size_t max_loaded_elements = kMaxLoadedElements,
              size_t max_loaded_attributes = kMaxLoadedAttributes,
              size_t max_element_depth = kMaxElementDepth);

    std::optional<XmlNode> Parse(const std::string& text, RenderError& error) const;

private:
    size_t max_loaded_elements_;
    size_t max_loaded_attributes_;
    size_t max_element_depth_;
};

} // namespace svggeo

#endif
