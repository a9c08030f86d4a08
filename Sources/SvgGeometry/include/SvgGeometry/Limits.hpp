#ifndef SVG_GEOMETRY_LIMITS_HPP
#define SVG_GEOMETRY_LIMITS_HPP

#include <cstddef>

namespace svggeo {

// Maximum number of url(#foo) / href references resolved during one pass.
// Documents that nest <use> or <pattern> references to multiply the amount of
// work exponentially hit this limit instead of running for hours.
constexpr size_t kMaxReferencedElements = 500000;

// Maximum number of elements accepted while loading a document.
constexpr size_t kMaxLoadedElements = 1000000;

// Maximum number of attributes on a single element.
constexpr size_t kMaxLoadedAttributes = 65535;

// Maximum nesting depth of elements. The element tree is torn down
// recursively, so this bounds stack use for pathologically deep documents.
constexpr size_t kMaxElementDepth = 1024;

} // namespace svggeo

#endif
