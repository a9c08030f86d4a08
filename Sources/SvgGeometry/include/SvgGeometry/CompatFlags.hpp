#ifndef SVG_GEOMETRY_COMPAT_FLAGS_HPP
#define SVG_GEOMETRY_COMPAT_FLAGS_HPP

namespace svggeo {

struct CompatFlags {
    // Abort document construction on the first invalid attribute value
    // instead of logging it and keeping the attribute's initial value.
    bool strict_attributes = false;
    bool cache_resolved_patterns = true;
};

} // namespace svggeo

#endif
