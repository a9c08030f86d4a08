#ifndef SVG_GEOMETRY_RESOURCE_RESOLVER_HPP
#define SVG_GEOMETRY_RESOURCE_RESOLVER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "SvgGeometry/Types.hpp"

namespace svggeo {

class Document;

// External documents that "url#id" references may point into. Loading is the
// application's business; documents are registered here once they exist.
class ResourceResolver {
public:
    void AddDocument(const std::string& url, std::shared_ptr<const Document> document);

    std::shared_ptr<const Document> Lookup(const std::string& url) const;
    const Document* LookupBySerial(uint64_t serial) const;

    // Remote URLs are refused unless external resources are enabled.
    static bool ValidatePolicy(const std::string& url, const RenderOptions& options, RenderError& error);

private:
    std::map<std::string, std::shared_ptr<const Document>> documents_;
};

} // namespace svggeo

#endif
