#include "SvgGeometry/ResourceResolver.hpp"

#include <utility>

#include "SvgGeometry/SvgDom.hpp"

namespace svggeo {
namespace {

bool IsRemoteURL(const std::string& value) {
    return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

} // namespace

void ResourceResolver::AddDocument(const std::string& url, std::shared_ptr<const Document> document) {
    documents_[url] = std::move(document);
}

std::shared_ptr<const Document> ResourceResolver::Lookup(const std::string& url) const {
    const auto it = documents_.find(url);
    if (it == documents_.end()) {
        return nullptr;
    }
    return it->second;
}

const Document* ResourceResolver::LookupBySerial(uint64_t serial) const {
    for (const auto& entry : documents_) {
        if (entry.second && entry.second->serial() == serial) {
            return entry.second.get();
        }
    }
    return nullptr;
}

bool ResourceResolver::ValidatePolicy(const std::string& url, const RenderOptions& options, RenderError& error) {
    if (options.enable_external_resources) {
        return true;
    }

    if (IsRemoteURL(url)) {
        error.code = RenderErrorCode::kExternalResourceBlocked;
        error.message = "External resource blocked: " + url;
        return false;
    }
    return true;
}

} // namespace svggeo
