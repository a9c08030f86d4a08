#include "SvgGeometry/PaintServer.hpp"

#include <utility>

#include "SvgGeometry/Log.hpp"
#include "SvgGeometry/SvgDom.hpp"

namespace svggeo {
namespace {

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string Unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

Color ResolveColor(const Color& color, const ComputedValues& values) {
    return color.is_current_color ? values.color : color;
}

PaintSource SolidSource(const Color& color) {
    PaintSource source;
    source.kind = PaintKind::kSolidColor;
    source.color = color;
    return source;
}

} // namespace

UserSpacePaintSource PaintSource::ToUserSpace(const std::optional<Rect>& object_bbox,
                                              const Viewport& viewport,
                                              const ComputedValues& values) const {
    UserSpacePaintSource out;
    switch (kind) {
    case PaintKind::kNone:
        break;
    case PaintKind::kSolidColor:
        out.kind = PaintKind::kSolidColor;
        out.color = color;
        break;
    case PaintKind::kPattern:
        if (pattern.has_value()) {
            out.pattern = pattern->ToUserSpace(object_bbox, viewport, values);
        }
        if (out.pattern.has_value()) {
            out.kind = PaintKind::kPattern;
        } else if (alternate.has_value()) {
            out.kind = PaintKind::kSolidColor;
            out.color = *alternate;
        }
        break;
    }
    return out;
}

PaintServer PaintServer::None() {
    return PaintServer();
}

PaintServer PaintServer::Iri(const NodeId& iri, const std::optional<Color>& alternate) {
    PaintServer server;
    server.kind_ = Kind::kIri;
    server.iri_ = iri;
    server.alternate_ = alternate;
    return server;
}

PaintServer PaintServer::SolidColor(const Color& color) {
    PaintServer server;
    server.kind_ = Kind::kSolidColor;
    server.color_ = color;
    return server;
}

std::optional<PaintServer> PaintServer::Parse(const std::string& text, ValueError& error) {
    const std::string value = Trim(text);
    if (value == "none") {
        return None();
    }

    if (value.rfind("url(", 0) != 0) {
        const auto color = StyleResolver::ParseColor(value);
        if (!color.has_value()) {
            error = ValueError::Parse("invalid paint server: " + value);
            return std::nullopt;
        }
        return SolidColor(*color);
    }

    const auto close = value.find(')');
    if (close == std::string::npos) {
        error = ValueError::Parse("expected ')' in url()");
        return std::nullopt;
    }

    const auto iri = NodeId::Parse(Unquote(Trim(value.substr(4, close - 4))), error);
    if (!iri.has_value()) {
        return std::nullopt;
    }

    const std::string rest = Trim(value.substr(close + 1));
    if (rest.empty() || rest == "none") {
        return Iri(*iri, std::nullopt);
    }
    const auto alternate = StyleResolver::ParseColor(rest);
    if (!alternate.has_value()) {
        error = ValueError::Parse("invalid fallback color: " + rest);
        return std::nullopt;
    }
    return Iri(*iri, alternate);
}

std::optional<PaintSource> PaintServer::Resolve(AcquiredNodes& acquired_nodes,
                                                const ComputedValues& values,
                                                AcquireError& error) const {
    switch (kind_) {
    case Kind::kNone:
        return PaintSource();
    case Kind::kSolidColor:
        return SolidSource(ResolveColor(color_, values));
    case Kind::kIri:
        break;
    }

    std::optional<Color> alternate;
    if (alternate_.has_value()) {
        alternate = ResolveColor(*alternate_, values);
    }

    AcquireError acquire_error;
    std::optional<PaintSource> source;
    if (auto acquired = acquired_nodes.Acquire(iri_, acquire_error); acquired.has_value()) {
        const Node& node = acquired->get();
        if (const Pattern* pattern = node.pattern(); pattern != nullptr) {
            auto resolved = pattern->Resolve(node, acquired_nodes, acquire_error);
            if (resolved.has_value()) {
                source = PaintSource();
                source->kind = PaintKind::kPattern;
                source->pattern = std::move(resolved);
                source->alternate = alternate;
            }
        } else {
            acquire_error.code = AcquireErrorCode::kInvalidLinkType;
            acquire_error.node_id = iri_;
        }
    }
    if (source.has_value()) {
        return source;
    }

    if (acquire_error.IsFatal()) {
        error = acquire_error;
        return std::nullopt;
    }
    if (alternate.has_value()) {
        Log()->debug("could not resolve paint server \"{}\" ({}), using alternate color",
                     iri_.ToString(),
                     acquire_error.ToString());
        return SolidSource(*alternate);
    }
    Log()->debug("could not resolve paint server \"{}\" ({}), no alternate color specified",
                 iri_.ToString(),
                 acquire_error.ToString());
    return PaintSource();
}

} // namespace svggeo
