#include "SvgGeometry/Error.hpp"

namespace svggeo {

ValueError ValueError::Parse(const std::string& message) {
    ValueError error;
    error.kind = ValueErrorKind::kParse;
    error.message = message;
    return error;
}

ValueError ValueError::Value(const std::string& message) {
    ValueError error;
    error.kind = ValueErrorKind::kValue;
    error.message = message;
    return error;
}

std::string ValueError::ToString() const {
    if (kind == ValueErrorKind::kParse) {
        return "parse error: " + message;
    }
    return "invalid value: " + message;
}

bool operator==(const ValueError& a, const ValueError& b) {
    return a.kind == b.kind && a.message == b.message;
}

std::string AttributeError::ToString() const {
    return "attribute " + attribute + ": " + error.ToString();
}

} // namespace svggeo
