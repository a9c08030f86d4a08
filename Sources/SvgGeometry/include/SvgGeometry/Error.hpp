#ifndef SVG_GEOMETRY_ERROR_HPP
#define SVG_GEOMETRY_ERROR_HPP

#include <string>

namespace svggeo {

enum class ValueErrorKind {
    kParse,
    kValue,
};

// Error produced while parsing an attribute value. kParse is a syntax error,
// kValue a syntactically valid but unusable value (negative length, singular
// matrix, ...).
struct ValueError {
    ValueErrorKind kind = ValueErrorKind::kParse;
    std::string message;

    static ValueError Parse(const std::string& message);
    static ValueError Value(const std::string& message);

    std::string ToString() const;
};

bool operator==(const ValueError& a, const ValueError& b);

struct AttributeError {
    std::string attribute;
    ValueError error;

    std::string ToString() const;
};

} // namespace svggeo

#endif
