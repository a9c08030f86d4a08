#ifndef SVG_GEOMETRY_VALUE_PARSER_HPP
#define SVG_GEOMETRY_VALUE_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "SvgGeometry/Error.hpp"

namespace svggeo {

// Cursor over an attribute value implementing the small subset of the CSS
// value grammar the geometry attributes are written in.
class ValueParser {
public:
    ValueParser(const std::string& text);

    void SkipWhitespace();

    // Skips whitespace, at most one comma, and whitespace again. Returns true
    // if a comma was consumed.
    bool OptionalComma();

    // True when only whitespace remains.
    bool IsExhausted();

    // CSS <number>: optional sign, digits with an optional fraction, optional
    // exponent. The value has to be representable as a finite float.
    std::optional<double> ParseNumber(ValueError& error);

    std::optional<std::string> ParseIdent(ValueError& error);

    bool ExpectChar(char c, ValueError& error);
    bool ConsumeChar(char c);
    bool PeekChar(char c) const;
    bool AtIdentStart() const;

    size_t position() const { return pos_; }
    void Reset(size_t position) { pos_ = position; }

    // Runs |fn|; if it yields an empty/false result the cursor is put back
    // where it was.
    template <typename Fn>
    auto TryParse(Fn&& fn) -> decltype(fn()) {
        const size_t saved = pos_;
        auto result = fn();
        if (!result) {
            pos_ = saved;
        }
        return result;
    }

    std::string Remaining() const;

private:
    const std::string& text_;
    size_t pos_ = 0;
};

class NumberList {
public:
    // Parses between |min_count| and |max_count| numbers separated by
    // whitespace and/or commas, with nothing else in |text|.
    static std::optional<std::vector<double>> Parse(const std::string& text,
                                                    size_t min_count,
                                                    size_t max_count,
                                                    ValueError& error);
};

} // namespace svggeo

#endif
