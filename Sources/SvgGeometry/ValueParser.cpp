#include "SvgGeometry/ValueParser.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace svggeo {
namespace {

bool IsWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsNameChar(char c) {
    return IsNameStart(c) || IsDigit(c) || c == '-';
}

} // namespace

ValueParser::ValueParser(const std::string& text) : text_(text) {}

void ValueParser::SkipWhitespace() {
    while (pos_ < text_.size() && IsWhitespace(text_[pos_])) {
        ++pos_;
    }
}

bool ValueParser::OptionalComma() {
    SkipWhitespace();
    const bool comma = ConsumeChar(',');
    SkipWhitespace();
    return comma;
}

bool ValueParser::IsExhausted() {
    SkipWhitespace();
    return pos_ >= text_.size();
}

std::optional<double> ValueParser::ParseNumber(ValueError& error) {
    SkipWhitespace();

    size_t cursor = pos_;
    if (cursor < text_.size() && (text_[cursor] == '+' || text_[cursor] == '-')) {
        ++cursor;
    }

    bool has_digits = false;
    while (cursor < text_.size() && IsDigit(text_[cursor])) {
        ++cursor;
        has_digits = true;
    }
    if (cursor + 1 < text_.size() && text_[cursor] == '.' && IsDigit(text_[cursor + 1])) {
        ++cursor;
        while (cursor < text_.size() && IsDigit(text_[cursor])) {
            ++cursor;
        }
        has_digits = true;
    }
    if (!has_digits) {
        error = ValueError::Parse("expected number");
        return std::nullopt;
    }

    if (cursor < text_.size() && (text_[cursor] == 'e' || text_[cursor] == 'E')) {
        size_t exponent = cursor + 1;
        if (exponent < text_.size() && (text_[exponent] == '+' || text_[exponent] == '-')) {
            ++exponent;
        }
        if (exponent < text_.size() && IsDigit(text_[exponent])) {
            while (exponent < text_.size() && IsDigit(text_[exponent])) {
                ++exponent;
            }
            cursor = exponent;
        }
    }

    const std::string literal = text_.substr(pos_, cursor - pos_);
    const double value = std::strtod(literal.c_str(), nullptr);
    if (!std::isfinite(static_cast<float>(value))) {
        error = ValueError::Value("expected finite number");
        return std::nullopt;
    }

    pos_ = cursor;
    return value;
}

std::optional<std::string> ValueParser::ParseIdent(ValueError& error) {
    SkipWhitespace();
    if (!AtIdentStart()) {
        error = ValueError::Parse("expected identifier");
        return std::nullopt;
    }

    const size_t begin = pos_;
    if (text_[pos_] == '-') {
        ++pos_;
    }
    while (pos_ < text_.size() && IsNameChar(text_[pos_])) {
        ++pos_;
    }
    return text_.substr(begin, pos_ - begin);
}

bool ValueParser::ExpectChar(char c, ValueError& error) {
    SkipWhitespace();
    if (!ConsumeChar(c)) {
        error = ValueError::Parse(std::string("expected '") + c + "'");
        return false;
    }
    return true;
}

bool ValueParser::ConsumeChar(char c) {
    if (PeekChar(c)) {
        ++pos_;
        return true;
    }
    return false;
}

bool ValueParser::PeekChar(char c) const {
    return pos_ < text_.size() && text_[pos_] == c;
}

bool ValueParser::AtIdentStart() const {
    if (pos_ >= text_.size()) {
        return false;
    }
    if (text_[pos_] == '-') {
        return pos_ + 1 < text_.size() && IsNameStart(text_[pos_ + 1]);
    }
    return IsNameStart(text_[pos_]);
}

std::string ValueParser::Remaining() const {
    return pos_ < text_.size() ? text_.substr(pos_) : std::string();
}

std::optional<std::vector<double>> NumberList::Parse(const std::string& text,
                                                     size_t min_count,
                                                     size_t max_count,
                                                     ValueError& error) {
    ValueParser parser(text);
    std::vector<double> numbers;

    while (numbers.size() < max_count) {
        bool comma = false;
        if (!numbers.empty()) {
            comma = parser.OptionalComma();
        }
        if (numbers.size() >= min_count && !comma && parser.IsExhausted()) {
            break;
        }
        const auto number = parser.ParseNumber(error);
        if (!number.has_value()) {
            return std::nullopt;
        }
        numbers.push_back(*number);
    }

    if (!parser.IsExhausted()) {
        error = ValueError::Parse("unexpected trailing data: " + parser.Remaining());
        return std::nullopt;
    }
    return numbers;
}

} // namespace svggeo
