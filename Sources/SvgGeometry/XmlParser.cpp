#include "SvgGeometry/XmlParser.hpp"

#include <cctype>
#include <map>
#include <vector>

#include "SvgGeometry/Log.hpp"

namespace svggeo {
namespace {

// Upper bound for the document after entity expansion, so that nested
// entities cannot blow a small file up into gigabytes.
constexpr size_t kMaxExpandedSize = 64 * 1024 * 1024;

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool IsWhitespace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void Fail(RenderError& error, RenderErrorCode code, const std::string& message) {
    error.code = code;
    error.message = message;
}

// Replaces the predefined entities and numeric character references (ASCII
// only; anything else is kept verbatim).
std::string DecodeCharacterReferences(const std::string& value) {
    if (value.find('&') == std::string::npos) {
        return value;
    }

    static const std::map<std::string, char> kPredefined = {
        {"lt", '<'}, {"gt", '>'}, {"amp", '&'}, {"quot", '"'}, {"apos", '\''},
    };

    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        const auto semicolon = value[i] == '&' ? value.find(';', i) : std::string::npos;
        if (semicolon == std::string::npos) {
            out.push_back(value[i++]);
            continue;
        }

        const std::string name = value.substr(i + 1, semicolon - i - 1);
        const auto predefined = kPredefined.find(name);
        if (predefined != kPredefined.end()) {
            out.push_back(predefined->second);
            i = semicolon + 1;
            continue;
        }
        if (name.size() > 1 && name[0] == '#') {
            const bool hex = name[1] == 'x';
            const std::string digits = name.substr(hex ? 2 : 1);
            const auto valid = digits.find_first_not_of(hex ? "0123456789abcdefABCDEF" : "0123456789");
            if (!digits.empty() && digits.size() <= 6 && valid == std::string::npos) {
                const long code = std::stol(digits, nullptr, hex ? 16 : 10);
                if (code > 0 && code < 0x80) {
                    out.push_back(static_cast<char>(code));
                    i = semicolon + 1;
                    continue;
                }
            }
        }
        out.push_back(value[i++]);
    }
    return out;
}

bool IsNameStartChar(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == ':';
}

bool IsNameChar(char c) {
    return IsNameStartChar(c) || std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '.';
}

size_t SkipWhitespace(const std::string& text, size_t pos) {
    while (pos < text.size() && IsWhitespace(text[pos])) {
        ++pos;
    }
    return pos;
}

// Reads a quoted value starting at |pos|. On success |pos| is left after the
// closing quote.
bool ReadQuoted(const std::string& text, size_t& pos, std::string& value) {
    if (pos >= text.size() || (text[pos] != '"' && text[pos] != '\'')) {
        return false;
    }
    const auto close = text.find(text[pos], pos + 1);
    if (close == std::string::npos) {
        return false;
    }
    value = text.substr(pos + 1, close - pos - 1);
    pos = close + 1;
    return true;
}

// name = "value" | name = 'value'. Anything that does not fit is skipped.
bool ParseAttributes(const std::string& raw,
                     size_t max_attributes,
                     std::map<std::string, std::string>& out,
                     RenderError& error) {
    size_t pos = 0;
    while ((pos = SkipWhitespace(raw, pos)) < raw.size()) {
        if (!IsNameStartChar(raw[pos])) {
            ++pos;
            continue;
        }
        const size_t name_start = pos;
        while (pos < raw.size() && IsNameChar(raw[pos])) {
            ++pos;
        }
        const std::string key = raw.substr(name_start, pos - name_start);

        pos = SkipWhitespace(raw, pos);
        if (pos >= raw.size() || raw[pos] != '=') {
            continue;
        }
        pos = SkipWhitespace(raw, pos + 1);

        std::string value;
        if (!ReadQuoted(raw, pos, value)) {
            continue;
        }

        if (out.size() >= max_attributes) {
            Fail(error, RenderErrorCode::kLimitExceeded,
                 "cannot load more than " + std::to_string(max_attributes) + " XML attributes");
            return false;
        }
        // Duplicate attributes: the first one wins.
        out.emplace(key, DecodeCharacterReferences(value));
    }
    return true;
}

// <!ENTITY name "value">. Parameter entities are ignored.
std::map<std::string, std::string> ParseDoctypeEntities(const std::string& doctype_decl) {
    std::map<std::string, std::string> entities;
    const auto subset_begin = doctype_decl.find('[');
    const auto subset_end = doctype_decl.rfind(']');
    if (subset_begin == std::string::npos || subset_end == std::string::npos || subset_end <= subset_begin) {
        return entities;
    }

    const std::string subset = doctype_decl.substr(subset_begin + 1, subset_end - subset_begin - 1);
    size_t pos = 0;
    while ((pos = subset.find("<!ENTITY", pos)) != std::string::npos) {
        pos += 8;
        const size_t name_start = SkipWhitespace(subset, pos);
        if (name_start == pos) {
            continue;
        }
        pos = name_start;
        while (pos < subset.size() && !IsWhitespace(subset[pos]) && subset[pos] != '%') {
            ++pos;
        }
        if (pos == name_start || pos >= subset.size() || subset[pos] == '%') {
            continue;
        }
        const std::string name = subset.substr(name_start, pos - name_start);

        pos = SkipWhitespace(subset, pos);
        std::string value;
        if (!ReadQuoted(subset, pos, value)) {
            continue;
        }
        pos = SkipWhitespace(subset, pos);
        if (pos < subset.size() && subset[pos] == '>') {
            entities.emplace(name, value);
        }
    }
    return entities;
}

bool ExpandEntities(std::string& text, const std::map<std::string, std::string>& entities, RenderError& error) {
    for (int pass = 0; pass < 8 && !entities.empty(); ++pass) {
        bool changed = false;
        for (const auto& [name, value] : entities) {
            const std::string needle = "&" + name + ";";
            size_t pos = 0;
            while ((pos = text.find(needle, pos)) != std::string::npos) {
                text.replace(pos, needle.size(), value);
                pos += value.size();
                changed = true;
                if (text.size() > kMaxExpandedSize) {
                    Fail(error, RenderErrorCode::kLimitExceeded, "XML entity expansion exceeds the size limit");
                    return false;
                }
            }
        }
        if (!changed) {
            break;
        }
    }
    return true;
}

// Position of the '>' closing the markup that starts at |start|, skipping
// quoted values and the DOCTYPE internal subset.
size_t FindMarkupEnd(const std::string& text, size_t start) {
    char quote = '\0';
    int subset_depth = 0;
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++subset_depth;
        } else if (c == ']' && subset_depth > 0) {
            --subset_depth;
        } else if (c == '>' && subset_depth == 0) {
            return i;
        }
    }
    return std::string::npos;
}

// Removes the DOCTYPE and expands the entities it declares.
bool PreprocessDoctype(const std::string& text, std::string& out, RenderError& error) {
    out.clear();
    out.reserve(text.size());

    std::map<std::string, std::string> entities;
    size_t cursor = 0;
    while (cursor < text.size()) {
        const auto doctype_pos = text.find("<!DOCTYPE", cursor);
        if (doctype_pos == std::string::npos) {
            out.append(text, cursor, std::string::npos);
            break;
        }

        out.append(text, cursor, doctype_pos - cursor);
        const auto doctype_end = FindMarkupEnd(text, doctype_pos);
        if (doctype_end == std::string::npos) {
            Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: unterminated DOCTYPE");
            return false;
        }

        const auto parsed = ParseDoctypeEntities(text.substr(doctype_pos, doctype_end - doctype_pos + 1));
        entities.insert(parsed.begin(), parsed.end());
        cursor = doctype_end + 1;
    }

    return ExpandEntities(out, entities, error);
}

} // namespace

XmlParser::XmlParser(size_t max_loaded_elements, size_t max_loaded_attributes, size_t max_element_depth)
    : max_loaded_elements_(max_loaded_elements),
      max_loaded_attributes_(max_loaded_attributes),
      max_element_depth_(max_element_depth) {}

std::optional<XmlNode> XmlParser::Parse(const std::string& text, RenderError& error) const {
    error = {};

    if (Trim(text).empty()) {
        Fail(error, RenderErrorCode::kInvalidDocument, "SVG input is empty");
        return std::nullopt;
    }

    std::string source;
    if (!PreprocessDoctype(text, source, error)) {
        Log()->warn("{}", error.message);
        return std::nullopt;
    }

    // node_stack[0] is a holder for the root element.
    std::vector<XmlNode> node_stack(1);
    size_t num_elements = 0;

    size_t pos = 0;
    while (pos < source.size()) {
        if (source[pos] != '<') {
            const auto next = source.find('<', pos);
            const auto end = next == std::string::npos ? source.size() : next;
            const auto content = Trim(source.substr(pos, end - pos));
            if (!content.empty()) {
                node_stack.back().text += DecodeCharacterReferences(content);
            }
            pos = end;
            continue;
        }

        if (source.compare(pos, 4, "<!--") == 0) {
            const auto end = source.find("-->", pos + 4);
            if (end == std::string::npos) {
                Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: unterminated comment");
                return std::nullopt;
            }
            pos = end + 3;
            continue;
        }
        if (source.compare(pos, 9, "<![CDATA[") == 0) {
            const auto end = source.find("]]>", pos + 9);
            if (end == std::string::npos) {
                Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: unterminated CDATA section");
                return std::nullopt;
            }
            node_stack.back().text += source.substr(pos + 9, end - pos - 9);
            pos = end + 3;
            continue;
        }

        const auto tag_end = FindMarkupEnd(source, pos);
        if (tag_end == std::string::npos) {
            Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: unterminated tag");
            return std::nullopt;
        }
        const std::string token = source.substr(pos, tag_end - pos + 1);
        pos = tag_end + 1;

        if (token.rfind("<?", 0) == 0 || token.rfind("<!", 0) == 0) {
            continue;
        }

        if (token.rfind("</", 0) == 0) {
            const auto name = Trim(token.substr(2, token.size() - 3));
            if (node_stack.size() <= 1 || node_stack.back().name != name) {
                Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: unexpected closing tag </" + name + ">");
                return std::nullopt;
            }

            XmlNode closed = std::move(node_stack.back());
            node_stack.pop_back();
            node_stack.back().children.push_back(std::move(closed));
            continue;
        }

        const bool self_closing = token.size() > 2 && token[token.size() - 2] == '/';
        std::string inner = Trim(token.substr(1, token.size() - (self_closing ? 3 : 2)));
        if (inner.empty()) {
            continue;
        }

        if (++num_elements > max_loaded_elements_) {
            Fail(error, RenderErrorCode::kLimitExceeded,
                 "cannot load more than " + std::to_string(max_loaded_elements_) + " XML elements");
            Log()->warn("{}", error.message);
            return std::nullopt;
        }
        if (node_stack.size() == 1 && !node_stack.front().children.empty()) {
            Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: more than one root element");
            return std::nullopt;
        }
        // node_stack.size() is the depth of the new element; the root is 1.
        if (node_stack.size() > max_element_depth_) {
            Fail(error, RenderErrorCode::kLimitExceeded,
                 "cannot nest XML elements more than " + std::to_string(max_element_depth_) + " levels deep");
            Log()->warn("{}", error.message);
            return std::nullopt;
        }

        XmlNode node;
        size_t split = 0;
        while (split < inner.size() && !IsWhitespace(inner[split])) {
            ++split;
        }
        node.name = inner.substr(0, split);
        if (!ParseAttributes(inner.substr(split), max_loaded_attributes_, node.attributes, error)) {
            Log()->warn("{}", error.message);
            return std::nullopt;
        }

        if (self_closing) {
            node_stack.back().children.push_back(std::move(node));
        } else {
            node_stack.push_back(std::move(node));
        }
    }

    if (node_stack.size() > 1) {
        Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: unclosed element <" + node_stack.back().name + ">");
        return std::nullopt;
    }
    if (node_stack.front().children.empty()) {
        Fail(error, RenderErrorCode::kInvalidDocument, "Malformed SVG: no root element");
        return std::nullopt;
    }

    return std::move(node_stack.front().children.front());
}

} // namespace svggeo
