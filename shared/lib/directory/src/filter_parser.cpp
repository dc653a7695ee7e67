/**
 * @file filter_parser.cpp
 * @brief RFC 4515 filter string parser
 *
 * Grammar (whitespace between list elements is tolerated):
 *   filter     = "(" filtercomp ")"
 *   filtercomp = "&" filterlist / "|" filterlist / "!" filter / item
 *   item       = attr ("=" / "~=" / ">=" / "<=") value
 * A bare item without parentheses is accepted at top level.
 * Extensible matches (":=") are rejected.
 */

#include "crowdldap/directory/filter.h"
#include "crowdldap/utils/string_utils.h"
#include "exceptions.h"

#include <cctype>

namespace crowdldap::directory {

namespace {

using common::FilterSyntaxException;

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

class FilterParser {
public:
    explicit FilterParser(const std::string& text) : text_(text) {}

    Filter parseTop() {
        skipSpaces();
        if (pos_ >= text_.size()) {
            throw FilterSyntaxException("empty filter", pos_);
        }

        Filter result = (text_[pos_] == '(') ? parseFilter() : parseItem(text_.size());

        skipSpaces();
        if (pos_ != text_.size()) {
            throw FilterSyntaxException("unexpected trailing characters", pos_);
        }
        return result;
    }

private:
    Filter parseFilter() {
        expect('(');
        skipSpaces();
        if (pos_ >= text_.size()) {
            throw FilterSyntaxException("unterminated filter", pos_);
        }

        char c = text_[pos_];
        if (c == '&' || c == '|') {
            pos_++;
            std::vector<Filter> children = parseList();
            expect(')');
            return (c == '&') ? Filter::andOf(std::move(children))
                              : Filter::orOf(std::move(children));
        }
        if (c == '!') {
            pos_++;
            skipSpaces();
            Filter child = parseFilter();
            skipSpaces();
            expect(')');
            return Filter::notOf(std::move(child));
        }

        Filter item = parseItem(findItemEnd());
        expect(')');
        return item;
    }

    std::vector<Filter> parseList() {
        std::vector<Filter> children;
        skipSpaces();
        while (pos_ < text_.size() && text_[pos_] == '(') {
            children.push_back(parseFilter());
            skipSpaces();
        }
        return children;
    }

    /// Position of the ')' closing the current item
    size_t findItemEnd() const {
        size_t p = pos_;
        while (p < text_.size() && text_[p] != ')') {
            if (text_[p] == '(') {
                throw FilterSyntaxException("unescaped '(' in assertion value", p);
            }
            p++;
        }
        if (p >= text_.size()) {
            throw FilterSyntaxException("missing ')'", p);
        }
        return p;
    }

    /// item = attr filtertype value, occupying [pos_, end)
    Filter parseItem(size_t end) {
        size_t start = pos_;
        size_t opPos = start;
        while (opPos < end && text_[opPos] != '=' && text_[opPos] != '~' &&
               text_[opPos] != '>' && text_[opPos] != '<' && text_[opPos] != ':') {
            opPos++;
        }
        if (opPos >= end) {
            throw FilterSyntaxException("missing comparison operator", start);
        }
        if (text_[opPos] == ':') {
            throw FilterSyntaxException("extensible match is not supported", opPos);
        }

        std::string attribute = utils::trim(text_.substr(start, opPos - start));
        validateAttribute(attribute, start);

        Filter::Type type = Filter::Type::EQUALITY;
        size_t valueStart = opPos + 1;
        char op = text_[opPos];
        if (op != '=') {
            if (opPos + 1 >= end || text_[opPos + 1] != '=') {
                throw FilterSyntaxException(std::string("expected '=' after '") + op + "'", opPos + 1);
            }
            type = (op == '~') ? Filter::Type::APPROX
                 : (op == '>') ? Filter::Type::GREATER_OR_EQUAL
                               : Filter::Type::LESS_OR_EQUAL;
            valueStart = opPos + 2;
        }

        std::string raw = text_.substr(valueStart, end - valueStart);
        pos_ = end;

        if (type == Filter::Type::EQUALITY) {
            if (raw == "*") {
                return Filter::present(attribute);
            }
            if (raw.find('*') != std::string::npos) {
                return parseSubstring(attribute, raw, valueStart);
            }
        } else if (raw.find('*') != std::string::npos) {
            throw FilterSyntaxException("wildcard not allowed here", valueStart + raw.find('*'));
        }

        std::string value = unescape(raw, valueStart);
        switch (type) {
            case Filter::Type::APPROX:           return Filter::approx(attribute, value);
            case Filter::Type::GREATER_OR_EQUAL: return Filter::greaterOrEqual(attribute, value);
            case Filter::Type::LESS_OR_EQUAL:    return Filter::lessOrEqual(attribute, value);
            default:                             return Filter::equality(attribute, value);
        }
    }

    Filter parseSubstring(const std::string& attribute, const std::string& raw, size_t offset) {
        std::vector<std::string> pieces;
        std::vector<size_t> pieceOffsets;
        size_t start = 0;
        for (size_t i = 0; i <= raw.size(); ++i) {
            if (i == raw.size() || raw[i] == '*') {
                pieces.push_back(raw.substr(start, i - start));
                pieceOffsets.push_back(offset + start);
                start = i + 1;
            }
        }

        std::optional<std::string> initial;
        std::optional<std::string> final;
        std::vector<std::string> any;

        if (!pieces.front().empty()) {
            initial = unescape(pieces.front(), pieceOffsets.front());
        }
        if (!pieces.back().empty()) {
            final = unescape(pieces.back(), pieceOffsets.back());
        }
        for (size_t i = 1; i + 1 < pieces.size(); ++i) {
            if (pieces[i].empty()) {
                throw FilterSyntaxException("empty substring component", pieceOffsets[i]);
            }
            any.push_back(unescape(pieces[i], pieceOffsets[i]));
        }
        return Filter::substring(attribute, std::move(initial), std::move(any), std::move(final));
    }

    /// Resolve \XX escapes (RFC 4515 section 3)
    std::string unescape(const std::string& raw, size_t offset) const {
        std::string result;
        result.reserve(raw.size());
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] != '\\') {
                result += raw[i];
                continue;
            }
            if (i + 2 >= raw.size()) {
                throw FilterSyntaxException("truncated escape sequence", offset + i);
            }
            int hi = hexDigit(raw[i + 1]);
            int lo = hexDigit(raw[i + 2]);
            if (hi < 0 || lo < 0) {
                throw FilterSyntaxException("invalid escape sequence", offset + i);
            }
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return result;
    }

    void validateAttribute(const std::string& attribute, size_t at) const {
        if (attribute.empty()) {
            throw FilterSyntaxException("missing attribute description", at);
        }
        for (char c : attribute) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.' && c != ';') {
                throw FilterSyntaxException("invalid character in attribute description", at);
            }
        }
    }

    void expect(char c) {
        if (pos_ >= text_.size() || text_[pos_] != c) {
            throw FilterSyntaxException(std::string("expected '") + c + "'", pos_);
        }
        pos_++;
    }

    void skipSpaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // anonymous namespace

Filter Filter::parse(const std::string& text) {
    FilterParser parser(text);
    return parser.parseTop();
}

} // namespace crowdldap::directory
