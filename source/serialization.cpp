// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// serialization.cpp - JSON reading/writing and document format dispatch

#include <configdiff/serialization.h>
#include <configdiff/builders.h>
#include <configdiff/errors.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace configdiff {

namespace {

// ============================================================
// Writer
// ============================================================

std::string json_escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void write_number(double value, std::ostringstream& oss)
{
    if (!std::isfinite(value)) {
        oss << "null";
        return;
    }
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        oss << "null";
        return;
    }
    oss.write(buf.data(), ptr - buf.data());
}

void to_json_impl(const Node& node, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            write_number(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, NodeMap>) {
            if (arg.size() == 0) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& key : sorted_keys(arg)) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(key) << "\":" << space_after_colon;
                    to_json_impl(*arg.at(key), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, NodeVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, node.data);
}

// ============================================================
// Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Node parse() {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            throw ParseError("empty JSON input", pos_);
        }
        Node result = parse_value();
        skip_whitespace();
        if (pos_ < json_.size()) {
            throw ParseError("unexpected trailing content", pos_);
        }
        return result;
    }

private:
    std::string_view json_;
    std::size_t pos_;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    static bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw ParseError(std::string("expected '") + c + "'", pos_ == 0 ? 0 : pos_ - 1);
        }
    }

    Node parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Node{parse_string_raw()};
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || is_digit(c)) return parse_number();

        if (pos_ >= json_.size()) {
            throw ParseError("unexpected end of input", pos_);
        }
        throw ParseError("unexpected character '" + std::string(1, c) + "'", pos_);
    }

    Node parse_object() {
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Node{NodeMap{}};
        }

        ObjectBuilder builder;

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            builder.set(key, parse_value());

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw ParseError("expected ',' or '}' in object", pos_);
            }
            consume();
        }

        return builder.finish();
    }

    Node parse_array() {
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Node{NodeVector{}};
        }

        ArrayBuilder builder;

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw ParseError("expected ',' or ']' in array", pos_);
            }
            consume();
        }

        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw ParseError("truncated unicode escape", pos_);
        }
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            throw ParseError("invalid unicode escape", pos_);
        }
        pos_ += 4;
        return value;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    unsigned parse_unicode_escape() {
        const std::size_t start = pos_;
        unsigned codepoint = parse_hex4();
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
            // High surrogate, a low surrogate escape must follow
            if (pos_ + 2 > json_.size() || json_[pos_] != '\\' || json_[pos_ + 1] != 'u') {
                throw ParseError("unpaired high surrogate", start);
            }
            pos_ += 2;
            unsigned low = parse_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                throw ParseError("invalid low surrogate", start);
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
            throw ParseError("unpaired low surrogate", start);
        }
        return codepoint;
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                throw ParseError("control character in string", pos_ - 1);
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                throw ParseError("unexpected end of string escape", pos_);
            }
            char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u':  append_utf8(result, parse_unicode_escape()); break;
                default:
                    throw ParseError("invalid escape sequence \\" + std::string(1, escaped), pos_ - 1);
            }
        }

        throw ParseError("unterminated string", pos_);
    }

    Node parse_number() {
        const std::size_t start = pos_;

        if (peek() == '-') consume();

        if (!is_digit(peek())) {
            throw ParseError("expected digit", pos_);
        }
        if (peek() == '0') {
            consume();
        } else {
            while (is_digit(peek())) consume();
        }

        if (peek() == '.') {
            consume();
            if (!is_digit(peek())) {
                throw ParseError("expected digit after '.'", pos_);
            }
            while (is_digit(peek())) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!is_digit(peek())) {
                throw ParseError("expected digit in exponent", pos_);
            }
            while (is_digit(peek())) consume();
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(json_.data() + start, json_.data() + pos_, value);
        if (ec == std::errc::result_out_of_range) {
            throw ParseError("number out of range", start);
        }
        if (ec != std::errc{} || ptr != json_.data() + pos_) {
            throw ParseError("invalid number", start);
        }
        return Node{value};
    }

    Node parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Node{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Node{false};
        }
        throw ParseError("expected 'true' or 'false'", pos_);
    }

    Node parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Node{};
        }
        throw ParseError("expected 'null'", pos_);
    }
};

std::string to_lower(std::string_view s)
{
    std::string result{s};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

std::string to_json(const Node& node, bool compact)
{
    std::ostringstream oss;
    to_json_impl(node, oss, compact, 0);
    return oss.str();
}

Node from_json(std::string_view json_text)
{
    JsonParser parser(json_text);
    return parser.parse();
}

// ============================================================
// Document formats
// ============================================================

std::string_view format_name(Format format) noexcept
{
    switch (format) {
        case Format::Json: return "json";
        case Format::Yaml: return "yaml";
        case Format::Hcl:  return "hcl";
        case Format::Toml: return "toml";
    }
    return "unknown";
}

std::optional<Format> format_from_name(std::string_view name)
{
    const auto lower = to_lower(name);
    if (lower == "json") return Format::Json;
    if (lower == "yaml" || lower == "yml") return Format::Yaml;
    if (lower == "hcl" || lower == "tf") return Format::Hcl;
    if (lower == "toml") return Format::Toml;
    return std::nullopt;
}

std::optional<Format> format_from_extension(std::string_view filename)
{
    auto slash = filename.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        filename.remove_prefix(slash + 1);
    }
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == filename.size()) {
        return std::nullopt;
    }
    return format_from_name(filename.substr(dot + 1));
}

Node parse_document(std::string_view text, Format format)
{
    if (format == Format::Json) {
        return from_json(text);
    }
    throw ParseError("no " + std::string{format_name(format)} + " parser is built into configdiff");
}

} // namespace configdiff
