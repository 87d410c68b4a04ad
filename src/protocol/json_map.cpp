/**
 * @file json_map.cpp
 * @brief Flat JSON object writer and reader.
 * @author log_courier contributors
 */

#include "protocol/json_map.hpp"

#include "core/logger.hpp"

#include <cctype>
#include <sstream>

namespace log_courier {

std::string encode_json_map(const ContextMap& map) {
    if (map.empty()) return {};

    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [key, value] : map) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << json_escape(key) << R"(":")" << json_escape(value) << '"';
    }
    oss << '}';
    return oss.str();
}

namespace {

class FlatJsonReader {
public:
    explicit FlatJsonReader(std::string_view text) : text_(text) {}

    Result<ContextMap> read() {
        ContextMap out;
        skip_ws();
        if (!consume('{')) return fail("expected '{'");
        skip_ws();
        if (consume('}')) return finish(std::move(out));

        while (true) {
            skip_ws();
            auto key = read_string();
            if (!key) return key.error();
            skip_ws();
            if (!consume(':')) return fail("expected ':'");
            skip_ws();
            auto value = read_string();
            if (!value) return value.error();
            out[*key] = *value;
            skip_ws();
            if (consume(',')) continue;
            if (consume('}')) break;
            return fail("expected ',' or '}'");
        }
        return finish(std::move(out));
    }

private:
    Result<ContextMap> finish(ContextMap map) {
        skip_ws();
        if (pos_ != text_.size()) return fail("trailing characters");
        return map;
    }

    Result<std::string> read_string() {
        if (!consume('"')) return fail("expected string");
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) break;
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'u': {
                    auto code = read_hex4();
                    if (!code) return code.error();
                    append_utf8(out, *code);
                    break;
                }
                default:
                    return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    Result<uint32_t> read_hex4() {
        if (pos_ + 4 > text_.size()) return fail("short \\u escape");
        uint32_t code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<uint32_t>(h - 'A' + 10);
            else return fail("invalid \\u escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, uint32_t code) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    Error fail(const std::string& what) const {
        return protocol_error("malformed JSON map at offset " + std::to_string(pos_) + ": " + what);
    }

    std::string_view text_;
    size_t pos_{0};
};

}  // namespace

Result<ContextMap> decode_json_map(std::string_view text) {
    if (text.empty()) return ContextMap{};
    return FlatJsonReader{text}.read();
}

}  // namespace log_courier
