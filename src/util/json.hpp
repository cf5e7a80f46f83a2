#ifndef PIIGUARD_UTIL_JSON_HPP
#define PIIGUARD_UTIL_JSON_HPP

#include <string>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cstdint>
#include <cctype>
#include <utility>

/**
 * @file json.hpp
 * @brief Minimal JSON helpers shared by the audit serializer and the NER
 *        service adapter: string escaping plus a small forward reader.
 *        No external JSON library is used.
 */

namespace piiguard {
namespace util {
namespace json {

/**
 * @brief Escape a string for use between JSON double quotes.
 *        Bytes >= 0x80 are passed through, so UTF-8 text stays UTF-8.
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

/**
 * @brief Append a code point to out as UTF-8.
 */
inline void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/**
 * @brief Decode the body of a JSON string literal (without the surrounding quotes).
 *        Handles all standard escapes including \uXXXX surrogate pairs.
 * @throw std::runtime_error on a malformed escape.
 */
inline std::string unescapeString(const std::string &raw)
{
    auto hex4 = [&raw](size_t pos) -> uint32_t {
        if (pos + 4 > raw.size()) {
            throw std::runtime_error("json::unescapeString: truncated \\u escape");
        }
        uint32_t value = 0;
        for (size_t k = pos; k < pos + 4; ++k) {
            char h = raw[k];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else throw std::runtime_error("json::unescapeString: bad hex digit in \\u escape");
        }
        return value;
    };

    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= raw.size()) {
            throw std::runtime_error("json::unescapeString: dangling backslash");
        }
        switch (raw[i]) {
        case '"':  out.push_back('"');  break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/');  break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u': {
            uint32_t cp = hex4(i + 1);
            i += 4;
            if (cp >= 0xD800 && cp <= 0xDBFF
                && i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u')
            {
                uint32_t low = hex4(i + 3);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i += 6;
                }
            }
            appendUtf8(out, cp);
            break;
        }
        default:
            throw std::runtime_error(std::string("json::unescapeString: unknown escape \\") + raw[i]);
        }
    }
    return out;
}

/**
 * @class Cursor
 * @brief Forward-only reader over a JSON document.
 *
 * Just enough to pick known keys out of small replies: callers walk objects
 * and arrays themselves and skipValue() anything they don't care about.
 * String contents are never mistaken for structure.
 * All errors are std::runtime_error carrying the byte offset.
 */
class Cursor
{
public:
    explicit Cursor(std::string doc)
        : doc_(std::move(doc))
    {
    }

    void skipWhitespace()
    {
        while (pos_ < doc_.size()
               && (doc_[pos_] == ' ' || doc_[pos_] == '\t' || doc_[pos_] == '\n' || doc_[pos_] == '\r'))
        {
            ++pos_;
        }
    }

    /// Skip whitespace, then take c if it is next.
    bool consume(char c)
    {
        skipWhitespace();
        if (pos_ < doc_.size() && doc_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(char c)
    {
        if (!consume(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    std::string readString()
    {
        expect('"');
        const std::size_t begin = pos_;
        while (pos_ < doc_.size() && doc_[pos_] != '"') {
            pos_ += (doc_[pos_] == '\\') ? 2 : 1;
        }
        if (pos_ >= doc_.size()) {
            fail("unterminated string");
        }
        const std::string raw = doc_.substr(begin, pos_ - begin);
        ++pos_;
        return unescapeString(raw);
    }

    /// A non-negative integer; fractions, exponents and overflow are rejected.
    uint64_t readUnsigned()
    {
        skipWhitespace();
        const std::size_t begin = pos_;
        uint64_t value = 0;
        while (pos_ < doc_.size() && doc_[pos_] >= '0' && doc_[pos_] <= '9') {
            const uint64_t digit = static_cast<uint64_t>(doc_[pos_] - '0');
            if (value > (UINT64_MAX - digit) / 10) {
                fail("integer out of range");
            }
            value = value * 10 + digit;
            ++pos_;
        }
        if (pos_ == begin) {
            fail("expected a non-negative integer");
        }
        if (pos_ < doc_.size() && (doc_[pos_] == '.' || doc_[pos_] == 'e' || doc_[pos_] == 'E')) {
            fail("expected an integer");
        }
        return value;
    }

    /// Skip one complete value of any type.
    void skipValue()
    {
        skipWhitespace();
        if (pos_ >= doc_.size()) {
            fail("unexpected end of document");
        }
        const char c = doc_[pos_];
        if (c == '"') {
            readString();
        } else if (c == '{') {
            ++pos_;
            if (consume('}')) {
                return;
            }
            do {
                readString();
                expect(':');
                skipValue();
            } while (consume(','));
            expect('}');
        } else if (c == '[') {
            ++pos_;
            if (consume(']')) {
                return;
            }
            do {
                skipValue();
            } while (consume(','));
            expect(']');
        } else {
            const std::size_t begin = pos_;
            while (pos_ < doc_.size()
                   && (std::isalnum(static_cast<unsigned char>(doc_[pos_]))
                       || doc_[pos_] == '-' || doc_[pos_] == '+' || doc_[pos_] == '.'))
            {
                ++pos_;
            }
            if (pos_ == begin) {
                fail(std::string("unexpected '") + c + "'");
            }
        }
    }

    bool atEnd()
    {
        skipWhitespace();
        return pos_ >= doc_.size();
    }

private:
    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::runtime_error("json: " + what + " at offset " + std::to_string(pos_));
    }

    std::string doc_;
    std::size_t pos_ = 0;
};

} // namespace json
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_JSON_HPP
