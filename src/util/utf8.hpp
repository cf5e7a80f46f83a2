#ifndef PIIGUARD_UTIL_UTF8_HPP
#define PIIGUARD_UTIL_UTF8_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <stdexcept>

/**
 * @file utf8.hpp
 * @brief Byte/code point offset helpers. All spans in piiguard are byte
 *        offsets into UTF-8 text; these helpers let adapters translate
 *        offsets produced by services that count code points.
 */

namespace piiguard {
namespace util {
namespace utf8 {

/**
 * @brief True if the byte at pos starts a code point (or pos == text.size()).
 *        A span boundary that is not a code point boundary would cut a
 *        multi-byte character in half.
 */
inline bool isBoundary(const std::string &text, std::size_t pos)
{
    if (pos > text.size()) {
        return false;
    }
    if (pos == text.size()) {
        return true;
    }
    return (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80;
}

/**
 * @brief Byte offset of every code point start, plus text.size() as the last entry.
 *        Index i of the result is the byte offset of code point i.
 */
inline std::vector<std::size_t> codePointOffsets(const std::string &text)
{
    std::vector<std::size_t> offsets;
    offsets.reserve(text.size() + 1);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (isBoundary(text, i)) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(text.size());
    return offsets;
}

/**
 * @brief Convert a code point index into a byte offset using a table from codePointOffsets().
 * @throw std::out_of_range if the index is past the end of the text.
 */
inline std::size_t toByteOffset(const std::vector<std::size_t> &table, std::size_t codePointIndex)
{
    if (codePointIndex >= table.size()) {
        throw std::out_of_range("utf8::toByteOffset: code point index "
                                + std::to_string(codePointIndex) + " past end of text");
    }
    return table[codePointIndex];
}

} // namespace utf8
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_UTF8_HPP
