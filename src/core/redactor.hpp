#ifndef PIIGUARD_CORE_REDACTOR_HPP
#define PIIGUARD_CORE_REDACTOR_HPP

#include <string>
#include <stdexcept>
#include "span.hpp"

/**
 * @file redactor.hpp
 * @brief Rewrites a text with the tokens of a ResolvedSpanSet.
 *
 * Spans are applied right to left. Replacing [start, end) only moves the
 * bytes after end, and every span still to be applied lies before start,
 * so no offset ever needs correcting.
 *
 * Resulting length: original + sum(token.size() - (end - start)).
 */

namespace piiguard {
namespace core {

class Redactor
{
public:
    /**
     * @brief Produce the redacted copy of text.
     * @throw std::out_of_range if a span does not fit inside text.
     * @throw std::invalid_argument if a span's originalText differs from
     *        the bytes it covers, i.e. the set was resolved for another text.
     */
    static std::string apply(const std::string &text, const ResolvedSpanSet &spans)
    {
        std::string out = text;
        for (auto it = spans.spans().rbegin(); it != spans.spans().rend(); ++it) {
            const Span &span = *it;
            if (span.end > text.size() || span.start >= span.end) {
                throw std::out_of_range("Redactor: span [" + std::to_string(span.start) + ", "
                                        + std::to_string(span.end) + ") does not fit a text of "
                                        + std::to_string(text.size()) + " bytes");
            }
            if (text.compare(span.start, span.length(), span.originalText) != 0) {
                throw std::invalid_argument("Redactor: span [" + std::to_string(span.start) + ", "
                                            + std::to_string(span.end) + ") was resolved against a different text");
            }
            out.replace(span.start, span.length(), span.replacementToken);
        }
        return out;
    }

    /**
     * @brief Length apply() will produce, without building the string.
     */
    static std::size_t redactedLength(const std::string &text, const ResolvedSpanSet &spans)
    {
        std::size_t length = text.size();
        for (const auto &span : spans) {
            length = length - span.length() + span.replacementToken.size();
        }
        return length;
    }
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_REDACTOR_HPP
