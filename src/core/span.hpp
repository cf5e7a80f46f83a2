#ifndef PIIGUARD_CORE_SPAN_HPP
#define PIIGUARD_CORE_SPAN_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <utility>

/**
 * @file span.hpp
 * @brief The interval types every stage of the pipeline exchanges.
 *
 * A Span is a half-open byte range [start, end) into one frozen input
 * text. Spans never outlive that text's snapshot and are never shifted:
 * the Redactor applies them right to left instead.
 */

namespace piiguard {
namespace core {

class SpanResolver;

/**
 * @enum SpanSource
 * @brief Which detector family produced a span.
 */
enum class SpanSource {
    Model,
    Pattern
};

/**
 * @struct Span
 * @brief One candidate redaction.
 */
struct Span
{
    std::size_t start = 0;
    std::size_t end = 0;
    std::string label;              ///< PII category, e.g. "PERSON" or "EMAIL"
    SpanSource source = SpanSource::Pattern;
    std::string originalText;       ///< Exactly text.substr(start, end - start)
    std::string replacementToken;
    std::size_t detectorOrder = 0;  ///< Position of the producing rule in configuration

    std::size_t length() const { return end - start; }

    bool overlaps(const Span &other) const
    {
        return start < other.end && other.start < end;
    }
};

/**
 * @class ResolvedSpanSet
 * @brief Pairwise non-overlapping spans sorted by ascending start.
 *
 * Only SpanResolver can fill one, so holding a ResolvedSpanSet is proof
 * that the non-overlap invariant was established. A default-constructed
 * set is empty and trivially valid.
 */
class ResolvedSpanSet
{
public:
    using const_iterator = std::vector<Span>::const_iterator;

    ResolvedSpanSet() = default;

    const_iterator begin() const { return spans_.begin(); }
    const_iterator end() const { return spans_.end(); }
    std::size_t size() const { return spans_.size(); }
    bool empty() const { return spans_.empty(); }
    const Span &operator[](std::size_t i) const { return spans_[i]; }
    const std::vector<Span> &spans() const { return spans_; }

private:
    friend class SpanResolver;

    explicit ResolvedSpanSet(std::vector<Span> sortedDisjoint)
        : spans_(std::move(sortedDisjoint))
    {
    }

    std::vector<Span> spans_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_SPAN_HPP
