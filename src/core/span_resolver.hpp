#ifndef PIIGUARD_CORE_SPAN_RESOLVER_HPP
#define PIIGUARD_CORE_SPAN_RESOLVER_HPP

#include <vector>
#include <map>
#include <algorithm>
#include <iterator>
#include "span.hpp"
#include "pii_registry.hpp"

/**
 * @file span_resolver.hpp
 * @brief Merges model and pattern spans into one non-overlapping set.
 *
 * Rule, in order of precedence:
 *   1. Spans whose label is not admitted by the caller's filter are dropped.
 *   2. On overlap the higher-ranked source wins. Under ModelWins (the
 *      default) model spans outrank pattern spans; PatternWins inverts it.
 *   3. Between equal ranks the earlier start wins, then the longer span,
 *      then the rule declared first in configuration.
 *
 * Candidates are visited in that precedence order and accepted when they
 * overlap nothing accepted so far, so a dropped span never knocks out a
 * third span it alone overlapped.
 */

namespace piiguard {
namespace core {

class SpanResolver
{
public:
    explicit SpanResolver(OverlapPolicy policy = OverlapPolicy::ModelWins)
        : policy_(policy)
    {
    }

    ResolvedSpanSet resolve(const std::vector<Span> &modelSpans,
                            const std::vector<Span> &patternSpans,
                            const PiiTypeFilter &include) const
    {
        std::vector<Span> candidates;
        candidates.reserve(modelSpans.size() + patternSpans.size());
        for (const auto &span : modelSpans) {
            if (span.start < span.end && admits(include, span.label)) {
                candidates.push_back(span);
            }
        }
        for (const auto &span : patternSpans) {
            if (span.start < span.end && admits(include, span.label)) {
                candidates.push_back(span);
            }
        }

        std::stable_sort(candidates.begin(), candidates.end(),
            [this](const Span &a, const Span &b) {
                const int ra = rank(a.source);
                const int rb = rank(b.source);
                if (ra != rb) return ra > rb;
                if (a.start != b.start) return a.start < b.start;
                if (a.length() != b.length()) return a.length() > b.length();
                return a.detectorOrder < b.detectorOrder;
            });

        // start -> index into candidates of accepted spans
        std::map<std::size_t, std::size_t> accepted;
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (!collides(accepted, candidates, candidates[i])) {
                accepted.emplace(candidates[i].start, i);
            }
        }

        std::vector<Span> resolved;
        resolved.reserve(accepted.size());
        for (const auto &entry : accepted) {
            resolved.push_back(std::move(candidates[entry.second]));
        }
        return ResolvedSpanSet(std::move(resolved));
    }

    /**
     * @brief Add spans that were found after base was resolved.
     *
     * Extra spans are taken in (start asc, length desc, detector order asc)
     * order; each is kept if it overlaps neither base nor an extra span
     * already kept. Base spans are never displaced.
     */
    ResolvedSpanSet extend(const ResolvedSpanSet &base, std::vector<Span> extra) const
    {
        std::vector<Span> merged = base.spans();
        std::sort(extra.begin(), extra.end(),
            [](const Span &a, const Span &b) {
                if (a.start != b.start) return a.start < b.start;
                if (a.length() != b.length()) return a.length() > b.length();
                return a.detectorOrder < b.detectorOrder;
            });

        std::map<std::size_t, std::size_t> accepted;
        for (std::size_t i = 0; i < merged.size(); ++i) {
            accepted.emplace(merged[i].start, i);
        }
        for (auto &span : extra) {
            if (span.start < span.end && !collides(accepted, merged, span)) {
                merged.push_back(std::move(span));
                accepted.emplace(merged.back().start, merged.size() - 1);
            }
        }

        std::vector<Span> sorted;
        sorted.reserve(accepted.size());
        for (const auto &entry : accepted) {
            sorted.push_back(std::move(merged[entry.second]));
        }
        return ResolvedSpanSet(std::move(sorted));
    }

private:
    int rank(SpanSource source) const
    {
        const bool modelFirst = policy_ == OverlapPolicy::ModelWins;
        return (source == SpanSource::Model) == modelFirst ? 1 : 0;
    }

    static bool collides(const std::map<std::size_t, std::size_t> &accepted,
                         const std::vector<Span> &candidates,
                         const Span &span)
    {
        auto next = accepted.lower_bound(span.start);
        if (next != accepted.end() && candidates[next->second].overlaps(span)) {
            return true;
        }
        if (next != accepted.begin()) {
            auto prev = std::prev(next);
            if (candidates[prev->second].overlaps(span)) {
                return true;
            }
        }
        return false;
    }

    OverlapPolicy policy_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_SPAN_RESOLVER_HPP
