#ifndef PIIGUARD_DETECTION_PATTERN_MATCHER_SET_HPP
#define PIIGUARD_DETECTION_PATTERN_MATCHER_SET_HPP

#include <string>
#include <vector>
#include <re2/re2.h>
#include <utility>
#include "../core/span.hpp"
#include "../core/pii_registry.hpp"
#include "../util/logger.hpp"
#include "../util/utf8.hpp"

/**
 * @file pattern_matcher_set.hpp
 * @brief Runs the configured pattern detectors over a document.
 *
 * All matching happens on the original text. Regions already holding a
 * redaction token are exclusion zones: a match that touches one is
 * discarded, so a second pass over anonymized output finds nothing.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   detection::PatternMatcherSet matchers(registry);
 *   auto zones = matchers.exclusionZones(text);
 *   std::vector<core::Span> spans = matchers.match(text, zones, std::nullopt);
 *   @endcode
 */

namespace piiguard {
namespace detection {

/// Half-open byte range [first, second) occupied by an existing token.
using Zone = std::pair<std::size_t, std::size_t>;

class PatternMatcherSet
{
public:
    /// The registry must outlive the matcher set.
    explicit PatternMatcherSet(const core::PiiRegistry &registry)
        : registry_(registry)
    {
    }

    /**
     * @brief Every occurrence of any configured redaction token in text.
     */
    std::vector<Zone> exclusionZones(const std::string &text) const
    {
        std::vector<Zone> zones;
        for (const auto &token : registry_.tokenVocabulary()) {
            std::size_t pos = text.find(token);
            while (pos != std::string::npos) {
                zones.emplace_back(pos, pos + token.size());
                pos = text.find(token, pos + token.size());
            }
        }
        return zones;
    }

    /**
     * @brief True if [start, end) overlaps any zone.
     */
    static bool touchesZone(const std::vector<Zone> &zones, std::size_t start, std::size_t end)
    {
        for (const auto &zone : zones) {
            if (zone.first < end && start < zone.second) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Apply each admitted detector to text, in configuration order.
     *
     * Matches of one detector never overlap each other (successive leftmost
     * search); matches of different detectors may, and are left for the
     * SpanResolver. Empty matches are ignored, and so are matches of a known
     * category that fail core::isPlausibleMatch().
     */
    std::vector<core::Span> match(const std::string &text,
                                  const std::vector<Zone> &zones,
                                  const core::PiiTypeFilter &include) const
    {
        std::vector<core::Span> spans;
        const auto &rules = registry_.patternRules();
        for (std::size_t order = 0; order < rules.size(); ++order) {
            const core::PatternRule &rule = rules[order];
            if (!core::admits(include, rule.name)) {
                continue;
            }

            std::size_t found = 0;
            std::size_t discarded = 0;
            const re2::StringPiece input(text);
            re2::StringPiece m;
            std::size_t pos = 0;
            while (pos <= text.size()
                   && rule.regex->Match(input, pos, text.size(), RE2::UNANCHORED, &m, 1))
            {
                const auto start = static_cast<std::size_t>(m.data() - text.data());
                const auto end = start + m.size();
                if (m.empty()) {
                    pos = nextCodePoint(text, end);
                    continue;
                }
                pos = end;
                const std::string original(m.data(), m.size());
                if (touchesZone(zones, start, end) || !core::isPlausibleMatch(rule.known, original)) {
                    ++discarded;
                    continue;
                }

                core::Span span;
                span.start = start;
                span.end = end;
                span.label = rule.name;
                span.source = core::SpanSource::Pattern;
                span.originalText = original;
                span.replacementToken = rule.token;
                span.detectorOrder = order;
                spans.push_back(std::move(span));
                ++found;
            }

            if ((found > 0 || discarded > 0)
                && util::logger::Logger::getInstance().isEnabled(util::logger::LogLevel::DEBUG))
            {
                util::logger::debug("PatternMatcherSet: " + rule.name + " matched " + std::to_string(found)
                                    + ", discarded " + std::to_string(discarded));
            }
        }
        return spans;
    }

private:
    /// Position after the code point at pos; an empty match must never stall the scan.
    static std::size_t nextCodePoint(const std::string &text, std::size_t pos)
    {
        ++pos;
        while (pos < text.size() && !util::utf8::isBoundary(text, pos)) {
            ++pos;
        }
        return pos;
    }

    const core::PiiRegistry &registry_;
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_PATTERN_MATCHER_SET_HPP
