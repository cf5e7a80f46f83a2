#ifndef PIIGUARD_PIPELINE_ANONYMIZER_HPP
#define PIIGUARD_PIPELINE_ANONYMIZER_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include "../core/span.hpp"
#include "../core/errors.hpp"
#include "../core/pii_registry.hpp"
#include "../core/span_resolver.hpp"
#include "../core/redactor.hpp"
#include "../detection/entity_source.hpp"
#include "../detection/pattern_matcher_set.hpp"
#include "../audit/audit_logger.hpp"
#include "../util/utf8.hpp"
#include "../util/logger.hpp"

/**
 * @file anonymizer.hpp
 * @brief Single-document pipeline: detect, resolve, redact, audit.
 *
 * DESIGN GOALS:
 *   - Stateless across calls. The only shared object is the optional
 *     EntityModelHandle, which is read-only once built.
 *   - Fail open on the model: if it is unavailable or inference fails the
 *     document is still anonymized with the pattern detectors alone.
 *   - Never throws for ordinary text, whatever its script or punctuation.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   auto registry = core::PiiRegistry::fromConfig(config::AnonymizerConfig());
 *   pipeline::Anonymizer anonymizer(registry, &model);
 *
 *   auto result = anonymizer.anonymize("My name is John Doe.");
 *   // result.text == "My name is [REDACTED_PERSON]."
 *
 *   auto onlyNames = anonymizer.anonymize(text, pipeline::Strategy::Redact,
 *                                         core::PiiTypeFilter({"PERSON"}));
 *   @endcode
 */

namespace piiguard {
namespace pipeline {

/**
 * @enum Strategy
 * @brief How detected spans are masked. Only token redaction exists today.
 */
enum class Strategy {
    Redact
};

struct AnonymizationResult
{
    std::string text;
    audit::AuditLog auditLog;
};

class Anonymizer
{
public:
    /**
     * @param registry Validated configuration; must outlive the Anonymizer.
     * @param model Shared entity model, or nullptr to run on patterns only.
     * @param documentDigest Add a SHA-256 of each source document to its audit log.
     */
    Anonymizer(const core::PiiRegistry &registry,
               const detection::EntityModelHandle *model,
               bool documentDigest = false)
        : registry_(registry),
          model_(model),
          matchers_(registry),
          resolver_(registry.overlapPolicy()),
          documentDigest_(documentDigest)
    {
    }

    /**
     * @brief Anonymize one document.
     * @param text Input; an empty string is returned unchanged with an empty log.
     * @param strategy Masking strategy.
     * @param include Labels / pattern names to redact; std::nullopt means all.
     * @param audit If false, no records are built and the returned log is empty.
     */
    AnonymizationResult anonymize(const std::string &text,
                                  Strategy strategy = Strategy::Redact,
                                  const core::PiiTypeFilter &include = std::nullopt,
                                  bool audit = true) const
    {
        AnonymizationResult result;
        if (text.empty()) {
            result.text = text;
            result.auditLog = audit::AuditLogger().finish();
            return result;
        }
        warnUnknownTypes(include);

        const std::vector<detection::Zone> zones = matchers_.exclusionZones(text);
        std::vector<core::Span> modelSpans = detectModelSpans(text, zones, include);
        std::vector<core::Span> patternSpans = matchers_.match(text, zones, include);

        core::ResolvedSpanSet resolved = resolver_.resolve(modelSpans, patternSpans, include);
        while (!resolved.empty()) {
            std::vector<core::Span> residual = residualPatternSpans(text, resolved, include);
            const std::size_t before = resolved.size();
            if (!residual.empty()) {
                resolved = resolver_.extend(resolved, std::move(residual));
            }
            if (resolved.size() == before) {
                break;
            }
        }
        switch (strategy) {
        case Strategy::Redact:
            result.text = core::Redactor::apply(text, resolved);
            break;
        }

        if (audit) {
            result.auditLog = audit::AuditLogger::build(text, resolved, documentDigest_);
        } else {
            result.auditLog = audit::AuditLogger().finish();
        }

        util::logger::info("Anonymizer: masked " + std::to_string(resolved.size()) + " of "
                           + std::to_string(modelSpans.size()) + " model / "
                           + std::to_string(patternSpans.size()) + " pattern candidates");
        return result;
    }

private:
    /**
     * Model spans that survive sanitation: valid byte range on code point
     * boundaries, configured and admitted label, clear of existing tokens.
     * Model failures are logged and yield no spans.
     */
    std::vector<core::Span> detectModelSpans(const std::string &text,
                                             const std::vector<detection::Zone> &zones,
                                             const core::PiiTypeFilter &include) const
    {
        std::vector<core::Span> spans;
        if (model_ == nullptr) {
            return spans;
        }

        std::vector<core::Span> raw;
        try {
            raw = model_->detect(text);
        } catch (const core::ModelUnavailableError &ex) {
            util::logger::error(std::string("Anonymizer: entity model unavailable, using patterns only: ") + ex.what());
            return spans;
        } catch (const core::InferenceError &ex) {
            util::logger::error(std::string("Anonymizer: entity inference failed, using patterns only: ") + ex.what());
            return spans;
        }

        const auto &rules = registry_.entityRules();
        for (auto &span : raw) {
            if (span.start >= span.end || span.end > text.size()
                || !util::utf8::isBoundary(text, span.start) || !util::utf8::isBoundary(text, span.end))
            {
                util::logger::warn("Anonymizer: dropped model span [" + std::to_string(span.start) + ", "
                                   + std::to_string(span.end) + ") with invalid offsets for a "
                                   + std::to_string(text.size()) + "-byte text");
                continue;
            }
            const core::EntityRule *rule = registry_.findEntity(span.label);
            if (rule == nullptr || !core::admits(include, span.label)) {
                continue;
            }
            if (detection::PatternMatcherSet::touchesZone(zones, span.start, span.end)) {
                continue;
            }

            span.source = core::SpanSource::Model;
            span.originalText = text.substr(span.start, span.end - span.start);
            span.replacementToken = rule->token;
            span.detectorOrder = static_cast<std::size_t>(rule - rules.data());
            spans.push_back(std::move(span));
        }
        return spans;
    }

    /**
     * Pattern matches left in the redacted text outside every token, mapped
     * back to offsets in text. A pattern match that lost an overlap can leave
     * a remainder that is PII on its own, e.g. "doe@example.com" after a
     * model span took "john" out of "john.doe@example.com".
     */
    std::vector<core::Span> residualPatternSpans(const std::string &text,
                                                 const core::ResolvedSpanSet &resolved,
                                                 const core::PiiTypeFilter &include) const
    {
        const std::string working = core::Redactor::apply(text, resolved);
        std::vector<core::Span> found = matchers_.match(working, matchers_.exclusionZones(working), include);

        // Every applied token is an exclusion zone of working, so each match
        // sits in one unredacted stretch and maps back by a constant shift.
        for (auto &span : found) {
            long long shift = 0;
            for (const auto &applied : resolved) {
                const long long tokenEnd = static_cast<long long>(applied.start) + shift
                                           + static_cast<long long>(applied.replacementToken.size());
                if (tokenEnd > static_cast<long long>(span.start)) {
                    break;
                }
                shift += static_cast<long long>(applied.replacementToken.size())
                         - static_cast<long long>(applied.length());
            }
            span.start = static_cast<std::size_t>(static_cast<long long>(span.start) - shift);
            span.end = span.start + span.originalText.size();
        }
        if (!found.empty()) {
            util::logger::debug("Anonymizer: " + std::to_string(found.size())
                                + " pattern matches left over after resolution");
        }
        return found;
    }

    void warnUnknownTypes(const core::PiiTypeFilter &include) const
    {
        if (!include) {
            return;
        }
        for (const auto &name : *include) {
            if (!registry_.isConfiguredType(name)) {
                util::logger::warn("Anonymizer: requested PII type '" + name + "' is not configured, ignoring it");
            }
        }
    }

    const core::PiiRegistry &registry_;
    const detection::EntityModelHandle *model_;
    detection::PatternMatcherSet matchers_;
    core::SpanResolver resolver_;
    bool documentDigest_;
};

} // namespace pipeline
} // namespace piiguard

#endif // PIIGUARD_PIPELINE_ANONYMIZER_HPP
