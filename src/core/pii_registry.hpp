#ifndef PIIGUARD_CORE_PII_REGISTRY_HPP
#define PIIGUARD_CORE_PII_REGISTRY_HPP

#include <string>
#include <vector>
#include <memory>
#include <re2/re2.h>
#include <optional>
#include <unordered_set>
#include "errors.hpp"
#include "../../config/anonymizer_config.hpp"
#include "../util/logger.hpp"

/**
 * @file pii_registry.hpp
 * @brief The validated, compiled form of the anonymizer configuration.
 *
 * DESIGN GOALS:
 *   - Every label, pattern and token used at runtime comes from here.
 *   - All checks happen in fromConfig(): a registry that exists is usable,
 *     so nothing can fail for configuration reasons mid-request.
 *   - Well-known categories are enumerated (KnownLabel); anything else is
 *     carried as a custom entry with the same treatment.
 *   - Patterns are RE2 expressions: matching time is linear in the input,
 *     so no document can exhaust the stack. RE2 has no lookaround; checks
 *     a regex cannot express live in isPlausibleMatch().
 *
 * USAGE EXAMPLE:
 *   @code
 *   piiguard::config::AnonymizerConfig cfg;           // stock tables
 *   auto registry = piiguard::core::PiiRegistry::fromConfig(cfg);
 *   const auto *person = registry.findEntity("PERSON"); // token "[REDACTED_PERSON]"
 *   @endcode
 */

namespace piiguard {
namespace core {

/**
 * @enum KnownLabel
 * @brief PII categories the stock configuration knows about.
 */
enum class KnownLabel {
    Person,
    Location,
    Organization,
    Amount,
    Email,
    Phone,
    NationalId
};

/**
 * @brief The configuration label used for a known category.
 */
inline const char *labelName(KnownLabel label)
{
    switch (label) {
    case KnownLabel::Person:       return "PERSON";
    case KnownLabel::Location:     return "GPE";
    case KnownLabel::Organization: return "ORG";
    case KnownLabel::Amount:       return "MONEY";
    case KnownLabel::Email:        return "EMAIL";
    case KnownLabel::Phone:        return "PHONE";
    case KnownLabel::NationalId:   return "SSN";
    }
    return "UNKNOWN";
}

inline std::optional<KnownLabel> knownLabelFromName(const std::string &name)
{
    static const KnownLabel all[] = {
        KnownLabel::Person, KnownLabel::Location, KnownLabel::Organization,
        KnownLabel::Amount, KnownLabel::Email, KnownLabel::Phone, KnownLabel::NationalId};
    for (KnownLabel label : all) {
        if (name == labelName(label)) {
            return label;
        }
    }
    return std::nullopt;
}

/**
 * @brief Caller restriction on which labels / pattern names may be redacted.
 *        std::nullopt means every configured type is eligible.
 */
using PiiTypeFilter = std::optional<std::unordered_set<std::string>>;

inline bool admits(const PiiTypeFilter &filter, const std::string &name)
{
    return !filter || filter->count(name) > 0;
}

/**
 * @enum OverlapPolicy
 * @brief Which detector family wins when a model span and a pattern span overlap.
 */
enum class OverlapPolicy {
    ModelWins,
    PatternWins
};

inline OverlapPolicy parseOverlapPolicy(const std::string &value)
{
    if (value == "model_wins") {
        return OverlapPolicy::ModelWins;
    }
    if (value == "pattern_wins") {
        return OverlapPolicy::PatternWins;
    }
    throw ConfigurationError("overlap_policy must be 'model_wins' or 'pattern_wins', got '" + value + "'");
}

/**
 * @brief Rules a regex match of a known category must also satisfy.
 *
 * NationalId (SSN): area 000 and 666, group 00 and serial 0000 are never
 * issued, so "000-12-3456" is not treated as an SSN.
 */
inline bool isPlausibleMatch(const std::optional<KnownLabel> &known, const std::string &match)
{
    if (!known || *known != KnownLabel::NationalId) {
        return true;
    }
    std::string digits;
    for (char c : match) {
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
        }
    }
    if (digits.size() != 9) {
        return false;
    }
    const std::string area = digits.substr(0, 3);
    return area != "000" && area != "666"
        && digits.compare(3, 2, "00") != 0
        && digits.compare(5, 4, "0000") != 0;
}

/**
 * @struct EntityRule
 * @brief Token assignment for one model label.
 */
struct EntityRule
{
    std::string label;
    std::string token;
};

/**
 * @struct PatternRule
 * @brief One compiled pattern detector.
 */
struct PatternRule
{
    std::string name;
    std::string expression;   ///< Source text of the regex, kept for diagnostics
    std::shared_ptr<const RE2> regex;
    std::string token;
    bool caseInsensitive = false;
    std::optional<KnownLabel> known;
};

/**
 * @class PiiRegistry
 * @brief Immutable, validated label/pattern/token tables.
 */
class PiiRegistry
{
public:
    /**
     * @brief Validate and compile a raw configuration.
     * @throw PatternCompilationError if a pattern does not compile.
     * @throw ConfigurationError for empty names, empty tokens, duplicates or a bad overlap policy.
     */
    static PiiRegistry fromConfig(const config::AnonymizerConfig &cfg)
    {
        PiiRegistry registry;
        registry.overlapPolicy_ = parseOverlapPolicy(cfg.overlapPolicy);

        std::unordered_set<std::string> seen;
        for (const auto &entry : cfg.entityTokens) {
            if (entry.label.empty()) {
                throw ConfigurationError("entity label must not be empty");
            }
            if (entry.token.empty()) {
                throw ConfigurationError("entity '" + entry.label + "' has an empty token");
            }
            if (!seen.insert(entry.label).second) {
                throw ConfigurationError("entity '" + entry.label + "' is declared twice");
            }
            registry.entities_.push_back({entry.label, entry.token});
            registry.addToken(entry.token);
        }

        seen.clear();
        for (const auto &entry : cfg.patterns) {
            if (entry.name.empty()) {
                throw ConfigurationError("pattern name must not be empty");
            }
            if (entry.regex.empty()) {
                throw ConfigurationError("pattern '" + entry.name + "' has no regex");
            }
            if (entry.token.empty()) {
                throw ConfigurationError("pattern '" + entry.name + "' has an empty token");
            }
            if (!seen.insert(entry.name).second) {
                throw ConfigurationError("pattern '" + entry.name + "' is declared twice");
            }

            RE2::Options options;
            options.set_case_sensitive(!entry.caseInsensitive);
            options.set_log_errors(false);
            auto compiled = std::make_shared<const RE2>(entry.regex, options);
            if (!compiled->ok()) {
                throw PatternCompilationError(entry.name, compiled->error());
            }

            PatternRule rule;
            rule.name = entry.name;
            rule.expression = entry.regex;
            rule.regex = std::move(compiled);
            rule.token = entry.token;
            rule.caseInsensitive = entry.caseInsensitive;
            rule.known = knownLabelFromName(entry.name);
            registry.patterns_.push_back(std::move(rule));
            registry.addToken(entry.token);
        }

        util::logger::debug("PiiRegistry: loaded " + std::to_string(registry.entities_.size())
                            + " entity labels, " + std::to_string(registry.patterns_.size())
                            + " patterns, " + std::to_string(registry.tokens_.size()) + " distinct tokens");
        return registry;
    }

    const std::vector<EntityRule> &entityRules() const { return entities_; }
    const std::vector<PatternRule> &patternRules() const { return patterns_; }

    /**
     * @brief Every distinct redaction token, in first-declared order.
     */
    const std::vector<std::string> &tokenVocabulary() const { return tokens_; }

    OverlapPolicy overlapPolicy() const { return overlapPolicy_; }

    /**
     * @brief Entity rule for a model label, or nullptr if the label is not configured.
     */
    const EntityRule *findEntity(const std::string &label) const
    {
        for (const auto &rule : entities_) {
            if (rule.label == label) {
                return &rule;
            }
        }
        return nullptr;
    }

    /**
     * @brief True if name is a configured entity label or pattern name.
     */
    bool isConfiguredType(const std::string &name) const
    {
        if (findEntity(name) != nullptr) {
            return true;
        }
        for (const auto &rule : patterns_) {
            if (rule.name == name) {
                return true;
            }
        }
        return false;
    }

private:
    PiiRegistry() = default;

    void addToken(const std::string &token)
    {
        for (const auto &existing : tokens_) {
            if (existing == token) {
                return;
            }
        }
        tokens_.push_back(token);
    }

    std::vector<EntityRule> entities_;
    std::vector<PatternRule> patterns_;
    std::vector<std::string> tokens_;
    OverlapPolicy overlapPolicy_ = OverlapPolicy::ModelWins;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_PII_REGISTRY_HPP
