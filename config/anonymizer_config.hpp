#ifndef PIIGUARD_CONFIG_ANONYMIZER_CONFIG_HPP
#define PIIGUARD_CONFIG_ANONYMIZER_CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>

/**
 * @file anonymizer_config.hpp
 * @brief Defines the raw configuration of a piiguard engine instance.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - It is loosely validated; PiiRegistry::fromConfig() turns it into the
 *     checked, compiled form used at runtime.
 */

namespace piiguard {
namespace config {

/**
 * @struct EntityTokenEntry
 * @brief Maps one model label (e.g. "PERSON") to its redaction token.
 */
struct EntityTokenEntry
{
    std::string label;
    std::string token;
};

/**
 * @struct PatternEntry
 * @brief One named pattern detector as written in configuration.
 */
struct PatternEntry
{
    std::string name;
    std::string regex;
    std::string token;
    bool caseInsensitive = false;
};

/**
 * @struct AnonymizerConfig
 * @brief Holds the engine configuration:
 *   - entityTokens: label -> token table for model-origin spans.
 *   - patterns: ordered named pattern detectors.
 *   - overlapPolicy: "model_wins" or "pattern_wins".
 *   - workers / documentTimeoutMs: BatchRunner settings.
 *   - nerEndpoint / nerTimeoutSeconds / nerOffsetUnit: remote entity model.
 *   - documentDigest: add a SHA-256 of the source document to audit logs.
 *   - logLevel / logFile: logger settings.
 */
struct AnonymizerConfig
{
    /**
     * @brief Construct a new AnonymizerConfig with the stock tables:
     *   PERSON, GPE, ORG, MONEY entity tokens
     *   EMAIL, PHONE, SSN patterns
     */
    AnonymizerConfig()
        : entityTokens{
              {"PERSON", "[REDACTED_PERSON]"},
              {"GPE", "[REDACTED_LOCATION]"},
              {"ORG", "[REDACTED_ORG]"},
              {"MONEY", "[REDACTED_AMOUNT]"}},
          patterns{
              {"EMAIL",
               R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
               "[REDACTED_EMAIL]",
               true},
              {"PHONE",
               R"(\b(?:\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}\b)",
               "[REDACTED_PHONE]",
               false},
              {"SSN",
               R"(\b[0-9]{3}-[0-9]{2}-[0-9]{4}\b)",
               "[REDACTED_SSN]",
               false}},
          overlapPolicy("model_wins"),
          workers(0),
          documentTimeoutMs(0),
          nerTimeoutSeconds(10),
          nerOffsetUnit("byte"),
          documentDigest(false),
          logLevel("info")
    {
    }

    /// Model label -> token, in declaration order.
    std::vector<EntityTokenEntry> entityTokens;

    /// Pattern detectors, applied and reported in this order.
    std::vector<PatternEntry> patterns;

    /// Which source wins when a model span and a pattern span overlap.
    std::string overlapPolicy;

    /// Worker threads for batch runs; 0 means hardware concurrency.
    uint32_t workers;

    /// Per-document timeout for batch runs in milliseconds; 0 disables it.
    uint64_t documentTimeoutMs;

    /// URL of the external NER service. Empty means "no model, patterns only".
    std::string nerEndpoint;

    uint32_t nerTimeoutSeconds;

    /// "byte" or "codepoint": unit of the offsets returned by the NER service.
    std::string nerOffsetUnit;

    bool documentDigest;

    std::string logLevel;

    /// Optional log file in addition to stderr.
    std::string logFile;
};

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_ANONYMIZER_CONFIG_HPP
