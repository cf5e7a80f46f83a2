#ifndef PIIGUARD_UTIL_CONFIG_PARSER_HPP
#define PIIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include "../../config/anonymizer_config.hpp"
#include "../core/errors.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" file into piiguard::config::AnonymizerConfig.
 *
 * Recognized keys:
 *   entity.<LABEL>=<token>                 add or override a model label
 *   entity.<LABEL>.enabled=false           drop a model label
 *   pattern.<NAME>.regex=<regex>           add or override a detector
 *   pattern.<NAME>.token=<token>
 *   pattern.<NAME>.icase=true|false
 *   pattern.<NAME>.enabled=false           drop a detector
 *   overlap_policy=model_wins|pattern_wins
 *   batch.workers=<n>                      0..1024, 0 = hardware concurrency
 *   batch.document_timeout_ms=<n>          0..86400000, 0 = no limit
 *   ner.endpoint=<url>
 *   ner.timeout_seconds=<n>                1..3600
 *   ner.offset_unit=byte|codepoint
 *   audit.document_digest=true|false
 *   log.level=debug|info|warn|error|critical
 *   log.file=<path>
 *
 * Only the first '=' splits key from value, so regexes may contain '='.
 * New detectors are appended after the stock ones, in file order.
 *
 * USAGE:
 *   @code
 *   piiguard::config::AnonymizerConfig cfg;
 *   piiguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piiguard.conf");
 *   auto registry = piiguard::core::PiiRegistry::fromConfig(cfg);
 *   @endcode
 */

namespace piiguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Minimal parser that reads a plain text key=value config into an AnonymizerConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(config::AnonymizerConfig &cfg)
        : cfg_(cfg)
    {
    }

    /**
     * @brief Read the given file line by line. A missing file leaves the defaults in place.
     * @return false if the file does not exist.
     * @throw core::ConfigurationError on a malformed line or value.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile, filepath);
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @throw core::ConfigurationError on a malformed line or value.
     */
    inline void loadFromStream(std::istream &in, const std::string &origin = "<stream>")
    {
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw core::ConfigurationError(origin + ":" + std::to_string(lineNo)
                                               + ": invalid line (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            try {
                applyKeyValue(key, val);
            } catch (const core::ConfigurationError &ex) {
                throw core::ConfigurationError(origin + ":" + std::to_string(lineNo) + ": " + ex.what());
            }
        }
    }

private:
    static constexpr uint64_t kMaxWorkers = 1024;
    static constexpr uint64_t kMaxDocumentTimeoutMs = 24ULL * 60 * 60 * 1000;
    static constexpr uint64_t kMaxNerTimeoutSeconds = 3600;

    config::AnonymizerConfig &cfg_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        static const std::string entityPrefix = "entity.";
        static const std::string patternPrefix = "pattern.";

        if (startsWith(key, entityPrefix)) {
            applyEntityKey(key.substr(entityPrefix.size()), val);
        }
        else if (startsWith(key, patternPrefix)) {
            applyPatternKey(key.substr(patternPrefix.size()), val);
        }
        else if (key == "overlap_policy") {
            cfg_.overlapPolicy = val;
        }
        else if (key == "batch.workers") {
            cfg_.workers = static_cast<uint32_t>(parseUInt(val, 0, kMaxWorkers));
        }
        else if (key == "batch.document_timeout_ms") {
            cfg_.documentTimeoutMs = parseUInt(val, 0, kMaxDocumentTimeoutMs);
        }
        else if (key == "ner.endpoint") {
            cfg_.nerEndpoint = val;
        }
        else if (key == "ner.timeout_seconds") {
            cfg_.nerTimeoutSeconds = static_cast<uint32_t>(parseUInt(val, 1, kMaxNerTimeoutSeconds));
        }
        else if (key == "ner.offset_unit") {
            cfg_.nerOffsetUnit = val;
        }
        else if (key == "audit.document_digest") {
            cfg_.documentDigest = parseBool(val);
        }
        else if (key == "log.level") {
            cfg_.logLevel = val;
        }
        else if (key == "log.file") {
            cfg_.logFile = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set");
    }

    /// rest is "<LABEL>" or "<LABEL>.enabled"
    inline void applyEntityKey(const std::string &rest, const std::string &val)
    {
        static const std::string enabledSuffix = ".enabled";
        auto &table = cfg_.entityTokens;

        if (endsWith(rest, enabledSuffix)) {
            const std::string label = rest.substr(0, rest.size() - enabledSuffix.size());
            if (!parseBool(val)) {
                table.erase(std::remove_if(table.begin(), table.end(),
                                [&label](const config::EntityTokenEntry &e) { return e.label == label; }),
                            table.end());
            }
            return;
        }
        if (rest.empty()) {
            throw core::ConfigurationError("entity key without a label");
        }
        for (auto &entry : table) {
            if (entry.label == rest) {
                entry.token = val;
                return;
            }
        }
        table.push_back({rest, val});
    }

    /// rest is "<NAME>.<field>"
    inline void applyPatternKey(const std::string &rest, const std::string &val)
    {
        auto dot = rest.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            throw core::ConfigurationError("pattern key must look like pattern.<NAME>.<field>: pattern." + rest);
        }
        const std::string name = rest.substr(0, dot);
        const std::string field = rest.substr(dot + 1);
        auto &table = cfg_.patterns;

        if (field == "enabled") {
            if (!parseBool(val)) {
                table.erase(std::remove_if(table.begin(), table.end(),
                                [&name](const config::PatternEntry &p) { return p.name == name; }),
                            table.end());
            }
            return;
        }

        config::PatternEntry *entry = nullptr;
        for (auto &p : table) {
            if (p.name == name) {
                entry = &p;
                break;
            }
        }
        if (entry == nullptr) {
            table.push_back(config::PatternEntry{name, "", "", false});
            entry = &table.back();
        }

        if (field == "regex") {
            entry->regex = val;
        } else if (field == "token") {
            entry->token = val;
        } else if (field == "icase") {
            entry->caseInsensitive = parseBool(val);
        } else {
            throw core::ConfigurationError("unknown pattern field '" + field + "' for pattern " + name);
        }
    }

    static bool startsWith(const std::string &s, const std::string &prefix)
    {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    static bool endsWith(const std::string &s, const std::string &suffix)
    {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline bool parseBool(const std::string &val) const
    {
        std::string lower;
        for (char c : val) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (lower == "true" || lower == "yes" || lower == "1") {
            return true;
        }
        if (lower == "false" || lower == "no" || lower == "0") {
            return false;
        }
        throw core::ConfigurationError("expected a boolean, got '" + val + "'");
    }

    /// Values outside [minValue, maxValue] are rejected, never wrapped.
    inline uint64_t parseUInt(const std::string &val, uint64_t minValue, uint64_t maxValue) const
    {
        if (val.empty() || val[0] == '-') {
            throw core::ConfigurationError("expected an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
            if (n < minValue || n > maxValue) {
                throw std::out_of_range("allowed range is " + std::to_string(minValue) + ".."
                                        + std::to_string(maxValue));
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw core::ConfigurationError("parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CONFIG_PARSER_HPP
