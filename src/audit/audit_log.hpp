#ifndef PIIGUARD_AUDIT_AUDIT_LOG_HPP
#define PIIGUARD_AUDIT_AUDIT_LOG_HPP

#include <string>
#include <vector>
#include <utility>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cstddef>
#include "../util/json.hpp"

/**
 * @file audit_log.hpp
 * @brief The per-document record of what was redacted.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto result = anonymizer.anonymize("Contact me at john.doe@example.com.");
 *   result.auditLog.totalMasked;          // 1
 *   result.auditLog.countFor("EMAIL");    // 1
 *   std::string json = result.auditLog.toJson();
 *   // => {"total_masked":1,"by_type":{"EMAIL":1},"masked_entities":[{"type":"EMAIL",
 *   //     "original":"john.doe@example.com","replacement":"[REDACTED_EMAIL]"}],
 *   //     "timestamp":"2026-10-18T09:15:02.118734Z"}
 *   @endcode
 */

namespace piiguard {
namespace audit {

/**
 * @struct AuditRecord
 * @brief One applied redaction. Never modified after it is appended.
 */
struct AuditRecord
{
    std::string label;
    std::string originalText;
    std::string replacementToken;
};

/**
 * @brief Format a time point as UTC ISO-8601 with microseconds, e.g. 2026-10-18T09:15:02.118734Z.
 */
inline std::string formatTimestamp(std::chrono::system_clock::time_point when)
{
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()).count() % 1000000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &seconds);
#else
    gmtime_r(&seconds, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << (micros < 0 ? micros + 1000000 : micros) << 'Z';
    return oss.str();
}

/**
 * @struct AuditLog
 * @brief Aggregate for one document.
 *
 * byType lists labels in first-seen order, i.e. the order in which each
 * label first occurs among the applied spans sorted by start offset.
 * maskedEntities is sorted the same way.
 */
struct AuditLog
{
    std::size_t totalMasked = 0;
    std::vector<std::pair<std::string, std::size_t>> byType;
    std::vector<AuditRecord> maskedEntities;
    std::string timestamp;        ///< When this log was created
    std::string documentSha256;   ///< Empty unless digests are enabled

    /**
     * @brief Count of applied spans with the given label, 0 if none.
     */
    std::size_t countFor(const std::string &label) const
    {
        for (const auto &entry : byType) {
            if (entry.first == label) {
                return entry.second;
            }
        }
        return 0;
    }

    inline std::string toJson() const
    {
        using util::json::escapeString;

        std::ostringstream oss;
        oss << R"({"total_masked":)" << totalMasked << ",";
        oss << R"("by_type":{)";
        bool first = true;
        for (const auto &entry : byType) {
            if (!first) {
                oss << ",";
            }
            oss << "\"" << escapeString(entry.first) << "\":" << entry.second;
            first = false;
        }
        oss << R"(},"masked_entities":[)";
        first = true;
        for (const auto &record : maskedEntities) {
            if (!first) {
                oss << ",";
            }
            oss << R"({"type":")" << escapeString(record.label)
                << R"(","original":")" << escapeString(record.originalText)
                << R"(","replacement":")" << escapeString(record.replacementToken) << "\"}";
            first = false;
        }
        oss << R"(],"timestamp":")" << escapeString(timestamp) << "\"";
        if (!documentSha256.empty()) {
            oss << R"(,"document_sha256":")" << documentSha256 << "\"";
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace audit
} // namespace piiguard

#endif // PIIGUARD_AUDIT_AUDIT_LOG_HPP
