#ifndef PIIGUARD_AUDIT_AUDIT_LOGGER_HPP
#define PIIGUARD_AUDIT_AUDIT_LOGGER_HPP

#include <string>
#include <chrono>
#include <stdexcept>
#include "audit_log.hpp"
#include "../core/span.hpp"
#include "../util/hashing.hpp"

/**
 * @file audit_logger.hpp
 * @brief Accumulates applied redactions into an AuditLog.
 *
 * An AuditLogger lives for exactly one anonymize() call. The timestamp is
 * taken when the logger is created, not when the source text was written.
 */

namespace piiguard {
namespace audit {

class AuditLogger
{
public:
    AuditLogger()
    {
        log_.timestamp = formatTimestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Append one applied span. Records are kept in call order.
     */
    void record(const core::Span &span)
    {
        log_.maskedEntities.push_back({span.label, span.originalText, span.replacementToken});
        ++log_.totalMasked;
        for (auto &entry : log_.byType) {
            if (entry.first == span.label) {
                ++entry.second;
                return;
            }
        }
        log_.byType.emplace_back(span.label, 1);
    }

    /**
     * @brief Attach the SHA-256 of the source document.
     */
    void attachDigest(const std::string &originalText)
    {
        log_.documentSha256 = util::hashing::sha256Hex(originalText);
    }

    /**
     * @brief Hand the finished log over. The logger must not be used afterwards.
     */
    AuditLog finish()
    {
        return std::move(log_);
    }

    /**
     * @brief Build the log for every span of a resolved set, in ascending start order.
     * @throw std::invalid_argument if a span does not describe originalText.
     */
    static AuditLog build(const std::string &originalText,
                          const core::ResolvedSpanSet &applied,
                          bool withDigest)
    {
        AuditLogger logger;
        for (const auto &span : applied) {
            if (span.end > originalText.size()
                || originalText.compare(span.start, span.length(), span.originalText) != 0)
            {
                throw std::invalid_argument("AuditLogger: span does not belong to the audited text");
            }
            logger.record(span);
        }
        if (withDigest) {
            logger.attachDigest(originalText);
        }
        return logger.finish();
    }

private:
    AuditLog log_;
};

} // namespace audit
} // namespace piiguard

#endif // PIIGUARD_AUDIT_AUDIT_LOGGER_HPP
