#ifndef PIIGUARD_PIPELINE_BATCH_RUNNER_HPP
#define PIIGUARD_PIPELINE_BATCH_RUNNER_HPP

#include <string>
#include <vector>
#include <future>
#include <chrono>
#include "anonymizer.hpp"
#include "../util/thread_pool.hpp"
#include "../util/logger.hpp"

/**
 * @file batch_runner.hpp
 * @brief Anonymizes many independent documents on a worker pool.
 *
 * DESIGN GOALS:
 *   - Output has the same length and order as the input.
 *   - A failure (exception or timeout) is recorded on its own item and
 *     never touches the other items.
 *   - The timeout runs from the moment a worker starts the document, so
 *     time spent queued behind slow neighbours does not count against it.
 *   - A timed-out document is abandoned, not retried. Its worker finishes
 *     it in the background and the result is thrown away; the runner's
 *     destructor waits for such stragglers.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piiguard::pipeline::BatchRunner runner(anonymizer, 4, std::chrono::milliseconds(2000));
 *   auto results = runner.run({"John Doe paid $500", "Call 555-222-3333"});
 *   for (const auto &item : results) {
 *       if (!item.ok) { ... item.error ... }
 *   }
 *   @endcode
 */

namespace piiguard {
namespace pipeline {

/**
 * @struct BatchItemResult
 * @brief Outcome for one document. ok == false is the failure marker.
 */
struct BatchItemResult
{
    bool ok = false;
    std::string text;
    audit::AuditLog auditLog;
    std::string error;
};

class BatchRunner
{
public:
    /**
     * @param anonymizer Must outlive the runner.
     * @param workers Worker threads; 0 uses hardware concurrency.
     * @param documentTimeout Per-document limit; zero disables it.
     */
    explicit BatchRunner(const Anonymizer &anonymizer,
                         std::size_t workers = 0,
                         std::chrono::milliseconds documentTimeout = std::chrono::milliseconds(0))
        : anonymizer_(anonymizer),
          documentTimeout_(documentTimeout),
          pool_(workers)
    {
    }

    std::vector<BatchItemResult> run(const std::vector<std::string> &texts,
                                     Strategy strategy = Strategy::Redact,
                                     bool audit = true)
    {
        std::vector<util::TaskHandle<AnonymizationResult>> pending;
        pending.reserve(texts.size());
        const Anonymizer &anonymizer = anonymizer_;
        for (const auto &text : texts) {
            pending.push_back(pool_.submit([&anonymizer, strategy, audit, text] {
                return anonymizer.anonymize(text, strategy, std::nullopt, audit);
            }));
        }

        std::vector<BatchItemResult> results(texts.size());
        std::size_t failures = 0;
        for (std::size_t i = 0; i < pending.size(); ++i) {
            BatchItemResult &item = results[i];
            if (documentTimeout_.count() > 0
                && pending[i].result.wait_until(pending[i].started.get() + documentTimeout_)
                       != std::future_status::ready)
            {
                item.error = "timed out after " + std::to_string(documentTimeout_.count()) + " ms";
                util::logger::error("BatchRunner: document " + std::to_string(i) + " abandoned, " + item.error);
                ++failures;
                continue;
            }
            try {
                AnonymizationResult result = pending[i].result.get();
                item.ok = true;
                item.text = std::move(result.text);
                item.auditLog = std::move(result.auditLog);
            } catch (const std::exception &ex) {
                item.error = ex.what();
                util::logger::error("BatchRunner: document " + std::to_string(i) + " failed: " + item.error);
                ++failures;
            } catch (...) {
                item.error = "unknown error";
                util::logger::error("BatchRunner: document " + std::to_string(i) + " failed with a non-standard exception");
                ++failures;
            }
        }

        util::logger::info("BatchRunner: processed " + std::to_string(texts.size()) + " documents, "
                           + std::to_string(failures) + " failed");
        return results;
    }

    std::size_t workerCount() const { return pool_.threadCount(); }

private:
    const Anonymizer &anonymizer_;
    std::chrono::milliseconds documentTimeout_;
    util::ThreadPool pool_;
};

} // namespace pipeline
} // namespace piiguard

#endif // PIIGUARD_PIPELINE_BATCH_RUNNER_HPP
