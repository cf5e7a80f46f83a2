// test/unit/test_batch_runner.cpp
// -----------------------------------------------------------
// Batch anonymization on the worker pool.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/anonymizer_config.hpp"
#include "core/pii_registry.hpp"
#include "pipeline/anonymizer.hpp"
#include "pipeline/batch_runner.hpp"
#include "util/thread_pool.hpp"
#include "unit/fake_entity_sources.hpp"

namespace {

using piiguard::audit::AuditLog;
using piiguard::config::AnonymizerConfig;
using piiguard::core::PiiRegistry;
using piiguard::detection::EntityModelHandle;
using piiguard::pipeline::Anonymizer;
using piiguard::pipeline::BatchRunner;
namespace fakes = piiguard::test;

void expectSameAudit(const AuditLog& a, const AuditLog& b) {
    EXPECT_EQ(a.totalMasked, b.totalMasked);
    EXPECT_EQ(a.byType, b.byType);
    ASSERT_EQ(a.maskedEntities.size(), b.maskedEntities.size());
    for (std::size_t i = 0; i < a.maskedEntities.size(); ++i) {
        EXPECT_EQ(a.maskedEntities[i].label, b.maskedEntities[i].label);
        EXPECT_EQ(a.maskedEntities[i].originalText, b.maskedEntities[i].originalText);
        EXPECT_EQ(a.maskedEntities[i].replacementToken, b.maskedEntities[i].replacementToken);
    }
}

class BatchRunnerTest : public ::testing::Test {
protected:
    BatchRunnerTest()
        : registry_(PiiRegistry::fromConfig(AnonymizerConfig())),
          model_([] { return std::make_unique<fakes::SlowEntitySource>("SLOW", std::chrono::milliseconds(300)); }),
          anonymizer_(registry_, &model_) {}

    PiiRegistry registry_;
    EntityModelHandle model_;
    Anonymizer anonymizer_;
};

TEST_F(BatchRunnerTest, MatchesSingleDocumentResults) {
    const std::vector<std::string> texts = {
        "My name is John Doe.",
        "Contact me at john.doe@example.com or 555-123-4567.",
        "Acme Corp paid $1,000 in Paris.",
    };
    BatchRunner runner(anonymizer_, 3);
    auto results = runner.run(texts);

    ASSERT_EQ(results.size(), 3u);
    for (std::size_t i = 0; i < texts.size(); ++i) {
        ASSERT_TRUE(results[i].ok) << results[i].error;
        auto single = anonymizer_.anonymize(texts[i]);
        EXPECT_EQ(results[i].text, single.text);
        expectSameAudit(results[i].auditLog, single.auditLog);
    }
}

TEST_F(BatchRunnerTest, PreservesOrderForLargeBatches) {
    std::vector<std::string> texts;
    for (int i = 0; i < 64; ++i) {
        texts.push_back(i % 2 == 0 ? "doc " + std::to_string(i) + " by Jane Smith"
                                   : "doc " + std::to_string(i) + " mail x" + std::to_string(i) + "@y.com");
    }
    BatchRunner runner(anonymizer_, 4);
    auto results = runner.run(texts);

    ASSERT_EQ(results.size(), texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i) {
        ASSERT_TRUE(results[i].ok);
        const std::string expected = i % 2 == 0 ? "doc " + std::to_string(i) + " by [REDACTED_PERSON]"
                                                : "doc " + std::to_string(i) + " mail [REDACTED_EMAIL]";
        EXPECT_EQ(results[i].text, expected);
    }
}

TEST_F(BatchRunnerTest, EmptyBatchGivesEmptyResult) {
    BatchRunner runner(anonymizer_, 2);
    EXPECT_TRUE(runner.run({}).empty());
}

TEST_F(BatchRunnerTest, TimeoutMarksOnlyTheSlowDocument) {
    BatchRunner runner(anonymizer_, 4, std::chrono::milliseconds(50));
    auto results = runner.run({"John Doe", "SLOW John Doe", "Jane Smith"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_EQ(results[0].text, "[REDACTED_PERSON]");
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].error, "timed out after 50 ms");
    EXPECT_TRUE(results[1].text.empty());
    EXPECT_TRUE(results[2].ok);
    EXPECT_EQ(results[2].text, "[REDACTED_PERSON]");
}

TEST_F(BatchRunnerTest, QueuedDocumentsAreTimedFromTheirOwnStart) {
    BatchRunner runner(anonymizer_, 1, std::chrono::milliseconds(100));
    auto results = runner.run({"SLOW John Doe", "Jane Smith"});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_EQ(results[0].error, "timed out after 100 ms");
    ASSERT_TRUE(results[1].ok) << results[1].error;
    EXPECT_EQ(results[1].text, "[REDACTED_PERSON]");
}

TEST_F(BatchRunnerTest, MoreSlowDocumentsThanWorkers) {
    BatchRunner runner(anonymizer_, 2, std::chrono::milliseconds(100));
    auto results = runner.run({"SLOW a", "SLOW b", "SLOW c", "Jane Smith", "mail a@b.co"});

    ASSERT_EQ(results.size(), 5u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_FALSE(results[i].ok) << "document " << i;
        EXPECT_EQ(results[i].error, "timed out after 100 ms");
    }
    ASSERT_TRUE(results[3].ok) << results[3].error;
    EXPECT_EQ(results[3].text, "[REDACTED_PERSON]");
    ASSERT_TRUE(results[4].ok) << results[4].error;
    EXPECT_EQ(results[4].text, "mail [REDACTED_EMAIL]");
}

TEST(ThreadPoolTest, StartTimeIsTakenWhenAWorkerPicksTheJobUp) {
    piiguard::util::ThreadPool pool(1);
    auto blocker = pool.submit([] { std::this_thread::sleep_for(std::chrono::milliseconds(80)); });
    const auto submitted = std::chrono::steady_clock::now();
    auto queued = pool.submit([] { return 42; });

    EXPECT_GE(queued.started.get() - submitted, std::chrono::milliseconds(60));
    EXPECT_EQ(queued.result.get(), 42);
    blocker.result.get();
}

TEST(ThreadPoolTest, ExceptionsReachTheResult) {
    piiguard::util::ThreadPool pool(2);
    auto handle = pool.submit([]() -> int { throw std::runtime_error("bad document"); });
    EXPECT_THROW(handle.result.get(), std::runtime_error);
    EXPECT_EQ(pool.threadCount(), 2u);
}

TEST_F(BatchRunnerTest, FailureIsIsolatedToItsDocument) {
    BatchRunner runner(anonymizer_, 2);
    auto results = runner.run({"John Doe", "boom", "a@b.co"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].error, "unknown error");
    EXPECT_TRUE(results[2].ok);
    EXPECT_EQ(results[2].text, "[REDACTED_EMAIL]");
}

TEST_F(BatchRunnerTest, DisabledAuditGivesEmptyLogs) {
    BatchRunner runner(anonymizer_, 2);
    auto results = runner.run({"John Doe", "a@b.co"}, piiguard::pipeline::Strategy::Redact, false);
    for (const auto& item : results) {
        ASSERT_TRUE(item.ok);
        EXPECT_EQ(item.auditLog.totalMasked, 0u);
        EXPECT_TRUE(item.auditLog.maskedEntities.empty());
    }
}

TEST_F(BatchRunnerTest, WorkerCount) {
    EXPECT_EQ(BatchRunner(anonymizer_, 3).workerCount(), 3u);
    EXPECT_GE(BatchRunner(anonymizer_).workerCount(), 1u);
}

} // anonymous namespace
