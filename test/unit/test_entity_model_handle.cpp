// test/unit/test_entity_model_handle.cpp
// -----------------------------------------------------------
// Lazy, shared construction of the entity model.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "detection/entity_source.hpp"
#include "unit/fake_entity_sources.hpp"

namespace {

using piiguard::core::InferenceError;
using piiguard::core::ModelUnavailableError;
using piiguard::detection::EntityModelHandle;
using piiguard::detection::EntitySource;
namespace fakes = piiguard::test;

TEST(EntityModelHandleTest, BuildsOnFirstUseOnly) {
    int built = 0;
    EntityModelHandle handle([&built] {
        ++built;
        return std::make_unique<fakes::LexiconEntitySource>(fakes::defaultLexicon());
    });
    EXPECT_FALSE(handle.isInitialized());
    EXPECT_EQ(built, 0);

    auto spans = handle.detect("John Doe");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].label, "PERSON");
    handle.detect("Jane Smith");
    EXPECT_TRUE(handle.isInitialized());
    EXPECT_EQ(built, 1);
}

TEST(EntityModelHandleTest, ConcurrentFirstCallsBuildOnce) {
    std::atomic<int> built{0};
    EntityModelHandle handle([&built] {
        ++built;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return std::make_unique<fakes::LexiconEntitySource>(fakes::defaultLexicon());
    });

    std::atomic<int> personHits{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&handle, &personHits] {
            if (handle.detect("hello John Doe").size() == 1) {
                ++personHits;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(built.load(), 1);
    EXPECT_EQ(personHits.load(), 8);
}

TEST(EntityModelHandleTest, FailedConstructionIsRetried) {
    int attempts = 0;
    EntityModelHandle handle([&attempts]() -> std::unique_ptr<EntitySource> {
        if (++attempts == 1) {
            throw std::runtime_error("model files still downloading");
        }
        return std::make_unique<fakes::LexiconEntitySource>(fakes::defaultLexicon());
    });

    EXPECT_THROW(handle.detect("John Doe"), ModelUnavailableError);
    EXPECT_FALSE(handle.isInitialized());
    EXPECT_EQ(handle.detect("John Doe").size(), 1u);
    EXPECT_EQ(attempts, 2);
}

TEST(EntityModelHandleTest, NullFactoryResultIsUnavailable) {
    EntityModelHandle handle([]() -> std::unique_ptr<EntitySource> { return nullptr; });
    EXPECT_THROW(handle.detect("text"), ModelUnavailableError);
    EntityModelHandle empty(nullptr);
    EXPECT_THROW(empty.detect("text"), ModelUnavailableError);
}

TEST(EntityModelHandleTest, ErrorsAreNormalized) {
    EntityModelHandle unavailable(
        [] { return std::make_unique<fakes::FailingEntitySource>(fakes::FailureKind::Unavailable); });
    EXPECT_THROW(unavailable.detect("x"), ModelUnavailableError);

    EntityModelHandle inference(
        [] { return std::make_unique<fakes::FailingEntitySource>(fakes::FailureKind::Inference); });
    EXPECT_THROW(inference.detect("x"), InferenceError);

    EntityModelHandle other(
        [] { return std::make_unique<fakes::FailingEntitySource>(fakes::FailureKind::StdException); });
    try {
        other.detect("x");
        FAIL() << "expected InferenceError";
    } catch (const InferenceError& ex) {
        EXPECT_NE(std::string(ex.what()).find("failing"), std::string::npos) << ex.what();
    }
}

} // anonymous namespace
