#ifndef PIIGUARD_DETECTION_ENTITY_SOURCE_HPP
#define PIIGUARD_DETECTION_ENTITY_SOURCE_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include "../core/span.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file entity_source.hpp
 * @brief Interface to the external named-entity model, and the handle the
 *        host application uses to share one model across all calls.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::detection;
 *
 *   EntityModelHandle model([] {
 *       return std::make_unique<RemoteEntitySource>(options);
 *   });
 *   // Pass &model into every Anonymizer. The source is built on first use.
 *   @endcode
 */

namespace piiguard {
namespace detection {

/**
 * @class EntitySource
 * @brief Black-box "text -> spans" entity recognizer.
 *
 * Implementations fill start, end and label of each span. Offsets are byte
 * offsets into text. They may overlap, repeat, or be wrong; the engine
 * sanitizes them. detect() must be safe to call from several threads.
 */
class EntitySource
{
public:
    virtual ~EntitySource() = default;

    /**
     * @throw core::ModelUnavailableError if the model cannot be reached.
     * @throw core::InferenceError if inference fails.
     */
    virtual std::vector<core::Span> detect(const std::string &text) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @class EntityModelHandle
 * @brief Process-wide, lazily constructed, read-only entity model.
 *
 * The factory runs at most once successfully; concurrent first callers
 * wait for the one construction in progress. A failed construction is
 * reported as ModelUnavailableError and retried by the next call.
 */
class EntityModelHandle
{
public:
    using Factory = std::function<std::unique_ptr<EntitySource>()>;

    explicit EntityModelHandle(Factory factory)
        : factory_(std::move(factory)),
          ready_(nullptr)
    {
    }

    EntityModelHandle(const EntityModelHandle&) = delete;
    EntityModelHandle& operator=(const EntityModelHandle&) = delete;

    /**
     * @brief Run the model on text. Errors of any other type are reported as InferenceError.
     * @throw core::ModelUnavailableError
     * @throw core::InferenceError
     */
    std::vector<core::Span> detect(const std::string &text) const
    {
        const EntitySource &model = source();
        try {
            return model.detect(text);
        } catch (const core::ModelUnavailableError &) {
            throw;
        } catch (const core::InferenceError &) {
            throw;
        } catch (const std::exception &ex) {
            throw core::InferenceError(model.name() + ": " + ex.what());
        }
    }

    bool isInitialized() const
    {
        return ready_.load(std::memory_order_acquire) != nullptr;
    }

private:
    const EntitySource &source() const
    {
        EntitySource *current = ready_.load(std::memory_order_acquire);
        if (current != nullptr) {
            return *current;
        }

        std::lock_guard<std::mutex> lock(initMutex_);
        current = ready_.load(std::memory_order_relaxed);
        if (current != nullptr) {
            return *current;
        }

        std::unique_ptr<EntitySource> created;
        try {
            created = factory_ ? factory_() : nullptr;
        } catch (const core::ModelUnavailableError &) {
            throw;
        } catch (const std::exception &ex) {
            throw core::ModelUnavailableError(std::string("entity model construction failed: ") + ex.what());
        }
        if (!created) {
            throw core::ModelUnavailableError("entity model factory returned no model");
        }

        util::logger::info("EntityModelHandle: initialized entity model '" + created->name() + "'");
        owned_ = std::move(created);
        ready_.store(owned_.get(), std::memory_order_release);
        return *owned_;
    }

    Factory factory_;
    mutable std::mutex initMutex_;
    mutable std::unique_ptr<EntitySource> owned_;
    mutable std::atomic<EntitySource*> ready_;
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_ENTITY_SOURCE_HPP
