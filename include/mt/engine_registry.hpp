#pragma once

#include "mt/generation_engine.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace livetranslate {
namespace mt {

/**
 * Process-wide owner of the generation engine.
 *
 * acquire() creates and initializes the engine on first use under a mutex.
 * A failed initialization is rethrown and not cached, so the next caller
 * retries. The engine is never torn down while the registry lives.
 */
class EngineRegistry {
public:
    using EngineFactory = std::function<std::shared_ptr<GenerationEngine>()>;

    EngineRegistry(EngineFactory factory, bool serializeGeneration = true);

    EngineRegistry(const EngineRegistry&) = delete;
    EngineRegistry& operator=(const EngineRegistry&) = delete;

    /**
     * Get the shared engine, initializing it if needed
     * @throws utils::ModelLoadingException if the engine cannot be created
     */
    std::shared_ptr<GenerationEngine> acquire();

    bool isLoaded() const;

    /**
     * Lock held for the duration of one generation call.
     * Returns an empty (unlocked) lock when generation is not serialized.
     */
    std::unique_lock<std::mutex> lockForGeneration();

    bool isGenerationSerialized() const { return serializeGeneration_; }

    size_t getInitializationAttempts() const;

private:
    EngineFactory factory_;
    bool serializeGeneration_;

    mutable std::mutex initMutex_;
    std::shared_ptr<GenerationEngine> engine_;
    size_t initAttempts_;

    std::mutex generationMutex_;
};

} // namespace mt
} // namespace livetranslate
