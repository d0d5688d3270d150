#include "mt/engine_registry.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace livetranslate {
namespace mt {

EngineRegistry::EngineRegistry(EngineFactory factory, bool serializeGeneration)
    : factory_(std::move(factory))
    , serializeGeneration_(serializeGeneration)
    , initAttempts_(0) {
}

std::shared_ptr<GenerationEngine> EngineRegistry::acquire() {
    std::lock_guard<std::mutex> lock(initMutex_);

    if (engine_) {
        return engine_;
    }

    initAttempts_++;

    if (!factory_) {
        throw utils::ModelLoadingException("No generation engine factory configured");
    }

    std::shared_ptr<GenerationEngine> engine = factory_();
    if (!engine) {
        throw utils::ModelLoadingException("Generation engine factory returned no engine");
    }

    utils::Logger::info("Initializing generation engine: " + engine->getName());
    if (!engine->initialize() || !engine->isReady()) {
        throw utils::ModelLoadingException("Failed to initialize generation engine", engine->getName());
    }

    engine_ = engine;
    utils::Logger::info("Generation engine ready: " + engine_->getName());
    return engine_;
}

bool EngineRegistry::isLoaded() const {
    std::lock_guard<std::mutex> lock(initMutex_);
    return engine_ != nullptr;
}

std::unique_lock<std::mutex> EngineRegistry::lockForGeneration() {
    if (!serializeGeneration_) {
        return std::unique_lock<std::mutex>();
    }
    return std::unique_lock<std::mutex>(generationMutex_);
}

size_t EngineRegistry::getInitializationAttempts() const {
    std::lock_guard<std::mutex> lock(initMutex_);
    return initAttempts_;
}

} // namespace mt
} // namespace livetranslate
