#pragma once

#include <functional>
#include <string>

namespace livetranslate {
namespace mt {

/**
 * Abstract interface for text generation (translation) engines
 */
class GenerationEngine {
public:
    /**
     * Receives one piece of output. Returning false asks the engine to stop early.
     */
    using TokenCallback = std::function<bool(const std::string&)>;

    virtual ~GenerationEngine() = default;

    /**
     * Load models and other resources.
     * @return true if the engine is ready for generation
     * @throws utils::ModelLoadingException with details on hard failures
     */
    virtual bool initialize() = 0;

    /**
     * Check if the engine is ready for generation
     */
    virtual bool isReady() const = 0;

    /**
     * Whether generateStreaming() delivers output incrementally
     */
    virtual bool supportsStreaming() const = 0;

    /**
     * Translate text and return the whole output
     * @param text Source text
     * @return Generated translation
     */
    virtual std::string generate(const std::string& text) = 0;

    /**
     * Translate text, pushing each piece of output to onToken as it is produced
     * @param text Source text
     * @param onToken Receives pieces in order; a false return stops generation
     */
    virtual void generateStreaming(const std::string& text, const TokenCallback& onToken) = 0;

    virtual std::string getName() const = 0;
};

} // namespace mt
} // namespace livetranslate
