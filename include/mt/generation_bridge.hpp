#pragma once

#include "mt/engine_registry.hpp"
#include "utils/bounded_queue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace livetranslate {
namespace mt {

/**
 * Item travelling from the producer thread to the consumer
 */
struct StreamItem {
    enum class Kind {
        CHUNK,
        COMPLETE,
        ERROR
    };

    Kind kind;
    std::string text;  // chunk text or error message

    StreamItem() : kind(Kind::COMPLETE) {}
    StreamItem(Kind k, std::string t) : kind(k), text(std::move(t)) {}

    static StreamItem chunk(std::string text) { return StreamItem(Kind::CHUNK, std::move(text)); }
    static StreamItem complete() { return StreamItem(Kind::COMPLETE, ""); }
    static StreamItem error(std::string message) { return StreamItem(Kind::ERROR, std::move(message)); }
};

struct BridgeConfig {
    size_t queueCapacity;
    std::chrono::milliseconds timeout;  // whole generation from stream construction; zero disables

    BridgeConfig() : queueCapacity(64), timeout(120000) {}
};

/**
 * Pull side of one generation.
 *
 * The producer thread is started on construction and joined on destruction,
 * so a stream never leaves a producer behind. Only one thread may call next().
 */
class ChunkStream {
public:
    /**
     * @param allowStreaming false runs the engine's one-shot call even when it can stream
     */
    ChunkStream(const std::string& text, std::shared_ptr<EngineRegistry> registry, const BridgeConfig& config,
                bool allowStreaming = true);
    ~ChunkStream();

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    /**
     * Wait for the next chunk.
     * @param chunk Receives the chunk text
     * @return true for a chunk, false once generation completed
     * @throws utils::GenerationException on engine failure, timeout or cancellation
     */
    bool next(std::string& chunk);

    /**
     * Stop the stream without waiting for the producer. Thread-safe.
     */
    void cancel();

    bool isCancelled() const { return cancelled_; }
    bool isFinished() const { return finished_; }

    /**
     * Concatenation of all chunks received so far, trimmed
     */
    std::string getFullText() const;

    const std::string& getSourceText() const { return sourceText_; }

private:
    void runProducer(std::shared_ptr<EngineRegistry> registry);

    std::string sourceText_;
    BridgeConfig config_;
    bool allowStreaming_;
    utils::BoundedQueue<StreamItem> queue_;
    std::chrono::steady_clock::time_point deadline_;

    std::atomic<bool> cancelled_;
    bool finished_;
    std::string failure_;
    std::string fullText_;

    std::thread producer_;
};

/**
 * Turns a blocking or push-style engine call into a lazily pulled sequence
 * of chunks running on its own thread.
 */
class GenerationBridge {
public:
    GenerationBridge(std::shared_ptr<EngineRegistry> registry, const BridgeConfig& config = BridgeConfig());
    virtual ~GenerationBridge() = default;

    /**
     * Start generating a translation of text
     * @throws std::system_error if the producer thread cannot be started
     */
    virtual std::unique_ptr<ChunkStream> generate(const std::string& text);

    /**
     * Run a whole generation through the engine's one-shot call and return the trimmed output
     * @throws utils::GenerationException on failure
     */
    std::string generateFull(const std::string& text);

    std::shared_ptr<EngineRegistry> getRegistry() const { return registry_; }
    const BridgeConfig& getConfig() const { return config_; }

private:
    std::shared_ptr<EngineRegistry> registry_;
    BridgeConfig config_;
};

} // namespace mt
} // namespace livetranslate
