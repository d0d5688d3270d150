#include "mt/generation_bridge.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"

namespace livetranslate {
namespace mt {

ChunkStream::ChunkStream(const std::string& text, std::shared_ptr<EngineRegistry> registry,
                         const BridgeConfig& config, bool allowStreaming)
    : sourceText_(text)
    , config_(config)
    , allowStreaming_(allowStreaming)
    , queue_(config.queueCapacity)
    , deadline_(std::chrono::steady_clock::now() + config.timeout)
    , cancelled_(false)
    , finished_(false) {
    producer_ = std::thread(&ChunkStream::runProducer, this, std::move(registry));
}

ChunkStream::~ChunkStream() {
    cancel();
    if (producer_.joinable()) {
        producer_.join();
    }
}

void ChunkStream::runProducer(std::shared_ptr<EngineRegistry> registry) {
    try {
        std::shared_ptr<GenerationEngine> engine = registry->acquire();
        std::unique_lock<std::mutex> generationLock = registry->lockForGeneration();

        if (cancelled_) {
            return;
        }

        if (allowStreaming_ && engine->supportsStreaming()) {
            engine->generateStreaming(sourceText_, [this](const std::string& token) {
                if (token.empty()) {
                    return !cancelled_.load();
                }
                return queue_.push(StreamItem::chunk(token));
            });
        } else {
            std::string output = engine->generate(sourceText_);
            if (!output.empty()) {
                queue_.push(StreamItem::chunk(output));
            }
        }

        queue_.push(StreamItem::complete());
    } catch (const std::exception& e) {
        queue_.push(StreamItem::error(e.what()));
    } catch (...) {
        queue_.push(StreamItem::error("Unknown generation error"));
    }
}

bool ChunkStream::next(std::string& chunk) {
    if (!failure_.empty()) {
        throw utils::GenerationException(failure_);
    }
    if (finished_) {
        return false;
    }
    if (cancelled_) {
        throw utils::GenerationException("Generation cancelled");
    }

    StreamItem item;
    if (config_.timeout.count() > 0) {
        auto status = queue_.popUntil(deadline_, item);
        if (status == utils::BoundedQueue<StreamItem>::PopStatus::TIMEOUT) {
            cancel();
            failure_ = "Generation timed out after " + std::to_string(config_.timeout.count()) + " ms";
            throw utils::GenerationException(failure_);
        }
        if (status == utils::BoundedQueue<StreamItem>::PopStatus::CLOSED) {
            throw utils::GenerationException("Generation cancelled");
        }
    } else {
        auto popped = queue_.pop();
        if (!popped) {
            throw utils::GenerationException("Generation cancelled");
        }
        item = std::move(*popped);
    }

    // cancel() may have raced with the pop
    if (cancelled_) {
        throw utils::GenerationException("Generation cancelled");
    }

    switch (item.kind) {
        case StreamItem::Kind::CHUNK:
            fullText_ += item.text;
            chunk = std::move(item.text);
            return true;
        case StreamItem::Kind::COMPLETE:
            finished_ = true;
            return false;
        case StreamItem::Kind::ERROR:
            finished_ = true;
            failure_ = item.text.empty() ? "Unknown generation error" : item.text;
            throw utils::GenerationException(failure_);
    }

    return false;
}

void ChunkStream::cancel() {
    cancelled_ = true;
    queue_.close();
}

std::string ChunkStream::getFullText() const {
    return utils::trim(fullText_);
}

GenerationBridge::GenerationBridge(std::shared_ptr<EngineRegistry> registry, const BridgeConfig& config)
    : registry_(std::move(registry)), config_(config) {
}

std::unique_ptr<ChunkStream> GenerationBridge::generate(const std::string& text) {
    utils::Logger::debug("Starting generation for " + std::to_string(text.size()) + " bytes of text");
    return std::make_unique<ChunkStream>(text, registry_, config_);
}

std::string GenerationBridge::generateFull(const std::string& text) {
    ChunkStream stream(text, registry_, config_, false);
    std::string chunk;
    while (stream.next(chunk)) {
    }
    return stream.getFullText();
}

} // namespace mt
} // namespace livetranslate
