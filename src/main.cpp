#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <pthread.h>
#include "core/task_queue.hpp"
#include "core/websocket_server.hpp"
#include "mt/engine_registry.hpp"
#include "mt/generation_bridge.hpp"
#include "mt/language_classifier.hpp"
#include "mt/language_detector.hpp"
#include "mt/llama_generation_engine.hpp"
#include "mt/mock_generation_engine.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace livetranslate;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --host <host>        Bind address (default: 0.0.0.0)\n"
              << "  --port <port>        Set server port (default: 8000)\n"
              << "  --config <path>      Config file (default: config/server.json)\n"
              << "  --mock               Use the mock translator instead of the model\n"
              << "  --model <path>       GGUF model file\n"
              << "  --log-level <level>  DEBUG, INFO, WARN or ERROR\n"
              << "  --help, -h           Show this help message\n";
}

std::shared_ptr<mt::EngineRegistry> createRegistry(const utils::Config& config) {
    mt::EngineRegistry::EngineFactory factory;
    if (config.useMock()) {
        const auto delay = std::chrono::milliseconds(config.getMockChunkDelayMs());
        factory = [delay]() {
            return std::make_shared<mt::MockGenerationEngine>(delay);
        };
    } else {
        mt::LlamaEngineConfig engineConfig;
        engineConfig.modelPath = config.getModelPath();
        engineConfig.sourceLang = config.getSourceLang();
        engineConfig.targetLang = config.getTargetLang();
        engineConfig.contextSize = config.getContextSize();
        engineConfig.gpuLayers = config.getGpuLayers();
        engineConfig.threads = config.getThreads();
        engineConfig.maxNewTokens = config.getMaxNewTokens();
        factory = [engineConfig]() {
            return std::make_shared<mt::LlamaGenerationEngine>(engineConfig);
        };
    }
    return std::make_shared<mt::EngineRegistry>(factory, config.serializeGeneration());
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();

        // The config path may itself come from the command line
        std::string configPath = "config/server.json";
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            }
        }

        auto config = utils::Config::load(configPath);
        config.applyEnvironment();

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--host" && i + 1 < argc) {
                config.setHost(argv[++i]);
            } else if (arg == "--port" && i + 1 < argc) {
                config.setPort(std::stoi(argv[++i]));
            } else if (arg == "--config" && i + 1 < argc) {
                ++i;
            } else if (arg == "--mock") {
                config.setUseMock(true);
            } else if (arg == "--model" && i + 1 < argc) {
                config.setModelPath(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                config.setLogLevel(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

        // Block termination signals before any thread starts; a dedicated thread waits for them
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
            std::cerr << "Error: failed to block termination signals" << std::endl;
            return 1;
        }

        auto detector = std::make_shared<mt::TextLanguageDetector>();
        if (!detector->initialize()) {
            utils::Logger::warn("Language detector unavailable, using lexical fallback only");
        }
        auto classifier = std::make_shared<mt::LanguageClassifier>(detector, config.getSourceLang());

        auto registry = createRegistry(config);

        mt::BridgeConfig bridgeConfig;
        bridgeConfig.queueCapacity = config.getQueueCapacity();
        bridgeConfig.timeout = std::chrono::milliseconds(config.getGenerationTimeoutMs());
        auto bridge = std::make_shared<mt::GenerationBridge>(registry, bridgeConfig);

        auto taskQueue = std::make_shared<core::TaskQueue>();
        core::ThreadPool threadPool(config.getWorkerThreads());
        threadPool.start(taskQueue);

        if (config.useMock()) {
            utils::Logger::info("Running in mock mode - no model will be loaded");
        } else {
            utils::Logger::info("Pre-loading translation model...");
            bool queued = taskQueue->enqueue([registry]() {
                try {
                    registry->acquire();
                } catch (const std::exception& e) {
                    utils::Logger::warn("Model pre-loading failed, will retry on first translation: " +
                                        std::string(e.what()));
                }
            }, core::TaskPriority::HIGH);
            if (!queued) {
                utils::Logger::warn("Could not schedule model pre-loading");
            }
        }

        core::SessionServices services;
        services.classifier = classifier;
        services.bridge = bridge;
        services.taskQueue = taskQueue;

        auto server = std::make_unique<core::WebSocketServer>(config, services, registry);
        server->start();

        std::thread signalThread([&signals, &server]() {
            int received = 0;
            if (sigwait(&signals, &received) == 0) {
                utils::Logger::info("Received signal " + std::to_string(received) + ", shutting down");
                server->stop();
            }
        });

        utils::Logger::info("Starting LiveTranslate server on " + config.getHost() + ":" +
                            std::to_string(config.getPort()));
        server->run();

        // run() also returns when listening failed; wake the signal thread so it can be joined
        pthread_kill(signalThread.native_handle(), SIGTERM);
        signalThread.join();

        utils::Logger::info("Shutting down...");
        threadPool.stop();
        server.reset();

        size_t errors = utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorCategory::UNKNOWN);
        utils::Logger::info("Server stopped, " + std::to_string(errors) + " errors reported");

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
