#include "mt/llama_generation_engine.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/string_utils.hpp"

#include <llama.h>

#include <algorithm>
#include <cstring>
#include <unordered_map>

namespace livetranslate {
namespace mt {

namespace {

std::once_flag g_backend_once;

void llamaLogCallback(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
        std::string message(text);
        while (!message.empty() && message.back() == '\n') {
            message.pop_back();
        }
        utils::Logger::error("llama.cpp: " + message);
    }
}

void initializeBackendOnce() {
    std::call_once(g_backend_once, []() {
        llama_log_set(llamaLogCallback, nullptr);
        ggml_backend_load_all();
        llama_backend_init();
    });
}

std::string languageName(const std::string& code) {
    static const std::unordered_map<std::string, std::string> names = {
        {"fr", "French"}, {"en", "English"}, {"en-US", "English"}, {"en-GB", "English"},
        {"es", "Spanish"}, {"de", "German"}, {"it", "Italian"}, {"pt", "Portuguese"}
    };
    auto it = names.find(code);
    return it != names.end() ? it->second : code;
}

} // namespace

LlamaGenerationEngine::LlamaGenerationEngine(LlamaEngineConfig config)
    : config_(std::move(config)) {
}

LlamaGenerationEngine::~LlamaGenerationEngine() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

void LlamaGenerationEngine::cleanup() {
    if (sampler_ != nullptr) {
        llama_sampler_free(sampler_);
        sampler_ = nullptr;
    }
    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_ != nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
        vocab_ = nullptr;
    }
}

bool LlamaGenerationEngine::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx_ != nullptr) {
        return true;
    }

    initializeBackendOnce();
    utils::Logger::info("Loading model from " + config_.modelPath);

    llama_model_params modelParams = llama_model_default_params();
    modelParams.n_gpu_layers = config_.gpuLayers;
    modelParams.use_mmap = true;

    model_ = llama_model_load_from_file(config_.modelPath.c_str(), modelParams);
    if (model_ == nullptr) {
        throw utils::ModelLoadingException("llama_model_load_from_file failed", config_.modelPath);
    }

    vocab_ = llama_model_get_vocab(model_);

    llama_context_params ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(std::max(512, config_.contextSize));
    ctxParams.n_batch = ctxParams.n_ctx;
    ctxParams.n_threads = std::max(1, config_.threads);
    ctxParams.n_threads_batch = std::max(1, config_.threads);
    ctxParams.no_perf = true;

    ctx_ = llama_init_from_model(model_, ctxParams);
    if (ctx_ == nullptr) {
        cleanup();
        throw utils::ModelLoadingException("llama_init_from_model failed", config_.modelPath);
    }

    llama_sampler_chain_params samplerParams = llama_sampler_chain_default_params();
    samplerParams.no_perf = true;
    sampler_ = llama_sampler_chain_init(samplerParams);
    if (sampler_ == nullptr) {
        cleanup();
        throw utils::ModelLoadingException("llama_sampler_chain_init failed", config_.modelPath);
    }
    // Greedy decoding keeps translations deterministic
    llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());

    utils::Logger::info("Model loaded, context size " + std::to_string(llama_n_ctx(ctx_)));
    return true;
}

bool LlamaGenerationEngine::isReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_ != nullptr && sampler_ != nullptr;
}

std::string LlamaGenerationEngine::buildPrompt(const std::string& text) const {
    const std::string source = languageName(config_.sourceLang);
    const std::string target = languageName(config_.targetLang);

    std::string content =
        "You are a professional " + source + " (" + config_.sourceLang + ") to " + target +
        " (" + config_.targetLang + ") translator. Your goal is to accurately convey the meaning and "
        "nuances of the original " + source + " text while adhering to " + target +
        " grammar, vocabulary, and cultural sensitivities.\n"
        "Produce only the " + target + " translation, without any additional explanations or "
        "commentary. Please translate the following " + source + " text into " + target + ":\n\n\n" + text;

    llama_chat_message message{"user", content.c_str()};
    const char* tmpl = model_ != nullptr ? llama_model_chat_template(model_, nullptr) : nullptr;

    std::vector<char> buffer(content.size() * 2 + 256);
    int32_t written = llama_chat_apply_template(tmpl, &message, 1, true, buffer.data(),
                                                static_cast<int32_t>(buffer.size()));
    if (written > static_cast<int32_t>(buffer.size())) {
        buffer.resize(static_cast<size_t>(written));
        written = llama_chat_apply_template(tmpl, &message, 1, true, buffer.data(),
                                            static_cast<int32_t>(buffer.size()));
    }
    if (written < 0) {
        throw utils::GenerationException("Model chat template could not be applied");
    }

    return std::string(buffer.data(), static_cast<size_t>(written));
}

std::vector<int32_t> LlamaGenerationEngine::tokenize(const std::string& text, bool addSpecial,
                                                     bool parseSpecial) const {
    const int32_t required = -llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                                             nullptr, 0, addSpecial, parseSpecial);
    if (required <= 0) {
        throw utils::GenerationException("llama_tokenize failed while counting tokens");
    }

    std::vector<llama_token> tokens(static_cast<size_t>(required));
    const int32_t written = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                                           tokens.data(), static_cast<int32_t>(tokens.size()),
                                           addSpecial, parseSpecial);
    if (written < 0) {
        throw utils::GenerationException("llama_tokenize failed while writing tokens");
    }

    tokens.resize(static_cast<size_t>(written));
    return std::vector<int32_t>(tokens.begin(), tokens.end());
}

std::string LlamaGenerationEngine::tokenToPiece(int32_t token) const {
    char local[256];
    const int first = llama_token_to_piece(vocab_, static_cast<llama_token>(token), local,
                                           static_cast<int32_t>(sizeof(local)), 0, false);
    if (first >= 0) {
        return std::string(local, static_cast<size_t>(first));
    }

    std::vector<char> dynamic(static_cast<size_t>(-first));
    const int second = llama_token_to_piece(vocab_, static_cast<llama_token>(token), dynamic.data(),
                                            static_cast<int32_t>(dynamic.size()), 0, false);
    if (second < 0) {
        throw utils::GenerationException("llama_token_to_piece failed");
    }
    return std::string(dynamic.data(), static_cast<size_t>(second));
}

std::string LlamaGenerationEngine::generate(const std::string& text) {
    std::string output;
    generateStreaming(text, [&output](const std::string& piece) {
        output += piece;
        return true;
    });
    return utils::trim(output);
}

void LlamaGenerationEngine::generateStreaming(const std::string& text, const TokenCallback& onToken) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx_ == nullptr || sampler_ == nullptr) {
        throw utils::GenerationException("Model is not loaded");
    }

    llama_memory_clear(llama_get_memory(ctx_), true);
    llama_sampler_reset(sampler_);

    const std::string prompt = buildPrompt(text);
    const std::vector<int32_t> promptTokensI32 = tokenize(prompt, true, true);
    std::vector<llama_token> promptTokens(promptTokensI32.begin(), promptTokensI32.end());

    const int maxTokens = std::max(1, config_.maxNewTokens);
    const uint32_t nCtx = llama_n_ctx(ctx_);
    if (promptTokens.size() + static_cast<size_t>(maxTokens) >= nCtx) {
        throw utils::GenerationException("Prompt too long for context window (prompt_tokens=" +
                                         std::to_string(promptTokens.size()) + ", n_ctx=" +
                                         std::to_string(nCtx) + ")");
    }

    llama_batch batch = llama_batch_get_one(promptTokens.data(), static_cast<int32_t>(promptTokens.size()));
    if (llama_decode(ctx_, batch) != 0) {
        throw utils::GenerationException("llama_decode failed for prompt");
    }

    // Pieces may split multi-byte characters; hold back incomplete tails
    std::string pending;
    for (int i = 0; i < maxTokens; ++i) {
        llama_token token = llama_sampler_sample(sampler_, ctx_, -1);
        if (llama_vocab_is_eog(vocab_, token)) {
            break;
        }

        pending += tokenToPiece(token);
        size_t complete = utils::utf8CompleteLength(pending);
        if (complete > 0) {
            if (!onToken(pending.substr(0, complete))) {
                return;
            }
            pending.erase(0, complete);
        }

        if (i + 1 >= maxTokens) {
            break;
        }

        batch = llama_batch_get_one(&token, 1);
        if (llama_decode(ctx_, batch) != 0) {
            throw utils::GenerationException("llama_decode failed for continuation token");
        }
    }

    if (!pending.empty()) {
        onToken(pending);
    }
}

} // namespace mt
} // namespace livetranslate
