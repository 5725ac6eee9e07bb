// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace agentflow {

namespace {

// min_p -> temperature -> dist
llama_sampler* make_sampler_chain(const LlmConfig& config) {
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    llama_sampler_chain_add(chain, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(chain, llama_sampler_init_temp(config.temperature));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    return chain;
}

} // namespace

LlamaBackend::LlamaBackend(const LlmConfig& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {
    if (config_.model_path.empty()) {
        throw std::runtime_error("llm.model_path is not set");
    }

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // offload everything the device can hold
    model_.reset(llama_model_load_from_file(config_.model_path.c_str(), model_params));
    if (!model_) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(config_.n_ctx);
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;
    ctx_.reset(llama_init_from_model(model_.get(), ctx_params));
    if (!ctx_) {
        throw std::runtime_error("Failed to create llama context for " + config_.model_path);
    }

    sampler_.reset(make_sampler_chain(config_));
    std::cout << "[INFO] Loaded model " << config_.model_path << " (n_ctx=" << config_.n_ctx << ")" << std::endl;
}

LlamaBackend::~LlamaBackend() = default;

int LlamaBackend::token_budget(const std::string& reasoning_effort) const {
    if (reasoning_effort == "low") return std::max(1, config_.n_predict / 4);
    if (reasoning_effort == "medium") return std::max(1, config_.n_predict / 2);
    return config_.n_predict;
}

std::vector<llama_token> LlamaBackend::tokenize(const std::string& text) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    const auto length = static_cast<int32_t>(text.size());
    // a null buffer makes llama_tokenize report the required size as a negative count
    int32_t needed = -llama_tokenize(vocab, text.data(), length, nullptr, 0, true, true);
    if (needed <= 0) {
        return {};
    }
    std::vector<llama_token> tokens(static_cast<size_t>(needed));
    if (llama_tokenize(vocab, text.data(), length, tokens.data(), needed, true, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaBackend::piece_of(llama_token token) const {
    char buf[256] = {0};
    int n = llama_token_to_piece(llama_model_get_vocab(model_.get()), token, buf, sizeof(buf) - 1, 0, true);
    return n < 0 ? std::string() : std::string(buf, static_cast<size_t>(n));
}

std::string LlamaBackend::generate(const std::string& prompt,
                                   const Value& /*context_snapshot*/,
                                   const std::string& model,
                                   const std::string& /*fidelity*/,
                                   const std::string& reasoning_effort) {
    if (!is_loaded()) {
        throw std::runtime_error("Model not loaded");
    }
    if (!model.empty()) {
        std::cout << "[DEBUG] llm_model '" << model << "' requested, using " << config_.model_path << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // 每次调用从空 KV cache 开始，阶段之间互不影响
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    std::vector<llama_token> tokens = tokenize(prompt);
    if (tokens.empty()) {
        throw std::runtime_error("Tokenization failed");
    }
    if (static_cast<int>(tokens.size()) >= config_.n_ctx) {
        throw std::runtime_error("Prompt of " + std::to_string(tokens.size()) +
                                 " tokens does not fit n_ctx=" + std::to_string(config_.n_ctx));
    }
    if (llama_decode(ctx_.get(), llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size())))) {
        throw std::runtime_error("Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    const int room = config_.n_ctx - static_cast<int>(tokens.size());
    const int budget = std::min(token_budget(reasoning_effort), room);

    std::string response;
    for (int produced = 0; produced < budget; ++produced) {
        llama_token next = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, next)) {
            break;
        }
        response += piece_of(next);
        if (llama_decode(ctx_.get(), llama_batch_get_one(&next, 1))) {
            std::cerr << "[WARNING] Decode stopped after " << produced + 1 << " tokens" << std::endl;
            break;
        }
    }

    llama_sampler_reset(sampler_.get());
    return response;
}

bool LlamaBackend::is_loaded() const {
    return model_ && ctx_ && sampler_;
}

} // namespace agentflow
