#ifndef AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/llm/generation_backend.h"
#include "config/engine_config.h"
#include <llama.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentflow {

// llama.cpp 本地推理后端。Each generate() starts from an empty KV cache.
// reasoning_effort scales the token budget: "low" = n_predict/4, "medium" = n_predict/2, otherwise n_predict.
class LlamaBackend : public GenerationBackend {
public:
    // Throws std::runtime_error if the model or context cannot be created
    explicit LlamaBackend(const LlmConfig& config);
    ~LlamaBackend() override;

    std::string generate(const std::string& prompt,
                         const Value& context_snapshot,
                         const std::string& model,
                         const std::string& fidelity,
                         const std::string& reasoning_effort) override;

    bool is_loaded() const;

private:
    LlmConfig config_;
    std::mutex mutex_; // one llama_context, so generations are serialized
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;

    int token_budget(const std::string& reasoning_effort) const;
    std::vector<llama_token> tokenize(const std::string& text) const;
    std::string piece_of(llama_token token) const;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H
