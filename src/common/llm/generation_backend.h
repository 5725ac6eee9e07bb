#ifndef AGENTFLOW_COMMON_LLM_GENERATION_BACKEND_H
#define AGENTFLOW_COMMON_LLM_GENERATION_BACKEND_H

#include "core/types/value.h"
#include <string>

namespace agentflow {

// 生成后端接口：may throw to signal failure
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    virtual std::string generate(const std::string& prompt,
                                 const Value& context_snapshot,
                                 const std::string& model,
                                 const std::string& fidelity,
                                 const std::string& reasoning_effort) = 0;
};

// Offline backend: "stub response: " + first 50 chars of the prompt
class StubBackend : public GenerationBackend {
public:
    std::string generate(const std::string& prompt,
                         const Value& context_snapshot,
                         const std::string& model,
                         const std::string& fidelity,
                         const std::string& reasoning_effort) override;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_GENERATION_BACKEND_H
