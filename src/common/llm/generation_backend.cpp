// common/llm/generation_backend.cpp
#include "common/llm/generation_backend.h"

namespace agentflow {

std::string StubBackend::generate(const std::string& prompt,
                                  const Value& /*context_snapshot*/,
                                  const std::string& /*model*/,
                                  const std::string& /*fidelity*/,
                                  const std::string& /*reasoning_effort*/) {
    return "stub response: " + prompt.substr(0, 50);
}

} // namespace agentflow
