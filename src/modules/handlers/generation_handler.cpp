// modules/handlers/generation_handler.cpp
#include "handlers/handlers.h"
#include "common/utils/file_io.h"
#include "common/utils/template_renderer.h"
#include <iostream>
#include <stdexcept>

namespace agentflow {

namespace {

void write_stage_artifact(const std::filesystem::path& log_dir, const char* name, const std::string& text) {
    if (log_dir.empty()) return;
    try {
        write_text_file(log_dir / name, text);
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] " << e.what() << std::endl;
    }
}

} // namespace

GenerationHandler::GenerationHandler(std::shared_ptr<GenerationBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("GenerationHandler requires a backend");
    }
}

Outcome GenerationHandler::execute(const Node& node, RunContext& context, const Graph&,
                                   const std::filesystem::path& log_dir) {
    const Value snapshot = context.snapshot();

    std::string prompt = node.prompt.empty() ? node.label : node.prompt;
    if (InjaTemplateRenderer::has_markup(prompt)) {
        try {
            prompt = InjaTemplateRenderer::render(prompt, snapshot);
        } catch (const std::exception& e) {
            return Outcome::fail(std::string("Prompt render failed: ") + e.what());
        }
    }
    write_stage_artifact(log_dir, "prompt.md", prompt);

    std::string response;
    try {
        response = backend_->generate(prompt, snapshot, node.llm_model, node.fidelity, node.reasoning_effort);
    } catch (const std::exception& e) {
        return Outcome::fail(std::string("Generation backend error: ") + e.what());
    }
    write_stage_artifact(log_dir, "response.md", response);

    return Outcome::success(Value{{node.id + ".response", response}});
}

} // namespace agentflow
