#ifndef AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/value.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace agentflow {

// inja 模板渲染，禁用 include
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Shared default environment; throws std::runtime_error on render errors
    static std::string render(std::string_view template_str, const Value& data);

    // True when the text contains "{{" or "{%"
    static bool has_markup(std::string_view text);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    void configure_security();
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
