// modules/interviewer/accelerators.cpp
#include "interviewer/accelerators.h"
#include "common/utils/string_utils.h"
#include <regex>

namespace agentflow {

std::pair<std::string, std::string> parse_accelerator(const std::string& label) {
    static const std::regex bracket_pattern(R"(^\[([a-zA-Z0-9])\]\s*([\s\S]*)$)");
    static const std::regex paren_pattern(R"(^([a-zA-Z0-9])\)\s*([\s\S]*)$)");
    static const std::regex dash_pattern(R"(^([a-zA-Z0-9])\s*-\s+([\s\S]*)$)");

    std::string text = trim(label);
    std::smatch match;
    for (const auto* pattern : {&bracket_pattern, &paren_pattern, &dash_pattern}) {
        if (std::regex_match(text, match, *pattern)) {
            return {match[1].str(), trim(match[2].str())};
        }
    }
    return {"", text};
}

} // namespace agentflow
