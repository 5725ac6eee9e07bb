// modules/handlers/wait_human_handler.cpp
#include "handlers/handlers.h"
#include "interviewer/accelerators.h"
#include "common/utils/string_utils.h"
#include <set>

namespace agentflow {

namespace {

bool is_yes_no_pair(const std::vector<Option>& options) {
    static const std::set<std::string> kYesNo = {"yes", "no", "y", "n", "true", "false"};
    if (options.size() != 2) return false;
    for (const auto& opt : options) {
        if (!kYesNo.count(to_lower(trim(parse_accelerator(opt.label).second)))) return false;
    }
    return true;
}

} // namespace

WaitHumanHandler::WaitHumanHandler(Interviewer& interviewer) : interviewer_(interviewer) {}

Outcome WaitHumanHandler::execute(const Node& node, RunContext&, const Graph& graph,
                                  const std::filesystem::path&) {
    Question question;
    question.text = node.prompt.empty() ? node.label : node.prompt;
    question.stage = node.id;

    // 选项来自带标签的出边；有加速键时用作 key，否则用序号
    const auto outgoing = graph.outgoing_edges(node.id);
    for (size_t i = 0; i < outgoing.size(); ++i) {
        const Edge& edge = outgoing[i];
        if (edge.label.empty()) continue;
        std::string key = parse_accelerator(edge.label).first;
        question.options.push_back(Option{key.empty() ? std::to_string(i) : key, edge.label});
    }

    if (is_yes_no_pair(question.options)) {
        question.type = QuestionType::YES_NO;
    } else if (!question.options.empty()) {
        question.type = QuestionType::MULTIPLE_CHOICE;
    } else {
        question.type = QuestionType::FREEFORM;
    }

    Answer answer = interviewer_.ask(question);

    if (answer.timed_out()) {
        return Outcome::fail("Timed out waiting for an answer at '" + node.id + "'");
    }
    if (answer.was_skipped()) {
        Outcome outcome;
        outcome.status = StageStatus::SKIPPED;
        outcome.notes = "question skipped";
        outcome.context_updates[node.id + ".answer"] = kAnswerSkipped;
        return outcome;
    }

    std::string preferred;
    if (answer.selected_option) {
        preferred = answer.selected_option->label;
    } else if (!answer.text.empty()) {
        preferred = answer.text;
    } else {
        preferred = answer.value;
    }

    Outcome outcome = Outcome::success(Value{{node.id + ".answer", preferred}});
    outcome.preferred_label = preferred;
    return outcome;
}

} // namespace agentflow
