// modules/interviewer/interviewer.cpp
#include "interviewer/interviewer.h"

namespace agentflow {

std::string to_string(QuestionType type) {
    switch (type) {
        case QuestionType::YES_NO: return "yes_no";
        case QuestionType::MULTIPLE_CHOICE: return "multiple_choice";
        case QuestionType::FREEFORM: return "freeform";
        case QuestionType::CONFIRMATION: return "confirmation";
    }
    return "freeform";
}

Answer AutoApproveInterviewer::ask(const Question& question) {
    if (question.type == QuestionType::YES_NO || question.type == QuestionType::CONFIRMATION) {
        return Answer{kAnswerYes, std::nullopt, kAnswerYes};
    }
    if (question.type == QuestionType::MULTIPLE_CHOICE && !question.options.empty()) {
        const Option& first = question.options.front();
        return Answer{first.key, first, first.label};
    }
    return Answer{"approved", std::nullopt, "approved"};
}

CallbackInterviewer::CallbackInterviewer(Callback callback) : callback_(std::move(callback)) {}

Answer CallbackInterviewer::ask(const Question& question) {
    return callback_(question);
}

RecordingInterviewer::RecordingInterviewer(Interviewer& inner) : inner_(inner) {}

Answer RecordingInterviewer::ask(const Question& question) {
    Answer answer = inner_.ask(question);
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(QAPair{question, answer});
    return answer;
}

std::vector<QAPair> RecordingInterviewer::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

void RecordingInterviewer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

} // namespace agentflow
