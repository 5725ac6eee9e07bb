// modules/interviewer/interviewer.h
#ifndef AGENTFLOW_MODULES_INTERVIEWER_INTERVIEWER_H
#define AGENTFLOW_MODULES_INTERVIEWER_INTERVIEWER_H

#include "core/types/question.h"
#include <functional>
#include <mutex>
#include <vector>

namespace agentflow {

// 人工交互接口：ask 一个问题，返回一个答案
class Interviewer {
public:
    virtual ~Interviewer() = default;
    virtual Answer ask(const Question& question) = 0;
};

// YES for yes/no and confirmation, first option for multiple choice, "approved" otherwise
class AutoApproveInterviewer : public Interviewer {
public:
    Answer ask(const Question& question) override;
};

class CallbackInterviewer : public Interviewer {
public:
    using Callback = std::function<Answer(const Question&)>;

    explicit CallbackInterviewer(Callback callback);
    Answer ask(const Question& question) override;

private:
    Callback callback_;
};

struct QAPair {
    Question question;
    Answer answer;
};

// Forwards to `inner` and records every exchange. `inner` must outlive this object.
class RecordingInterviewer : public Interviewer {
public:
    explicit RecordingInterviewer(Interviewer& inner);

    Answer ask(const Question& question) override;
    std::vector<QAPair> transcript() const;
    void clear();

private:
    Interviewer& inner_;
    mutable std::mutex mutex_;
    std::vector<QAPair> records_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_INTERVIEWER_INTERVIEWER_H
