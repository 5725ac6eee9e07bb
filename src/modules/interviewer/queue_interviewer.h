// modules/interviewer/queue_interviewer.h
#ifndef AGENTFLOW_MODULES_INTERVIEWER_QUEUE_INTERVIEWER_H
#define AGENTFLOW_MODULES_INTERVIEWER_QUEUE_INTERVIEWER_H

#include "interviewer/interviewer.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <utility>

namespace agentflow {

// 问题队列 + 答案队列，供引擎线程与 UI 线程交换问答。
// ask() waits at most `timeout` (nullopt = forever) and then returns Answer::timeout();
// a timed-out question is withdrawn and answers to it are discarded.
class QueueInterviewer : public Interviewer {
public:
    using Duration = std::chrono::milliseconds;

    explicit QueueInterviewer(std::optional<Duration> timeout = std::nullopt);

    Answer ask(const Question& question) override;

    // Answering side. respond() answers the question last returned by pending_question(),
    // or the oldest unanswered one when none has been handed out.
    void respond(Answer answer);
    std::optional<Question> pending_question(std::optional<Duration> timeout = std::nullopt);

private:
    std::optional<Duration> timeout_;
    std::mutex mutex_;
    std::condition_variable question_cv_;
    std::condition_variable answer_cv_;
    uint64_t next_ticket_ = 0;
    std::optional<uint64_t> handed_out_;
    std::deque<std::pair<uint64_t, Question>> questions_;
    std::set<uint64_t> awaiting_;
    std::map<uint64_t, Answer> answers_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_INTERVIEWER_QUEUE_INTERVIEWER_H
