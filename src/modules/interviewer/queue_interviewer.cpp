// modules/interviewer/queue_interviewer.cpp
#include "interviewer/queue_interviewer.h"
#include <algorithm>
#include <iostream>

namespace agentflow {

QueueInterviewer::QueueInterviewer(std::optional<Duration> timeout) : timeout_(timeout) {}

Answer QueueInterviewer::ask(const Question& question) {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = ++next_ticket_;
    questions_.emplace_back(ticket, question);
    awaiting_.insert(ticket);
    question_cv_.notify_all();

    auto has_answer = [this, ticket] { return answers_.count(ticket) > 0; };
    if (timeout_) {
        if (!answer_cv_.wait_for(lock, *timeout_, has_answer)) {
            // 撤回问题：迟到的回答不能落到下一个节点
            awaiting_.erase(ticket);
            questions_.erase(std::remove_if(questions_.begin(), questions_.end(),
                                            [ticket](const auto& q) { return q.first == ticket; }),
                             questions_.end());
            if (handed_out_ == ticket) handed_out_.reset();
            std::cerr << "[WARNING] No answer for stage '" << question.stage << "' within "
                      << timeout_->count() << "ms" << std::endl;
            return Answer::timeout();
        }
    } else {
        answer_cv_.wait(lock, has_answer);
    }

    awaiting_.erase(ticket);
    auto it = answers_.find(ticket);
    Answer answer = std::move(it->second);
    answers_.erase(it);
    return answer;
}

void QueueInterviewer::respond(Answer answer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<uint64_t> target = handed_out_;
        handed_out_.reset();
        if (!target && !awaiting_.empty()) {
            target = *awaiting_.begin();
        }
        if (!target || awaiting_.count(*target) == 0) {
            std::cerr << "[WARNING] Discarding answer '" << answer.text
                      << "': its question is no longer awaited" << std::endl;
            return;
        }
        // a question answered before being fetched leaves the queue too
        questions_.erase(std::remove_if(questions_.begin(), questions_.end(),
                                        [&target](const auto& q) { return q.first == *target; }),
                         questions_.end());
        answers_[*target] = std::move(answer);
    }
    answer_cv_.notify_all();
}

std::optional<Question> QueueInterviewer::pending_question(std::optional<Duration> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto has_question = [this] { return !questions_.empty(); };
    if (timeout) {
        if (!question_cv_.wait_for(lock, *timeout, has_question)) {
            return std::nullopt;
        }
    } else {
        question_cv_.wait(lock, has_question);
    }

    auto [ticket, question] = std::move(questions_.front());
    questions_.pop_front();
    handed_out_ = ticket;
    return question;
}

} // namespace agentflow
