// tests/test_interviewer.cpp
#include <catch2/catch_test_macros.hpp>
#include "interviewer/accelerators.h"
#include "interviewer/interviewer.h"
#include "interviewer/queue_interviewer.h"
#include <chrono>
#include <string>
#include <thread>

using namespace agentflow;
using namespace std::chrono_literals;

TEST_CASE("Accelerator keys are extracted from labels", "[interviewer]") {
    CHECK(parse_accelerator("[Y] Yes, deploy") == std::make_pair(std::string("Y"), std::string("Yes, deploy")));
    CHECK(parse_accelerator("R) Retry") == std::make_pair(std::string("R"), std::string("Retry")));
    CHECK(parse_accelerator("F - Fix it") == std::make_pair(std::string("F"), std::string("Fix it")));
    CHECK(parse_accelerator("  Just text  ") == std::make_pair(std::string(""), std::string("Just text")));
    // a dash without following whitespace is part of the label
    CHECK(parse_accelerator("A-team").first.empty());
}

TEST_CASE("Auto-approve answers without a human", "[interviewer]") {
    AutoApproveInterviewer interviewer;

    Question yes_no{"Ship?", QuestionType::YES_NO};
    CHECK(interviewer.ask(yes_no).is_yes());

    Question confirm{"Sure?", QuestionType::CONFIRMATION};
    CHECK(interviewer.ask(confirm).is_yes());

    Question choice{"Pick", QuestionType::MULTIPLE_CHOICE, {{"A", "Alpha"}, {"B", "Beta"}}};
    Answer picked = interviewer.ask(choice);
    CHECK(picked.value == "A");
    REQUIRE(picked.selected_option.has_value());
    CHECK(picked.selected_option->label == "Alpha");

    Question notes{"Notes?", QuestionType::FREEFORM};
    CHECK(interviewer.ask(notes).value == "approved");
}

TEST_CASE("Callback and recording interviewers", "[interviewer]") {
    CallbackInterviewer callback([](const Question& q) {
        return Answer{q.stage == "review" ? kAnswerNo : kAnswerYes, std::nullopt, ""};
    });
    RecordingInterviewer recorder(callback);

    Question first{"Looks good?", QuestionType::YES_NO};
    first.stage = "review";
    Question second{"Deploy?", QuestionType::YES_NO};
    second.stage = "deploy";

    CHECK(recorder.ask(first).is_no());
    CHECK(recorder.ask(second).is_yes());

    auto transcript = recorder.transcript();
    REQUIRE(transcript.size() == 2);
    CHECK(transcript[0].question.text == "Looks good?");
    CHECK(transcript[0].answer.is_no());
    CHECK(transcript[1].question.stage == "deploy");

    recorder.clear();
    CHECK(recorder.transcript().empty());
}

TEST_CASE("Queue interviewer times out without an answer", "[interviewer]") {
    QueueInterviewer interviewer(20ms);
    Answer answer = interviewer.ask(Question{"Anyone?", QuestionType::FREEFORM});
    CHECK(answer.timed_out());
    // the timed-out question is withdrawn
    CHECK_FALSE(interviewer.pending_question(0ms).has_value());
}

TEST_CASE("Queue interviewer discards answers to timed-out questions", "[interviewer]") {
    SECTION("answer arrives after the question was withdrawn") {
        QueueInterviewer interviewer(20ms);
        Question first{"Deploy?", QuestionType::FREEFORM};
        first.stage = "deploy";
        CHECK(interviewer.ask(first).timed_out());

        interviewer.respond(Answer{"late", std::nullopt, "late"});

        Question second{"Notify?", QuestionType::FREEFORM};
        second.stage = "notify";
        CHECK(interviewer.ask(second).timed_out());
        CHECK_FALSE(interviewer.pending_question(0ms).has_value());
    }

    SECTION("question fetched in time but answered too late") {
        QueueInterviewer interviewer(200ms);
        std::string fetched_stage;
        std::thread slow_responder([&interviewer, &fetched_stage] {
            if (auto question = interviewer.pending_question(2000ms)) {
                fetched_stage = question->stage;
            }
            std::this_thread::sleep_for(400ms);
            interviewer.respond(Answer{"late", std::nullopt, "late"});
        });
        Question first{"Deploy?", QuestionType::FREEFORM};
        first.stage = "deploy";
        CHECK(interviewer.ask(first).timed_out());
        slow_responder.join();
        CHECK(fetched_stage == "deploy");

        Question second{"Notify?", QuestionType::FREEFORM};
        second.stage = "notify";
        Answer answer = interviewer.ask(second);
        CHECK(answer.timed_out());
        CHECK(answer.value != "late");
    }
}

TEST_CASE("Queue interviewer hands questions to another thread", "[interviewer]") {
    QueueInterviewer interviewer;

    std::thread responder([&interviewer] {
        auto question = interviewer.pending_question(2000ms);
        if (question && question->text == "Proceed?") {
            interviewer.respond(Answer{kAnswerYes, std::nullopt, "yes"});
        } else {
            interviewer.respond(Answer{kAnswerNo, std::nullopt, "no"});
        }
    });

    Answer answer = interviewer.ask(Question{"Proceed?", QuestionType::YES_NO});
    responder.join();
    CHECK(answer.is_yes());
    CHECK(answer.text == "yes");
    CHECK_FALSE(interviewer.pending_question(0ms).has_value());
}
