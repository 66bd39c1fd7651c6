#include "arplace/quiz/quiz_session.h"
#include "arplace/core/logging.h"
#include "arplace/protocol/event_queue.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace arplace {

using protocol::ErrorSource;
using protocol::EventType;

QuizSession::QuizSession(QuizData data, QuizCustomization customization, EventQueue* events)
    : data_(std::move(data)), customization_(std::move(customization)), events_(events) {}

void QuizSession::fail(ArError error) {
    lastError_ = error;
    if (events_) events_->recordWarning(error, ErrorSource::Quiz);
}

bool QuizSession::start() {
    if (validateQuizData(data_) != ArError::Ok) {
        ARPLACE_LOG_WARN("QuizSession: quiz data '%s' is malformed", data_.title.c_str());
        fail(ArError::InvalidArgument);
        return false;
    }
    questionIndex_ = 0;
    score_ = 0;
    correct_ = 0;
    feedbackRemaining_ = 0.0f;
    lastCue_ = QuizCue::None;
    lastAnswerCorrect_ = false;
    lastError_ = ArError::Ok;
    showQuestion();
    return true;
}

void QuizSession::showQuestion() {
    if (questionIndex_ >= data_.questions.size()) {
        finish();
        return;
    }
    feedback_.assign(data_.questions[questionIndex_].answers.size(), AnswerFeedback::Default);
    timeRemaining_ = data_.timePerQuestion;
    reviewElapsed_ = 0.0f;
    state_ = QuizState::Answering;
}

const Question* QuizSession::currentQuestion() const noexcept {
    if (state_ == QuizState::Idle || questionIndex_ >= data_.questions.size()) return nullptr;
    return &data_.questions[questionIndex_];
}

bool QuizSession::selectAnswer(std::int32_t index) {
    if (state_ != QuizState::Answering) {
        fail(ArError::InvalidOperation);
        return false;
    }
    const Question& q = data_.questions[questionIndex_];
    if (index < 0 || static_cast<std::size_t>(index) >= q.answers.size()) {
        ARPLACE_LOG_WARN("QuizSession: answer index %d out of range", index);
        fail(ArError::InvalidIndex);
        return false;
    }

    const bool correct = index == q.correctIndex;
    if (correct) {
        score_ += q.points;
        correct_++;
        feedback_[static_cast<std::size_t>(index)] = AnswerFeedback::Correct;
    } else {
        feedback_[static_cast<std::size_t>(index)] = AnswerFeedback::Wrong;
        feedback_[static_cast<std::size_t>(q.correctIndex)] = AnswerFeedback::Correct;
    }
    lastError_ = ArError::Ok;
    if (events_) events_->push(EventType::QuizAnswered, static_cast<std::uint32_t>(questionIndex_), correct ? 1u : 0u, static_cast<std::uint32_t>(score_), 0u);
    beginReview(correct ? QuizCue::Correct : QuizCue::Wrong, correct);
    return true;
}

void QuizSession::timeUp() {
    const Question& q = data_.questions[questionIndex_];
    timeRemaining_ = 0.0f;
    feedback_[static_cast<std::size_t>(q.correctIndex)] = AnswerFeedback::TimeUp;
    ARPLACE_LOG_DEBUG("QuizSession: time up on question %zu", questionIndex_ + 1);
    if (events_) events_->push(EventType::QuizAnswered, static_cast<std::uint32_t>(questionIndex_), 0u, static_cast<std::uint32_t>(score_), 1u);
    beginReview(QuizCue::TimeUp, false);
}

void QuizSession::beginReview(QuizCue cue, bool correct) {
    state_ = QuizState::Reviewing;
    reviewElapsed_ = 0.0f;
    lastCue_ = cue;
    lastAnswerCorrect_ = correct;
    feedbackRemaining_ = customization_.feedbackDuration;
}

void QuizSession::finish() {
    state_ = QuizState::Finished;
    feedback_.clear();
    const QuizResults r = results();
    ARPLACE_LOG_DEBUG("QuizSession: finished %d/%d, score %d", r.correctAnswers, r.questionCount, r.score);
    if (events_) {
        events_->push(EventType::QuizFinished,
                      static_cast<std::uint32_t>(score_),
                      static_cast<std::uint32_t>(correct_),
                      static_cast<std::uint32_t>(data_.questions.size()));
    }
}

void QuizSession::tick(float dt) {
    dt = std::max(0.0f, dt);
    if (feedbackRemaining_ > 0.0f) feedbackRemaining_ = std::max(0.0f, feedbackRemaining_ - dt);

    switch (state_) {
        case QuizState::Answering:
            timeRemaining_ -= dt;
            if (timeRemaining_ <= 0.0f) timeUp();
            break;
        case QuizState::Reviewing:
            reviewElapsed_ += dt;
            if (reviewElapsed_ >= customization_.reviewDelay) {
                questionIndex_++;
                showQuestion();
            }
            break;
        case QuizState::Idle:
        case QuizState::Finished:
            break;
    }
}

bool QuizSession::isTimerUrgent() const noexcept {
    return state_ == QuizState::Answering && timeRemaining_ < customization_.urgentTimeThreshold;
}

Color QuizSession::timerColor() const noexcept {
    return isTimerUrgent() ? customization_.urgentTimerColor : customization_.normalTimerColor;
}

// ==============================================================================
// Display text
// ==============================================================================

std::string QuizSession::questionText() const {
    const Question* q = currentQuestion();
    if (!q) return std::string();

    std::string prefix;
    if (customization_.showQuestionNumber) {
        prefix = customization_.questionNumberFormat;
        const std::string number = std::to_string(questionIndex_ + 1);
        const std::size_t at = prefix.find("{0}");
        if (at != std::string::npos) prefix.replace(at, 3, number);
    }
    return prefix + q->text;
}

std::string QuizSession::scoreText() const {
    const std::string value = std::to_string(score_);
    if (!customization_.showScoreLabel) return value;
    return customization_.scorePrefix + value + customization_.scoreSuffix;
}

std::string QuizSession::timerText() const {
    const std::string value = std::to_string(static_cast<int>(std::ceil(std::max(0.0f, timeRemaining_))));
    if (!customization_.showTimerLabel) return value;
    return customization_.timerPrefix + value + customization_.timerSuffix;
}

std::size_t QuizSession::visibleAnswerCount() const noexcept {
    const Question* q = currentQuestion();
    return q ? q->answers.size() : 0;
}

AnswerFeedback QuizSession::buttonFeedback(std::size_t index) const noexcept {
    if (index >= feedback_.size()) return AnswerFeedback::Default;
    return feedback_[index];
}

Color QuizSession::buttonColor(std::size_t index) const noexcept {
    switch (buttonFeedback(index)) {
        case AnswerFeedback::Correct: return customization_.correctAnswerColor;
        case AnswerFeedback::Wrong: return customization_.wrongAnswerColor;
        case AnswerFeedback::TimeUp: return customization_.timeUpCorrectColor;
        case AnswerFeedback::Default: break;
    }
    return customization_.defaultButtonColor;
}

// ==============================================================================
// Results
// ==============================================================================

std::string QuizSession::gradeFor(float percentage) const {
    const auto& thresholds = customization_.gradeThresholds;
    const auto& messages = customization_.gradeMessages;
    for (std::size_t i = thresholds.size(); i-- > 0;) {
        if (percentage >= thresholds[i] && i < messages.size()) return messages[i];
    }
    return messages.empty() ? std::string() : messages.front();
}

QuizResults QuizSession::results() const {
    QuizResults r;
    r.score = score_;
    r.correctAnswers = correct_;
    r.questionCount = static_cast<std::int32_t>(data_.questions.size());
    r.percentage = r.questionCount > 0 ? static_cast<float>(correct_) / static_cast<float>(r.questionCount) * 100.0f : 0.0f;
    r.grade = gradeFor(r.percentage);

    const std::string score = std::to_string(score_);
    r.finalScoreText = customization_.showFinalScoreLabel ? customization_.finalScorePrefix + score : score;

    r.summaryText = "Questions Correct: " + std::to_string(correct_) + "/" + std::to_string(r.questionCount);
    if (customization_.showPercentage) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", r.percentage);
        r.summaryText += "\nPercentage: ";
        r.summaryText += buf;
        r.summaryText += "%";
    }
    if (customization_.showGrade) r.summaryText += "\n" + r.grade;
    return r;
}

} // namespace arplace
