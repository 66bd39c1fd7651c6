#pragma once

#include "arplace/core/types.h"
#include "arplace/quiz/quiz_data.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arplace {

class EventQueue;

struct Color {
    float r{1.0f};
    float g{1.0f};
    float b{1.0f};
    float a{1.0f};
};

enum class QuizState : std::uint8_t {
    Idle = 0,
    Answering = 1,
    Reviewing = 2,  // answer shown, waiting for the next question
    Finished = 3,
};

// Per-button highlight after an answer or time-up.
enum class AnswerFeedback : std::uint8_t {
    Default = 0,
    Correct = 1,
    Wrong = 2,
    TimeUp = 3,
};

// Sound cue the host should play; the session does not play audio itself.
enum class QuizCue : std::uint8_t {
    None = 0,
    Correct = 1,
    Wrong = 2,
    TimeUp = 3,
};

struct QuizCustomization {
    Color defaultButtonColor{1.0f, 1.0f, 1.0f, 1.0f};
    Color correctAnswerColor{0.0f, 1.0f, 0.0f, 1.0f};
    Color wrongAnswerColor{1.0f, 0.0f, 0.0f, 1.0f};
    Color timeUpCorrectColor{1.0f, 0.92f, 0.016f, 1.0f};

    Color normalTimerColor{1.0f, 1.0f, 1.0f, 1.0f};
    Color urgentTimerColor{1.0f, 0.0f, 0.0f, 1.0f};
    float urgentTimeThreshold{10.0f};

    bool showScoreLabel{true};
    std::string scorePrefix{"Score: "};
    std::string scoreSuffix{};
    bool showTimerLabel{true};
    std::string timerPrefix{"Time: "};
    std::string timerSuffix{"s"};
    bool showQuestionNumber{true};
    std::string questionNumberFormat{"Question {0}: "};  // {0} is the 1-based number

    bool showFinalScoreLabel{true};
    std::string finalScorePrefix{"Final Score: "};
    bool showPercentage{true};
    bool showGrade{true};
    std::vector<std::string> gradeMessages{"Try again!", "Pass! C", "Good! B", "Great! A", "Excellent! A+"};
    std::vector<float> gradeThresholds{0.0f, 60.0f, 70.0f, 80.0f, 90.0f};

    float reviewDelay{2.0f};
    float feedbackDuration{1.0f};
};

struct QuizResults {
    std::int32_t score{0};
    std::int32_t correctAnswers{0};
    std::int32_t questionCount{0};
    float percentage{0.0f};
    std::string grade;
    std::string finalScoreText;
    std::string summaryText;
};

// Timed multiple-choice run driven by tick(dt).
class QuizSession {
public:
    explicit QuizSession(QuizData data = defaultQuizData(), QuizCustomization customization = {}, EventQueue* events = nullptr);

    bool start();
    bool restart() { return start(); }
    bool selectAnswer(std::int32_t index);
    void tick(float dt);

    QuizState state() const noexcept { return state_; }
    bool isAnswering() const noexcept { return state_ == QuizState::Answering; }
    std::size_t currentQuestionIndex() const noexcept { return questionIndex_; }
    const Question* currentQuestion() const noexcept;
    std::size_t questionCount() const noexcept { return data_.questions.size(); }
    std::int32_t score() const noexcept { return score_; }
    std::int32_t correctAnswers() const noexcept { return correct_; }
    float timeRemaining() const noexcept { return timeRemaining_; }
    bool isTimerUrgent() const noexcept;
    Color timerColor() const noexcept;

    std::string questionText() const;
    std::string scoreText() const;
    std::string timerText() const;

    std::size_t visibleAnswerCount() const noexcept;
    bool buttonsInteractable() const noexcept { return state_ == QuizState::Answering; }
    AnswerFeedback buttonFeedback(std::size_t index) const noexcept;
    Color buttonColor(std::size_t index) const noexcept;
    QuizCue lastCue() const noexcept { return lastCue_; }
    bool feedbackVisible() const noexcept { return feedbackRemaining_ > 0.0f; }
    bool lastAnswerCorrect() const noexcept { return lastAnswerCorrect_; }

    QuizResults results() const;
    std::string gradeFor(float percentage) const;

    const QuizData& data() const noexcept { return data_; }
    QuizCustomization& customization() noexcept { return customization_; }
    const QuizCustomization& customization() const noexcept { return customization_; }
    ArError lastError() const noexcept { return lastError_; }

private:
    void showQuestion();
    void timeUp();
    void beginReview(QuizCue cue, bool correct);
    void finish();
    void fail(ArError error);

    QuizData data_;
    QuizCustomization customization_;
    EventQueue* events_;

    QuizState state_ = QuizState::Idle;
    std::size_t questionIndex_ = 0;
    std::int32_t score_ = 0;
    std::int32_t correct_ = 0;
    float timeRemaining_ = 0.0f;
    float reviewElapsed_ = 0.0f;
    float feedbackRemaining_ = 0.0f;
    std::vector<AnswerFeedback> feedback_;
    QuizCue lastCue_ = QuizCue::None;
    bool lastAnswerCorrect_ = false;
    ArError lastError_ = ArError::Ok;
};

} // namespace arplace
