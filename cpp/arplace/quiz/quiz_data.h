#pragma once

#include "arplace/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace arplace {

struct Question {
    std::string text;
    std::vector<std::string> answers;
    std::int32_t correctIndex{0};
    std::int32_t points{10};
};

struct QuizData {
    std::string title{"Taj Mahal Quiz"};
    float timePerQuestion{30.0f};
    std::vector<Question> questions;
};

// Built-in four-question set used when no data is supplied.
QuizData defaultQuizData();

// Ok, or InvalidArgument when there are no questions, a question has no answers, a
// correct index lies outside its answers, or the time budget is not positive.
ArError validateQuizData(const QuizData& data) noexcept;

} // namespace arplace
