#include "arplace/quiz/quiz_data.h"

namespace arplace {

QuizData defaultQuizData() {
    QuizData data;
    data.questions = {
        Question{
            "The Taj Mahal complex is perfectly symmetrical except for one element. Which element breaks the symmetry?",
            {"The minarets", "The cenotaphs inside the mausoleum", "The reflecting pool", "The mosque"},
            1,
            10},
        Question{
            "Which precious stone was NOT originally inlaid in the Taj Mahal's marble?",
            {"Lapis Lazuli", "Turquoise", "Diamond", "Carnelian"},
            2,
            10},
        Question{
            "Which famous British official is often criticized for removing valuable stones and carpets from the Taj Mahal during colonial rule?",
            {"Lord Curzon", "Warren Hastings", "Lord Dalhousie", "Sir William Bentinck"},
            3,
            10},
        Question{
            "The minarets of the Taj Mahal were built with a slight outward tilt. What was the primary purpose of this design?",
            {"To prevent shadow on the dome",
             "To make them look taller from afar",
             "To protect the mausoleum if they collapsed during an earthquake",
             "To align with sunrise and sunset"},
            2,
            10},
    };
    return data;
}

ArError validateQuizData(const QuizData& data) noexcept {
    if (data.questions.empty()) return ArError::InvalidArgument;
    if (!(data.timePerQuestion > 0.0f)) return ArError::InvalidArgument;
    for (const Question& q : data.questions) {
        if (q.answers.empty()) return ArError::InvalidArgument;
        if (q.correctIndex < 0 || static_cast<std::size_t>(q.correctIndex) >= q.answers.size()) {
            return ArError::InvalidArgument;
        }
    }
    return ArError::Ok;
}

} // namespace arplace
