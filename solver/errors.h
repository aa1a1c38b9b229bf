#pragma once

#include <stdexcept>
#include <string>

namespace boggle {

struct BoggleError : std::runtime_error {
    explicit BoggleError(const std::string& msg) : std::runtime_error(msg) {}
};

struct InvalidWordListError : BoggleError {
    explicit InvalidWordListError(const std::string& msg) : BoggleError(msg) {}
};

struct InvalidDiceStringError : BoggleError {
    explicit InvalidDiceStringError(const std::string& msg) : BoggleError(msg) {}
};

struct InvalidScoreTableError : BoggleError {
    explicit InvalidScoreTableError(const std::string& msg) : BoggleError(msg) {}
};

class BoardGenerationExhaustedError : public BoggleError {
public:
    explicit BoardGenerationExhaustedError(int attempts)
        : BoggleError("no board satisfied the constraints after " +
                      std::to_string(attempts) + " tries"),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

}  // namespace boggle
