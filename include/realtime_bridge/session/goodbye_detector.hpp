#pragma once

#include <optional>
#include <string>
#include <vector>

namespace realtime_bridge {

// Matches a small set of closing phrases at the end of the AI's final
// transcript. Only the last sentence is considered, so a farewell followed by
// a question ("Goodbye. Actually, one more thing?") does not match.
class GoodbyeDetector {
public:
    explicit GoodbyeDetector(const std::vector<std::string>& phrases);

    bool matches(const std::string& transcript) const;
    std::optional<std::string> matched_phrase(const std::string& transcript) const;
    const std::vector<std::string>& phrases() const { return phrases_; }

private:
    std::vector<std::string> phrases_;
};

}
