#include "realtime_bridge/session/goodbye_detector.hpp"

#include <algorithm>

#include "realtime_bridge/utils/text.hpp"

namespace realtime_bridge {

namespace {

std::string canonical(const std::string& text) {
    return utils::normalize_text(utils::strip_punctuation(utils::remove_emojis(text)));
}

bool ends_with_phrase(const std::string& sentence, const std::string& phrase) {
    if (sentence.size() < phrase.size()) {
        return false;
    }
    if (sentence.compare(sentence.size() - phrase.size(), phrase.size(), phrase) != 0) {
        return false;
    }
    return sentence.size() == phrase.size() ||
           sentence[sentence.size() - phrase.size() - 1] == ' ';
}

}

GoodbyeDetector::GoodbyeDetector(const std::vector<std::string>& phrases) {
    for (const auto& phrase : phrases) {
        auto normalized = canonical(phrase);
        if (!normalized.empty() &&
            std::find(phrases_.begin(), phrases_.end(), normalized) == phrases_.end()) {
            phrases_.push_back(std::move(normalized));
        }
    }
    // Longest first so the reported phrase is the most specific one.
    std::stable_sort(phrases_.begin(), phrases_.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.size() > b.size();
                     });
}

bool GoodbyeDetector::matches(const std::string& transcript) const {
    return matched_phrase(transcript).has_value();
}

std::optional<std::string> GoodbyeDetector::matched_phrase(
    const std::string& transcript) const {
    const auto sentence = canonical(utils::last_sentence(utils::remove_emojis(transcript)));
    if (sentence.empty()) {
        return std::nullopt;
    }
    for (const auto& phrase : phrases_) {
        if (ends_with_phrase(sentence, phrase)) {
            return phrase;
        }
    }
    return std::nullopt;
}

}
