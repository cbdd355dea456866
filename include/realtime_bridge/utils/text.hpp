#pragma once

#include <string>

namespace realtime_bridge::utils {

std::string remove_emojis(const std::string& text);
std::string normalize_text(const std::string& text);
std::string strip_punctuation(const std::string& text);
// Last non-empty sentence, split on '.', '!', '?', newlines and U+2026.
std::string last_sentence(const std::string& text);

}
