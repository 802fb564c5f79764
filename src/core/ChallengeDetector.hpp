#pragma once
#include <string>

namespace Loopnet {

// Number of UTF-8 code points in text. Continuation bytes are not counted.
size_t CharacterCount(const std::string& text);

// Pages at or above this many characters are real content even if they embed a marker.
constexpr size_t kChallengeMaxLength = 10000;

// True when content is an anti-bot interstitial: short, and carrying one of
// the vendor's challenge markers.
bool IsChallengePage(const std::string& content);

}
