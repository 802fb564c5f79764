#include "ChallengeDetector.hpp"

namespace Loopnet {

namespace {
const char* const kChallengeMarkers[] = {
    "sec-if-cpt-container",
    "behavioral-content",
    "/akam/13/pixel_",
};
}

size_t CharacterCount(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

bool IsChallengePage(const std::string& content) {
    if (CharacterCount(content) >= kChallengeMaxLength) {
        return false;
    }
    for (const char* marker : kChallengeMarkers) {
        if (content.find(marker) != std::string::npos) return true;
    }
    return false;
}

}
