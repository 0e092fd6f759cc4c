#include "emotion/emotion_types.hpp"

namespace panelsense {
namespace emotion {

std::string modalityToString(Modality modality) {
    switch (modality) {
        case Modality::FACIAL: return "facial";
        case Modality::VOICE: return "voice";
    }
    return "facial";
}

std::optional<Modality> modalityFromString(const std::string& name) {
    if (name == "facial" || name == "video") {
        return Modality::FACIAL;
    }
    if (name == "voice" || name == "audio") {
        return Modality::VOICE;
    }
    return std::nullopt;
}

} // namespace emotion
} // namespace panelsense
