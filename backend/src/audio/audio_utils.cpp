#include "audio/audio_utils.hpp"
#include <algorithm>

namespace panelsense {
namespace audio {

namespace {

void appendLE(std::vector<uint8_t>& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

} // namespace

std::optional<std::vector<int16_t>> decodePCM16(const uint8_t* data, size_t size) {
    if (size % 2 != 0) {
        return std::nullopt;
    }

    std::vector<int16_t> samples;
    samples.reserve(size / 2);
    for (size_t i = 0; i + 1 < size; i += 2) {
        uint16_t raw = static_cast<uint16_t>(data[i]) | (static_cast<uint16_t>(data[i + 1]) << 8);
        samples.push_back(static_cast<int16_t>(raw));
    }
    return samples;
}

std::vector<float> pcm16ToFloat(const std::vector<int16_t>& samples) {
    std::vector<float> out;
    out.reserve(samples.size());
    for (int16_t s : samples) {
        out.push_back(convertSampleToFloat(s));
    }
    return out;
}

int16_t convertSampleToPCM(float sample) {
    return static_cast<int16_t>(std::clamp(sample * 32767.0f, -32768.0f, 32767.0f));
}

std::vector<uint8_t> buildWavHeader(uint32_t dataBytes, int sampleRate, int channels) {
    std::vector<uint8_t> header;
    header.reserve(44);

    const uint32_t byteRate = static_cast<uint32_t>(sampleRate * channels * 2);
    const uint16_t blockAlign = static_cast<uint16_t>(channels * 2);

    header.insert(header.end(), {'R', 'I', 'F', 'F'});
    appendLE(header, 36 + dataBytes, 4);
    header.insert(header.end(), {'W', 'A', 'V', 'E'});

    header.insert(header.end(), {'f', 'm', 't', ' '});
    appendLE(header, 16, 4);                 // fmt chunk size
    appendLE(header, 1, 2);                  // PCM
    appendLE(header, static_cast<uint32_t>(channels), 2);
    appendLE(header, static_cast<uint32_t>(sampleRate), 4);
    appendLE(header, byteRate, 4);
    appendLE(header, blockAlign, 2);
    appendLE(header, 16, 2);                 // bits per sample

    header.insert(header.end(), {'d', 'a', 't', 'a'});
    appendLE(header, dataBytes, 4);

    return header;
}

} // namespace audio
} // namespace panelsense
