#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace panelsense {
namespace audio {

/**
 * Interpret little-endian PCM16 mono bytes.
 * Returns std::nullopt for an odd byte count.
 */
std::optional<std::vector<int16_t>> decodePCM16(const uint8_t* data, size_t size);

inline std::optional<std::vector<int16_t>> decodePCM16(const std::vector<uint8_t>& bytes) {
    return decodePCM16(bytes.data(), bytes.size());
}

std::vector<float> pcm16ToFloat(const std::vector<int16_t>& samples);

inline float convertSampleToFloat(int16_t sample) {
    return static_cast<float>(sample) / 32768.0f;
}

int16_t convertSampleToPCM(float sample);

/**
 * 44-byte canonical RIFF/WAVE header for 16-bit PCM.
 */
std::vector<uint8_t> buildWavHeader(uint32_t dataBytes, int sampleRate, int channels);

} // namespace audio
} // namespace panelsense
