#include <gtest/gtest.h>
#include "audio/audio_recorder.hpp"
#include "audio/audio_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace panelsense::audio;

namespace {

uint32_t readLE32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

TEST(AudioUtilsTest, DecodePCM16LittleEndian) {
    std::vector<uint8_t> bytes = {0x01, 0x00, 0xFF, 0x7F, 0x00, 0x80, 0xFF, 0xFF};

    auto samples = decodePCM16(bytes);

    ASSERT_TRUE(samples.has_value());
    std::vector<int16_t> expected = {1, 32767, -32768, -1};
    EXPECT_EQ(*samples, expected);
}

TEST(AudioUtilsTest, OddByteCountIsRejected) {
    std::vector<uint8_t> bytes = {0x01, 0x00, 0x02};
    EXPECT_FALSE(decodePCM16(bytes).has_value());
    EXPECT_TRUE(decodePCM16(std::vector<uint8_t>())->empty());
}

TEST(AudioUtilsTest, SampleConversion) {
    EXPECT_FLOAT_EQ(convertSampleToFloat(0), 0.0f);
    EXPECT_FLOAT_EQ(convertSampleToFloat(-32768), -1.0f);
    EXPECT_NEAR(convertSampleToFloat(16384), 0.5f, 1e-6f);

    EXPECT_EQ(convertSampleToPCM(0.0f), 0);
    EXPECT_EQ(convertSampleToPCM(1.0f), 32767);
    EXPECT_EQ(convertSampleToPCM(2.5f), 32767);
    EXPECT_EQ(convertSampleToPCM(-3.0f), -32768);

    auto floats = pcm16ToFloat({0, 16384});
    ASSERT_EQ(floats.size(), 2u);
    EXPECT_NEAR(floats[1], 0.5f, 1e-6f);
}

TEST(AudioUtilsTest, WavHeaderLayout) {
    auto header = buildWavHeader(3200, 16000, 1);

    ASSERT_EQ(header.size(), 44u);
    EXPECT_EQ(std::string(header.begin(), header.begin() + 4), "RIFF");
    EXPECT_EQ(readLE32(header, 4), 36u + 3200u);
    EXPECT_EQ(std::string(header.begin() + 8, header.begin() + 12), "WAVE");
    EXPECT_EQ(readLE32(header, 24), 16000u);
    EXPECT_EQ(readLE32(header, 28), 32000u);
    EXPECT_EQ(std::string(header.begin() + 36, header.begin() + 40), "data");
    EXPECT_EQ(readLE32(header, 40), 3200u);
}

class AudioRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "panelsense_recorder_test";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(AudioRecorderTest, RecordsSamplesInOrder) {
    std::string path = (dir_ / "nested" / "s1.wav").string();
    AudioRecorder recorder(path, 16000);
    recorder.start();
    EXPECT_TRUE(recorder.isRecording());

    recorder.write({1, 2});
    recorder.write({3});
    EXPECT_EQ(recorder.samplesWritten(), 3u);

    EXPECT_EQ(recorder.stop(), path);
    EXPECT_FALSE(recorder.isRecording());

    auto bytes = readFile(path);
    ASSERT_EQ(bytes.size(), 44u + 6u);
    EXPECT_EQ(readLE32(bytes, 40), 6u);
    EXPECT_EQ(bytes[44], 1);
    EXPECT_EQ(bytes[46], 2);
    EXPECT_EQ(bytes[48], 3);
}

TEST_F(AudioRecorderTest, StopIsIdempotentAndWritesAfterStopAreIgnored) {
    std::string path = (dir_ / "s2.wav").string();
    AudioRecorder recorder(path, 16000);
    recorder.start();
    recorder.write({7, 7, 7, 7});
    recorder.stop();

    recorder.write({1, 1});
    EXPECT_EQ(recorder.stop(), path);
    EXPECT_EQ(std::filesystem::file_size(path), 44u + 8u);
}

TEST_F(AudioRecorderTest, EmptyRecordingStillHasHeader) {
    std::string path = (dir_ / "silent.wav").string();
    {
        AudioRecorder recorder(path, 8000);
        recorder.start();
    }

    auto bytes = readFile(path);
    ASSERT_EQ(bytes.size(), 44u);
    EXPECT_EQ(readLE32(bytes, 24), 8000u);
    EXPECT_EQ(readLE32(bytes, 40), 0u);
}

TEST_F(AudioRecorderTest, ArtifactPathIsPerSession) {
    std::string path = AudioRecorder::makeArtifactPath(dir_.string(), "abc");
    std::filesystem::path p(path);

    EXPECT_EQ(p.parent_path(), dir_);
    EXPECT_EQ(p.extension(), ".wav");
    EXPECT_EQ(p.filename().string().rfind("abc_", 0), 0u);
}
