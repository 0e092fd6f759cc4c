#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace panelsense {
namespace audio {

/**
 * Streams a session's PCM16 mono audio into a WAV file. The RIFF sizes
 * are patched when the recording stops; the file path is the session's
 * finalized audio artifact.
 */
class AudioRecorder {
public:
    AudioRecorder(std::string path, int sampleRate);
    ~AudioRecorder();

    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    /**
     * Create the file and write a provisional header.
     * Throws PanelSenseException (PERSISTENCE) when the file cannot be opened.
     */
    void start();

    /**
     * Append samples in arrival order. Ignored once stopped.
     */
    void write(const std::vector<int16_t>& samples);

    /**
     * Finalize the header and close the file. Idempotent.
     * Returns the artifact path.
     */
    std::string stop();

    bool isRecording() const;
    uint64_t samplesWritten() const;
    const std::string& getPath() const { return path_; }
    int getSampleRate() const { return sampleRate_; }

    static std::string makeArtifactPath(const std::string& directory, const std::string& sessionId);

private:
    std::string path_;
    int sampleRate_;

    mutable std::mutex mutex_;
    std::ofstream file_;
    bool recording_ = false;
    bool finalized_ = false;
    uint64_t samplesWritten_ = 0;
};

} // namespace audio
} // namespace panelsense
