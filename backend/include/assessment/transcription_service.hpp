#pragma once

#include "assessment/assessment_types.hpp"

#include <string>

namespace panelsense {
namespace assessment {

/**
 * Speech-to-text collaborator for finalized audio artifacts.
 * transcribe() returns segments ordered by start time and throws
 * TranscriptionException on failure or an empty transcript.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;
    virtual Transcript transcribe(const std::string& artifactRef) = 0;
    virtual std::string name() const = 0;
};

/**
 * Reads the transcript an external ASR job wrote next to the recording:
 *
 *   <artifact>.transcript.json
 *   {"segments": [{"speaker": "candidate", "text": "...", "start": 1.2, "end": 3.4}]}
 */
class SidecarTranscriptionService : public TranscriptionService {
public:
    Transcript transcribe(const std::string& artifactRef) override;
    std::string name() const override { return "sidecar"; }

    static std::string sidecarPath(const std::string& artifactRef);
    static Transcript parse(const std::string& jsonContent, const std::string& artifactRef = "");
};

} // namespace assessment
} // namespace panelsense
