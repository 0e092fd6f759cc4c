#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "assessment/similarity_model.hpp"
#include "core/admin_api.hpp"
#include "core/client_session.hpp"
#include "core/emotion_log_sink.hpp"
#include "core/panel_services.hpp"
#include "utils/base64.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>

using namespace panelsense;
using namespace panelsense::core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockFacialDetector : public emotion::FacialEmotionDetector {
public:
    MOCK_METHOD(std::optional<emotion::Detection>, detect, (const emotion::DecodedImage& image), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

class MockVoiceDetector : public emotion::VoiceEmotionDetector {
public:
    MOCK_METHOD(std::optional<emotion::Detection>, detect, (const emotion::AudioWindow& window), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

class MockTranscriptionService : public assessment::TranscriptionService {
public:
    MOCK_METHOD(assessment::Transcript, transcribe, (const std::string& artifactRef), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

emotion::Detection detection(const std::string& label, double confidence) {
    emotion::Detection result;
    result.label = label;
    result.confidence = confidence;
    return result;
}

assessment::TranscriptSegment said(const std::string& speaker, const std::string& text, double start) {
    assessment::TranscriptSegment segment;
    segment.speaker = speaker;
    segment.text = text;
    segment.startSeconds = start;
    segment.endSeconds = start + 4.0;
    return segment;
}

std::string jpegFrame() {
    std::vector<uint8_t> bytes(256, 0x5A);
    bytes[0] = 0xFF;
    bytes[1] = 0xD8;
    bytes[2] = 0xFF;
    return utils::encodeBase64(bytes);
}

} // namespace

/**
 * One interview end to end without a network: a client streams frames,
 * ends the session, the batch assessment runs and an interviewer blends
 * in a manual score through the admin API.
 */
class InterviewLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "panelsense_lifecycle_test";
        std::filesystem::remove_all(dir_);

        nlohmann::json config = {
            {"session", {
                {"recordings_dir", (dir_ / "recordings").string()},
                {"emotion_log_dir", (dir_ / "emotion_logs").string()},
                {"drain_timeout_ms", 50},
                {"voice_chunk_stride", 1},
                {"voice_window_seconds", 0.5}
            }},
            {"assessment", {{"retained_sessions", 2}}},
            {"scoring", {{"ai_weight", 60}, {"manual_weight", 40}}}
        };

        facial_ = std::make_shared<NiceMock<MockFacialDetector>>();
        voice_ = std::make_shared<NiceMock<MockVoiceDetector>>();
        transcription_ = std::make_shared<NiceMock<MockTranscriptionService>>();

        ON_CALL(*facial_, detect(_)).WillByDefault(Return(detection("happy", 0.9)));
        ON_CALL(*voice_, detect(_)).WillByDefault(Return(detection("confident", 0.8)));
        ON_CALL(*transcription_, transcribe(_)).WillByDefault(Return(assessment::Transcript{
            said("interviewer", "Tell me about a time you had to lead under pressure.", 0.0),
            said("candidate", "Hello, thanks for having me.", 4.0),
            said("candidate", "During the outage I mentored two new engineers through the rollback.", 9.0),
            said("candidate", "I enjoy cooking and long walks.", 20.0)
        }));

        SessionDependencies deps;
        deps.facialDetector = facial_;
        deps.voiceDetector = voice_;
        deps.emotionLogSink = std::make_shared<JsonFileEmotionLogSink>((dir_ / "emotion_logs").string(), 0.5);

        services_ = std::make_unique<PanelServices>(utils::Config::fromJson(config.dump()), deps, transcription_,
                                                    std::make_shared<assessment::LexicalSimilarityModel>(), false);
        api_ = std::make_unique<AdminApi>(*services_);
    }

    void TearDown() override {
        client_.reset();
        api_.reset();
        services_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void connect(const std::string& sessionId) {
        PanelServices* services = services_.get();
        client_ = std::make_shared<ClientSession>(
            sessionId, services_->controller(), services_->store(),
            [this](const std::string& message) {
                std::lock_guard<std::mutex> lock(sentMutex_);
                sent_.push_back(nlohmann::json::parse(message));
            },
            nullptr,
            [services](std::function<void()> work) { services->runInBackground(std::move(work)); });
        ASSERT_TRUE(client_->start());
    }

    void drain(const std::shared_ptr<TaskQueue>& queue) {
        while (auto task = queue->tryDequeue()) {
            task->execute();
        }
    }

    std::vector<nlohmann::json> sentOfType(const std::string& type) {
        std::lock_guard<std::mutex> lock(sentMutex_);
        std::vector<nlohmann::json> matching;
        for (const auto& message : sent_) {
            if (message.value("type", "") == type) {
                matching.push_back(message);
            }
        }
        return matching;
    }

    std::filesystem::path dir_;
    std::shared_ptr<NiceMock<MockFacialDetector>> facial_;
    std::shared_ptr<NiceMock<MockVoiceDetector>> voice_;
    std::shared_ptr<NiceMock<MockTranscriptionService>> transcription_;
    std::unique_ptr<PanelServices> services_;
    std::unique_ptr<AdminApi> api_;
    std::shared_ptr<ClientSession> client_;

    std::mutex sentMutex_;
    std::vector<nlohmann::json> sent_;
};

TEST_F(InterviewLifecycleTest, FullInterview) {
    connect("interview-1");
    ASSERT_EQ(sentOfType("session_opened").size(), 1u);

    client_->handleMessage(R"({"type":"set_indicators","data":{"indicators":[
        {"id":"lead","name":"Leadership","description":"Guiding others","keywords":["mentored"],"weight":2},
        {"id":"craft","name":"Cooking"}]}})");

    // Live capture
    for (int i = 0; i < 3; ++i) {
        nlohmann::json frame = {{"type", "video_frame"},
                                {"data", {{"frame", jpegFrame()}, {"timestamp", 1.0 + i}}}};
        client_->handleMessage(frame.dump());
        drain(services_->detectorQueue());
    }
    std::string pcm(16000, '\x01');
    client_->handleBinaryMessage(pcm);
    drain(services_->detectorQueue());

    client_->handleMessage(R"({"type":"get_snapshot"})");
    auto snapshots = sentOfType("snapshot");
    ASSERT_EQ(snapshots.size(), 1u);
    const auto& live = snapshots[0]["data"]["snapshot"];
    EXPECT_EQ(live["facial"]["label"], "happy");
    EXPECT_EQ(live["facial"]["sampleCount"], 3);
    EXPECT_DOUBLE_EQ(live["facial"]["stability"].get<double>(), 1.0);
    EXPECT_EQ(live["voice"]["label"], "confident");
    EXPECT_FALSE(sentOfType("emotion_update").empty());

    // Close runs on the control queue, then schedules the assessment there
    client_->handleMessage(R"({"type":"end_session"})");
    EXPECT_TRUE(sentOfType("session_closed").empty());
    drain(services_->controlQueue());

    auto closed = sentOfType("session_closed");
    ASSERT_EQ(closed.size(), 1u);
    std::string artifact = closed[0]["data"]["audioArtifact"];
    EXPECT_EQ(closed[0]["data"]["sampleCount"], 4);
    EXPECT_TRUE(std::filesystem::exists(artifact));
    EXPECT_EQ(std::filesystem::file_size(artifact), 44u + pcm.size());

    // Emotion log holds every confident sample
    std::ifstream logFile(dir_ / "emotion_logs" / "interview-1.json");
    ASSERT_TRUE(logFile.is_open());
    nlohmann::json log = nlohmann::json::parse(logFile);
    EXPECT_EQ(log["session_id"], "interview-1");
    EXPECT_EQ(log["samples"].size(), 4u);

    // Batch assessment
    auto lead = services_->store()->find("interview-1", "lead");
    ASSERT_TRUE(lead.has_value());
    EXPECT_EQ(lead->evidenceText, "During the outage I mentored two new engineers through the rollback");
    EXPECT_GT(lead->aiScore, 80.0);

    auto craft = services_->store()->find("interview-1", "craft");
    ASSERT_TRUE(craft.has_value());
    EXPECT_EQ(craft->evidenceText, "I enjoy cooking and long walks");

    // Interviewer adds a manual score
    ApiResponse manual = api_->putManualScore("interview-1", R"({"indicator_id":"lead","score":70})");
    ASSERT_EQ(manual.status, 200);
    double expected = assessment::ScoreCombiner::roundToTenth(lead->aiScore * 0.6 + 70.0 * 0.4);
    EXPECT_DOUBLE_EQ(nlohmann::json::parse(manual.body)["combined_score"].get<double>(), expected);

    ApiResponse summary = api_->getAssessment("interview-1");
    ASSERT_EQ(summary.status, 200);
    auto json = nlohmann::json::parse(summary.body);
    EXPECT_EQ(json["audio_artifact"], artifact);
    EXPECT_EQ(json["last_run"]["status"], "completed");
    EXPECT_FALSE(json["overall_score"].is_null());

    // Reweighting changes combined scores without re-running the assessment
    ASSERT_EQ(api_->putScoringWeights(R"({"ai_weight":0,"manual_weight":100})").status, 200);
    auto reweighted = nlohmann::json::parse(api_->getAssessment("interview-1").body);
    EXPECT_DOUBLE_EQ(reweighted["indicators"][0]["combined_score"].get<double>(), 70.0);
}

TEST_F(InterviewLifecycleTest, DisconnectSkipsAssessment) {
    connect("interview-2");
    client_->handleMessage(R"({"type":"set_indicators","data":{"indicators":[{"id":"lead","name":"Leadership"}]}})");
    client_->handleMessage(nlohmann::json({{"type", "video_frame"}, {"data", {{"frame", jpegFrame()}}}}).dump());

    client_->disconnect();
    drain(services_->controlQueue());
    drain(services_->detectorQueue());

    auto result = services_->controller().finalizedResult("interview-2");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->aborted);
    EXPECT_EQ(result->discardedDetections, 1u);
    EXPECT_FALSE(services_->store()->artifact("interview-2").has_value());
    EXPECT_EQ(services_->store()->size(), 0u);
    EXPECT_FALSE(services_->store()->knowsSession("interview-2"));
    EXPECT_EQ(api_->postAssessment("interview-2").status, 404);
}

TEST_F(InterviewLifecycleTest, SessionWithoutIndicatorsIsNotAssessed) {
    connect("interview-3");
    client_->handleMessage(R"({"type":"end_session"})");
    drain(services_->controlQueue());

    ASSERT_EQ(sentOfType("session_closed").size(), 1u);
    EXPECT_TRUE(services_->store()->artifact("interview-3").has_value());
    EXPECT_EQ(services_->store()->size(), 0u);
    EXPECT_FALSE(services_->pipeline()->lastReport("interview-3").has_value());
}

TEST_F(InterviewLifecycleTest, TwoSessionsStayIndependent) {
    connect("a");
    auto first = client_;
    connect("b");
    auto second = client_;

    first->handleMessage(nlohmann::json({{"type", "video_frame"}, {"data", {{"frame", jpegFrame()}}}}).dump());
    drain(services_->detectorQueue());

    EXPECT_EQ(services_->controller().requestSnapshot("a").facial.sampleCount, 1u);
    EXPECT_EQ(services_->controller().requestSnapshot("b").facial.sampleCount, 0u);

    first->handleMessage(R"({"type":"end_session"})");
    drain(services_->controlQueue());

    EXPECT_EQ(services_->controller().findSession("a"), nullptr);
    EXPECT_NE(services_->controller().findSession("b"), nullptr);
}

TEST_F(InterviewLifecycleTest, OnlyRecentSessionsKeepAssessments) {
    for (const std::string id : {"r1", "r2", "r3"}) {
        connect(id);
        client_->handleMessage(R"({"type":"set_indicators","data":{"indicators":[{"id":"lead","name":"Leadership","keywords":["mentored"]}]}})");
        client_->handleMessage(R"({"type":"end_session"})");
        drain(services_->controlQueue());
        ASSERT_TRUE(services_->pipeline()->lastReport(id).has_value()) << id;
    }

    EXPECT_FALSE(services_->store()->knowsSession("r1"));
    EXPECT_FALSE(services_->pipeline()->lastReport("r1").has_value());
    EXPECT_EQ(api_->getAssessment("r1").status, 404);

    for (const std::string id : {"r2", "r3"}) {
        EXPECT_TRUE(services_->store()->find(id, "lead").has_value()) << id;
        EXPECT_EQ(api_->getAssessment(id).status, 200) << id;
    }
}
