#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/session_controller.hpp"
#include "utils/base64.hpp"
#include "utils/error_handler.hpp"

#include <atomic>
#include <filesystem>
#include <thread>

using namespace panelsense;
using namespace panelsense::core;
using namespace panelsense::emotion;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class StubFacialDetector : public FacialEmotionDetector {
public:
    MOCK_METHOD(std::optional<Detection>, detect, (const DecodedImage& image), (override));
    std::string name() const override { return "stub-facial"; }
};

class StubVoiceDetector : public VoiceEmotionDetector {
public:
    MOCK_METHOD(std::optional<Detection>, detect, (const AudioWindow& window), (override));
    std::string name() const override { return "stub-voice"; }
};

std::string jpegFrame() {
    std::vector<uint8_t> bytes(96, 0x21);
    bytes[0] = 0xFF;
    bytes[1] = 0xD8;
    bytes[2] = 0xFF;
    return utils::encodeBase64(bytes);
}

} // namespace

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "panelsense_controller_test";
        std::filesystem::remove_all(dir_);

        auto facial = std::make_shared<NiceMock<StubFacialDetector>>();
        Detection happy;
        happy.label = "happy";
        happy.confidence = 0.9;
        ON_CALL(*facial, detect(_)).WillByDefault(Return(happy));

        queue_ = std::make_shared<TaskQueue>();
        deps_.facialDetector = facial;
        deps_.voiceDetector = std::make_shared<NiceMock<StubVoiceDetector>>();
        deps_.detectorQueue = queue_;
        deps_.session.recordingsDir = dir_.string();
        deps_.session.drainTimeoutMs = 20;
    }

    void TearDown() override {
        queue_->shutdown();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void drain() {
        while (auto task = queue_->tryDequeue()) {
            task->execute();
        }
    }

    std::filesystem::path dir_;
    std::shared_ptr<TaskQueue> queue_;
    SessionDependencies deps_;
};

TEST_F(SessionControllerTest, OpenRegistersSession) {
    SessionController controller(deps_, 16);
    auto session = controller.openSession("s1");

    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->getState(), SessionState::OPEN);
    EXPECT_EQ(controller.findSession("s1"), session);
    EXPECT_EQ(controller.activeSessionCount(), 1u);
}

TEST_F(SessionControllerTest, DuplicateOpenIsRejected) {
    SessionController controller(deps_, 16);
    controller.openSession("s1");

    EXPECT_THROW(controller.openSession("s1"), utils::AlreadyOpenException);
    EXPECT_EQ(controller.activeSessionCount(), 1u);
}

TEST_F(SessionControllerTest, EmptyIdIsRejected) {
    SessionController controller(deps_, 16);
    EXPECT_THROW(controller.openSession(""), utils::SessionStateException);
}

TEST_F(SessionControllerTest, UnknownIdIsNotFound) {
    SessionController controller(deps_, 16);

    EXPECT_THROW(controller.ingestFrame("nope", Modality::FACIAL, jpegFrame()), utils::NotFoundException);
    EXPECT_THROW(controller.requestSnapshot("nope"), utils::NotFoundException);
    EXPECT_THROW(controller.closeSession("nope"), utils::NotFoundException);
    EXPECT_THROW(controller.abortSession("nope"), utils::NotFoundException);
}

TEST_F(SessionControllerTest, IngestReachesAggregator) {
    SessionController controller(deps_, 16);
    controller.openSession("s1");

    EXPECT_TRUE(controller.ingestFrame("s1", Modality::FACIAL, jpegFrame(), 3.0));
    drain();

    EmotionSnapshot snapshot = controller.requestSnapshot("s1");
    EXPECT_EQ(snapshot.facial.label.value_or(""), "happy");
    EXPECT_EQ(snapshot.facial.sampleCount, 1u);
}

TEST_F(SessionControllerTest, CloseIsIdempotentAndNotifiesOnce) {
    SessionController controller(deps_, 16);
    int notified = 0;
    controller.setFinalizedCallback([&](const FinalizedSession&) { notified++; });
    controller.openSession("s1");

    FinalizedSession first = controller.closeSession("s1");
    FinalizedSession second = controller.closeSession("s1");

    EXPECT_EQ(first.audioArtifact, second.audioArtifact);
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(controller.activeSessionCount(), 0u);
    EXPECT_EQ(controller.findSession("s1"), nullptr);
    ASSERT_TRUE(controller.finalizedResult("s1").has_value());
}

TEST_F(SessionControllerTest, ClosedSessionDropsFrames) {
    SessionController controller(deps_, 16);
    controller.openSession("s1");
    controller.closeSession("s1");

    EXPECT_FALSE(controller.ingestFrame("s1", Modality::FACIAL, jpegFrame()));
    EXPECT_TRUE(queue_->empty());
    EXPECT_THROW(controller.requestSnapshot("s1"), utils::SessionStateException);
}

TEST_F(SessionControllerTest, ReopenAfterCloseStartsFresh) {
    SessionController controller(deps_, 16);
    controller.openSession("s1");
    controller.ingestFrame("s1", Modality::FACIAL, jpegFrame());
    drain();
    controller.closeSession("s1");

    auto reopened = controller.openSession("s1");
    EXPECT_EQ(reopened->aggregator().sampleCount(), 0u);
    EXPECT_FALSE(controller.finalizedResult("s1").has_value());
}

TEST_F(SessionControllerTest, AbortDoesNotNotify) {
    SessionController controller(deps_, 16);
    int notified = 0;
    controller.setFinalizedCallback([&](const FinalizedSession&) { notified++; });
    controller.openSession("s1");

    FinalizedSession result = controller.abortSession("s1");
    EXPECT_TRUE(result.aborted);

    // A later graceful close returns the cached abort and still does not notify
    EXPECT_TRUE(controller.closeSession("s1").aborted);
    EXPECT_EQ(notified, 0);
}

TEST_F(SessionControllerTest, ClosedResultsAreBounded) {
    SessionController controller(deps_, 2);
    for (const char* id : {"a", "b", "c"}) {
        controller.openSession(id);
        controller.closeSession(id);
    }

    EXPECT_THROW(controller.closeSession("a"), utils::NotFoundException);
    EXPECT_NO_THROW(controller.closeSession("b"));
    EXPECT_NO_THROW(controller.closeSession("c"));
}

TEST_F(SessionControllerTest, ZeroRetentionForgetsClosedSessions) {
    SessionController controller(deps_, 0);
    controller.openSession("s1");
    controller.closeSession("s1");

    EXPECT_THROW(controller.closeSession("s1"), utils::NotFoundException);
}

TEST_F(SessionControllerTest, CallbackFailureIsContained) {
    utils::ErrorHandler::getInstance().clearErrorHistory();
    SessionController controller(deps_, 16);
    controller.setFinalizedCallback([](const FinalizedSession&) {
        throw std::runtime_error("assessment queue gone");
    });
    controller.openSession("s1");

    EXPECT_NO_THROW(controller.closeSession("s1"));
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(), 1u);
}

TEST_F(SessionControllerTest, FactoryIsUsedForNewSessions) {
    std::vector<std::string> created;
    SessionDependencies deps = deps_;
    SessionController controller([&created, deps](const std::string& id) {
        created.push_back(id);
        return std::make_shared<InterviewSession>(id, deps);
    }, 4);

    controller.openSession("x");
    controller.openSession("y");

    std::vector<std::string> expected = {"x", "y"};
    EXPECT_EQ(created, expected);
}

TEST_F(SessionControllerTest, ShutdownAbortsEverySession) {
    SessionController controller(deps_, 16);
    auto a = controller.openSession("a");
    auto b = controller.openSession("b");

    controller.shutdown();

    EXPECT_EQ(controller.activeSessionCount(), 0u);
    EXPECT_EQ(a->getState(), SessionState::CLOSED);
    EXPECT_EQ(b->getState(), SessionState::CLOSED);
    EXPECT_TRUE(controller.finalizedResult("a")->aborted);
}

TEST_F(SessionControllerTest, SessionsCloseIndependently) {
    deps_.session.drainTimeoutMs = 2000;
    SessionController controller(deps_, 16);
    controller.openSession("slow");
    controller.openSession("fast");

    // "slow" has a detection in flight, "fast" has none
    controller.ingestFrame("slow", Modality::FACIAL, jpegFrame());

    std::atomic<bool> slowClosed{false};
    std::thread closer([&]() {
        controller.closeSession("slow");
        slowClosed = true;
    });

    while (controller.findSession("slow")->getState() != SessionState::CLOSING) {
        std::this_thread::yield();
    }

    FinalizedSession fast = controller.closeSession("fast");
    EXPECT_EQ(fast.sessionId, "fast");
    EXPECT_FALSE(slowClosed.load());

    drain();
    closer.join();
    EXPECT_TRUE(slowClosed.load());
}
