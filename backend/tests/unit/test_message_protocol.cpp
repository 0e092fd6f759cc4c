#include <gtest/gtest.h>
#include "core/message_protocol.hpp"
#include <nlohmann/json.hpp>

using namespace panelsense;
using namespace panelsense::core;

class MessageProtocolTest : public ::testing::Test {
protected:
    template<typename T>
    const T* as(const std::unique_ptr<Message>& message) {
        return dynamic_cast<const T*>(message.get());
    }

    nlohmann::json parse(const std::string& json) {
        return nlohmann::json::parse(json);
    }
};

TEST_F(MessageProtocolTest, ParseVideoFrame) {
    auto message = MessageProtocol::parseMessage(
        R"({"type":"video_frame","data":{"frame":"data:image/jpeg;base64,/9j/AA==","timestamp":12.5}})");

    ASSERT_NE(message, nullptr);
    ASSERT_EQ(message->getType(), MessageType::VIDEO_FRAME);
    auto frame = as<VideoFrameMessage>(message);
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->getFrame(), "data:image/jpeg;base64,/9j/AA==");
    ASSERT_TRUE(frame->getTimestamp().has_value());
    EXPECT_DOUBLE_EQ(*frame->getTimestamp(), 12.5);
}

TEST_F(MessageProtocolTest, TimestampIsOptional) {
    auto message = MessageProtocol::parseMessage(R"({"type":"audio_chunk","data":{"audio":"AAAA"}})");

    ASSERT_NE(message, nullptr);
    auto chunk = as<AudioChunkMessage>(message);
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->getAudio(), "AAAA");
    EXPECT_FALSE(chunk->getTimestamp().has_value());
}

TEST_F(MessageProtocolTest, NonNumericTimestampIsIgnored) {
    auto message = MessageProtocol::parseMessage(
        R"({"type":"video_frame","data":{"frame":"AAAA","timestamp":"soon"}})");

    ASSERT_NE(message, nullptr);
    EXPECT_FALSE(as<VideoFrameMessage>(message)->getTimestamp().has_value());
}

TEST_F(MessageProtocolTest, FramesWithoutPayloadAreRejected) {
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"video_frame","data":{}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"video_frame"})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"audio_chunk","data":{"audio":""}})"), nullptr);
}

TEST_F(MessageProtocolTest, ControlMessages) {
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"get_snapshot"})")->getType(), MessageType::GET_SNAPSHOT);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"end_session"})")->getType(), MessageType::END_SESSION);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"ping"})")->getType(), MessageType::PING);
}

TEST_F(MessageProtocolTest, GetAnalysisIsSnapshotAlias) {
    auto message = MessageProtocol::parseMessage(R"({"type":"get_analysis"})");
    ASSERT_NE(message, nullptr);
    EXPECT_EQ(message->getType(), MessageType::GET_SNAPSHOT);
}

TEST_F(MessageProtocolTest, ParseIndicators) {
    auto message = MessageProtocol::parseMessage(R"({
        "type": "set_indicators",
        "data": {
            "indicators": [
                {"id": "ind-1", "name": "Leadership", "description": "Leads teams", "weight": 2,
                 "keywords": ["led", "mentored", 7]},
                {"id": 42, "name": "Ownership"}
            ]
        }
    })");

    ASSERT_NE(message, nullptr);
    auto set = as<SetIndicatorsMessage>(message);
    ASSERT_NE(set, nullptr);
    const auto& indicators = set->getIndicators();
    ASSERT_EQ(indicators.size(), 2u);

    EXPECT_EQ(indicators[0].id, "ind-1");
    EXPECT_EQ(indicators[0].name, "Leadership");
    EXPECT_EQ(indicators[0].description, "Leads teams");
    EXPECT_DOUBLE_EQ(indicators[0].weight, 2.0);
    std::vector<std::string> keywords = {"led", "mentored"};
    EXPECT_EQ(indicators[0].keywords, keywords);

    EXPECT_EQ(indicators[1].id, "42");
    EXPECT_DOUBLE_EQ(indicators[1].weight, 1.0);
    EXPECT_TRUE(indicators[1].keywords.empty());
}

TEST_F(MessageProtocolTest, IndicatorNameDefaultsToId) {
    auto message = MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"id":"teamwork"}]}})");

    ASSERT_NE(message, nullptr);
    EXPECT_EQ(as<SetIndicatorsMessage>(message)->getIndicators()[0].name, "teamwork");
}

TEST_F(MessageProtocolTest, MalformedIndicatorsAreRejected) {
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"set_indicators","data":{}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":{"id":"x"}}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"name":"no id"}]}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"id":true}]}})"), nullptr);
}

TEST_F(MessageProtocolTest, NumericIndicatorIdsMustBeWhole) {
    auto message = MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"id":42.0},{"id":-7},{"id":18446744073709551615}]}})");
    ASSERT_NE(message, nullptr);
    const auto& indicators = as<SetIndicatorsMessage>(message)->getIndicators();
    ASSERT_EQ(indicators.size(), 3u);
    EXPECT_EQ(indicators[0].id, "42");
    EXPECT_EQ(indicators[1].id, "-7");
    EXPECT_EQ(indicators[2].id, "18446744073709551615");

    EXPECT_EQ(MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"id":42.5}]}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"id":1e300}]}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(
        R"({"type":"set_indicators","data":{"indicators":[{"id":-1e19}]}})"), nullptr);
}

TEST_F(MessageProtocolTest, IndicatorIdSpelling) {
    EXPECT_EQ(MessageProtocol::indicatorIdFromJson(nlohmann::json("lead")).value_or(""), "lead");
    EXPECT_EQ(MessageProtocol::indicatorIdFromJson(nlohmann::json(42)).value_or(""), "42");
    EXPECT_EQ(MessageProtocol::indicatorIdFromJson(nlohmann::json(42.0)).value_or(""), "42");
    EXPECT_EQ(MessageProtocol::indicatorIdFromJson(nlohmann::json(9007199254740992.0)).value_or(""),
              "9007199254740992");
    EXPECT_FALSE(MessageProtocol::indicatorIdFromJson(nlohmann::json(1.0e16)).has_value());
    EXPECT_FALSE(MessageProtocol::indicatorIdFromJson(nlohmann::json(nullptr)).has_value());
    EXPECT_FALSE(MessageProtocol::indicatorIdFromJson(nlohmann::json::object()).has_value());
}

TEST_F(MessageProtocolTest, InvalidEnvelopesAreRejected) {
    EXPECT_EQ(MessageProtocol::parseMessage("not json"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage("[]"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"data":{}})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":5})"), nullptr);
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"launch_rockets"})"), nullptr);

    // Server-to-client types are not accepted inbound
    EXPECT_EQ(MessageProtocol::parseMessage(R"({"type":"pong"})"), nullptr);
}

TEST_F(MessageProtocolTest, GetMessageType) {
    EXPECT_EQ(MessageProtocol::getMessageType(R"({"type":"snapshot"})"), MessageType::SNAPSHOT);
    EXPECT_EQ(MessageProtocol::getMessageType(R"({"type":"mystery"})"), MessageType::UNKNOWN);
    EXPECT_EQ(MessageProtocol::getMessageType("{"), MessageType::UNKNOWN);
}

TEST_F(MessageProtocolTest, SessionOpenedEnvelope) {
    auto json = parse(SessionOpenedMessage("s1").serialize());

    EXPECT_EQ(json.value("type", ""), "session_opened");
    EXPECT_EQ(json.at("data").value("sessionId", ""), "s1");
}

TEST_F(MessageProtocolTest, SessionClosedEnvelope) {
    auto json = parse(SessionClosedMessage("s1", "/tmp/s1.wav", 7).serialize());

    EXPECT_EQ(json.value("type", ""), "session_closed");
    const auto& data = json.at("data");
    EXPECT_EQ(data.value("sessionId", ""), "s1");
    EXPECT_EQ(data.value("audioArtifact", ""), "/tmp/s1.wav");
    EXPECT_DOUBLE_EQ(data.value("sampleCount", 0.0), 7.0);
}

TEST_F(MessageProtocolTest, ErrorEnvelope) {
    auto withCode = parse(ErrorMessage("Session is not open", "session_state").serialize());
    EXPECT_EQ(withCode.value("type", ""), "error");
    EXPECT_EQ(withCode.at("data").value("message", ""), "Session is not open");
    EXPECT_EQ(withCode.at("data").value("code", ""), "session_state");

    auto withoutCode = parse(ErrorMessage("oops").serialize());
    EXPECT_FALSE(withoutCode.at("data").contains("code"));
}

TEST_F(MessageProtocolTest, SnapshotUsesNullForEmptyModality) {
    emotion::EmotionSnapshot snapshot;
    snapshot.facial.label = "happy";
    snapshot.facial.dominantLabel = "happy";
    snapshot.facial.confidence = 0.9;
    snapshot.facial.stability = 0.8;
    snapshot.facial.sampleCount = 5;

    auto json = parse(SnapshotMessage(snapshot).serialize());
    EXPECT_EQ(json.value("type", ""), "snapshot");

    const auto& body = json.at("data").at("snapshot");
    const auto& facial = body.at("facial");
    EXPECT_EQ(facial.value("label", ""), "happy");
    EXPECT_EQ(facial.value("dominantLabel", ""), "happy");
    EXPECT_DOUBLE_EQ(facial.value("confidence", 0.0), 0.9);
    EXPECT_DOUBLE_EQ(facial.value("stability", 0.0), 0.8);
    EXPECT_DOUBLE_EQ(facial.value("sampleCount", 0.0), 5.0);

    const auto& voice = body.at("voice");
    ASSERT_TRUE(voice.contains("label"));
    EXPECT_TRUE(voice.at("label").is_null());
    EXPECT_TRUE(voice.at("confidence").is_null());
    EXPECT_TRUE(voice.at("stability").is_null());
    EXPECT_DOUBLE_EQ(voice.value("sampleCount", -1.0), 0.0);
}

TEST_F(MessageProtocolTest, EmotionUpdateCarriesSnapshot) {
    emotion::EmotionSnapshot snapshot;
    snapshot.voice.label = "calm";
    snapshot.voice.sampleCount = 1;

    auto json = parse(EmotionUpdateMessage(snapshot).serialize());
    EXPECT_EQ(json.value("type", ""), "emotion_update");
    EXPECT_EQ(json.at("data").at("snapshot").at("voice").value("label", ""), "calm");
}

TEST_F(MessageProtocolTest, AssessmentReadyEnvelope) {
    assessment::Assessment result;
    result.sessionId = "s1";
    result.indicatorId = "ind-1";
    result.aiScore = 72;
    result.evidenceText = "I led the migration to the new platform";
    result.reasoning = "1 supporting statement";

    auto json = parse(AssessmentReadyMessage(result).serialize());
    EXPECT_EQ(json.value("type", ""), "assessment_ready");
    const auto& data = json.at("data");
    EXPECT_EQ(data.value("indicatorId", ""), "ind-1");
    EXPECT_DOUBLE_EQ(data.value("aiScore", 0.0), 72.0);
    EXPECT_EQ(data.value("evidence", ""), "I led the migration to the new platform");
}

TEST_F(MessageProtocolTest, ClientMessagesSerializeToParseableForm) {
    std::vector<assessment::Indicator> indicators(1);
    indicators[0].id = "ind-1";
    indicators[0].name = "Leadership";
    indicators[0].keywords = {"led"};

    auto reparsed = MessageProtocol::parseMessage(SetIndicatorsMessage(indicators).serialize());
    ASSERT_NE(reparsed, nullptr);
    auto set = as<SetIndicatorsMessage>(reparsed);
    ASSERT_EQ(set->getIndicators().size(), 1u);
    EXPECT_EQ(set->getIndicators()[0].keywords, indicators[0].keywords);

    auto frame = MessageProtocol::parseMessage(VideoFrameMessage("AAAA", 1.5).serialize());
    ASSERT_NE(frame, nullptr);
    EXPECT_DOUBLE_EQ(*as<VideoFrameMessage>(frame)->getTimestamp(), 1.5);
}

TEST_F(MessageProtocolTest, TypeNames) {
    EXPECT_EQ(MessageProtocol::messageTypeToString(MessageType::ASSESSMENT_READY), "assessment_ready");
    EXPECT_EQ(MessageProtocol::messageTypeToString(MessageType::UNKNOWN), "unknown");
}
