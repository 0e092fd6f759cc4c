#include "core/message_protocol.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <map>

namespace panelsense {
namespace core {

using nlohmann::json;

namespace {

json envelope(const std::string& type, json data = nullptr) {
    json root = {{"type", type}};
    if (!data.is_null()) {
        root["data"] = std::move(data);
    }
    return root;
}

// Transcript text and labels may carry invalid UTF-8; replace rather than throw
std::string encode(const json& root) {
    return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

template<typename T>
json optionalJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json modalityToJson(const emotion::ModalitySnapshot& modality) {
    return {
        {"label", optionalJson(modality.label)},
        {"dominantLabel", optionalJson(modality.dominantLabel)},
        {"confidence", optionalJson(modality.confidence)},
        {"stability", optionalJson(modality.stability)},
        {"sampleCount", modality.sampleCount}
    };
}

std::string stringField(const json& object, const char* key, const std::string& fallback = "") {
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : fallback;
}

} // namespace

std::string VideoFrameMessage::serialize() const {
    json data = {{"frame", frame_}};
    if (timestamp_) {
        data["timestamp"] = *timestamp_;
    }
    return encode(envelope("video_frame", std::move(data)));
}

std::string AudioChunkMessage::serialize() const {
    json data = {{"audio", audio_}};
    if (timestamp_) {
        data["timestamp"] = *timestamp_;
    }
    return encode(envelope("audio_chunk", std::move(data)));
}

std::string GetSnapshotMessage::serialize() const {
    return encode(envelope("get_snapshot"));
}

std::string SetIndicatorsMessage::serialize() const {
    json list = json::array();
    for (const auto& indicator : indicators_) {
        list.push_back(MessageProtocol::indicatorToJson(indicator));
    }
    return encode(envelope("set_indicators", {{"indicators", std::move(list)}}));
}

std::string EndSessionMessage::serialize() const {
    return encode(envelope("end_session"));
}

std::string PingMessage::serialize() const {
    return encode(envelope("ping"));
}

std::string SessionOpenedMessage::serialize() const {
    return encode(envelope("session_opened", {{"sessionId", sessionId_}}));
}

std::string EmotionUpdateMessage::serialize() const {
    return encode(envelope("emotion_update", {{"snapshot", MessageProtocol::snapshotToJson(snapshot_)}}));
}

std::string SnapshotMessage::serialize() const {
    return encode(envelope("snapshot", {{"snapshot", MessageProtocol::snapshotToJson(snapshot_)}}));
}

std::string SessionClosedMessage::serialize() const {
    return encode(envelope("session_closed", {
        {"sessionId", sessionId_},
        {"audioArtifact", audioArtifact_},
        {"sampleCount", sampleCount_}
    }));
}

std::string AssessmentReadyMessage::serialize() const {
    return encode(envelope("assessment_ready", {
        {"sessionId", assessment_.sessionId},
        {"indicatorId", assessment_.indicatorId},
        {"aiScore", assessment_.aiScore},
        {"evidence", assessment_.evidenceText},
        {"reasoning", assessment_.reasoning}
    }));
}

std::string ErrorMessage::serialize() const {
    json data = {{"message", message_}};
    if (!code_.empty()) {
        data["code"] = code_;
    }
    return encode(envelope("error", std::move(data)));
}

std::string PongMessage::serialize() const {
    return encode(envelope("pong"));
}

json MessageProtocol::snapshotToJson(const emotion::EmotionSnapshot& snapshot) {
    return {
        {"facial", modalityToJson(snapshot.facial)},
        {"voice", modalityToJson(snapshot.voice)}
    };
}

json MessageProtocol::indicatorToJson(const assessment::Indicator& indicator) {
    return {
        {"id", indicator.id},
        {"name", indicator.name},
        {"description", indicator.description},
        {"weight", indicator.weight},
        {"keywords", indicator.keywords}
    };
}

std::optional<double> MessageProtocol::optionalNumber(const json& data, const std::string& key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) {
        return std::nullopt;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> MessageProtocol::indicatorIdFromJson(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<unsigned long long>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        // Doubles stop representing every integer past 2^53
        constexpr double kMaxExactInteger = 9007199254740992.0;
        double number = value.get<double>();
        if (!std::isfinite(number) || std::trunc(number) != number || std::fabs(number) > kMaxExactInteger) {
            return std::nullopt;
        }
        return std::to_string(static_cast<long long>(number));
    }
    return std::nullopt;
}

std::optional<assessment::Indicator> MessageProtocol::parseIndicator(const json& item) {
    if (!item.is_object()) {
        return std::nullopt;
    }
    auto id = item.find("id");
    if (id == item.end()) {
        return std::nullopt;
    }

    auto indicatorId = indicatorIdFromJson(*id);
    if (!indicatorId) {
        return std::nullopt;
    }

    assessment::Indicator indicator;
    indicator.id = std::move(*indicatorId);

    indicator.name = stringField(item, "name", indicator.id);
    indicator.description = stringField(item, "description");
    indicator.weight = optionalNumber(item, "weight").value_or(1.0);

    auto keywords = item.find("keywords");
    if (keywords != item.end() && keywords->is_array()) {
        for (const auto& keyword : *keywords) {
            if (keyword.is_string()) {
                indicator.keywords.push_back(keyword.get<std::string>());
            }
        }
    }
    return indicator;
}

std::unique_ptr<Message> MessageProtocol::parseMessage(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        utils::Logger::warn("Failed to parse message: malformed JSON");
        return nullptr;
    }

    if (!root.is_object() || !root.contains("type") || !root["type"].is_string()) {
        utils::Logger::warn("Invalid message format: missing type field");
        return nullptr;
    }

    std::string typeStr = root["type"].get<std::string>();
    const json data = root.contains("data") && root["data"].is_object() ? root["data"] : json::object();

    switch (stringToMessageType(typeStr)) {
        case MessageType::VIDEO_FRAME: {
            std::string frame = stringField(data, "frame");
            if (frame.empty()) {
                utils::Logger::warn("video_frame without frame data");
                return nullptr;
            }
            return std::make_unique<VideoFrameMessage>(frame, optionalNumber(data, "timestamp"));
        }

        case MessageType::AUDIO_CHUNK: {
            std::string audio = stringField(data, "audio");
            if (audio.empty()) {
                utils::Logger::warn("audio_chunk without audio data");
                return nullptr;
            }
            return std::make_unique<AudioChunkMessage>(audio, optionalNumber(data, "timestamp"));
        }

        case MessageType::GET_SNAPSHOT:
            return std::make_unique<GetSnapshotMessage>();

        case MessageType::SET_INDICATORS: {
            auto list = data.find("indicators");
            if (list == data.end() || !list->is_array()) {
                utils::Logger::warn("set_indicators without an indicators array");
                return nullptr;
            }
            std::vector<assessment::Indicator> indicators;
            for (const auto& item : *list) {
                auto indicator = parseIndicator(item);
                if (!indicator) {
                    utils::Logger::warn("set_indicators contains an indicator without an id");
                    return nullptr;
                }
                indicators.push_back(std::move(*indicator));
            }
            return std::make_unique<SetIndicatorsMessage>(std::move(indicators));
        }

        case MessageType::END_SESSION:
            return std::make_unique<EndSessionMessage>();

        case MessageType::PING:
            return std::make_unique<PingMessage>();

        default:
            utils::Logger::warn("Unknown message type: " + typeStr);
            return nullptr;
    }
}

MessageType MessageProtocol::getMessageType(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return MessageType::UNKNOWN;
    }
    auto type = root.find("type");
    if (type == root.end() || !type->is_string()) {
        return MessageType::UNKNOWN;
    }
    return stringToMessageType(type->get<std::string>());
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    static const std::map<std::string, MessageType> kTypes = {
        {"video_frame", MessageType::VIDEO_FRAME},
        {"audio_chunk", MessageType::AUDIO_CHUNK},
        {"get_snapshot", MessageType::GET_SNAPSHOT},
        {"get_analysis", MessageType::GET_SNAPSHOT},
        {"set_indicators", MessageType::SET_INDICATORS},
        {"end_session", MessageType::END_SESSION},
        {"ping", MessageType::PING},
        {"session_opened", MessageType::SESSION_OPENED},
        {"emotion_update", MessageType::EMOTION_UPDATE},
        {"snapshot", MessageType::SNAPSHOT},
        {"session_closed", MessageType::SESSION_CLOSED},
        {"assessment_ready", MessageType::ASSESSMENT_READY},
        {"error", MessageType::ERROR},
        {"pong", MessageType::PONG}
    };
    auto it = kTypes.find(typeStr);
    return it != kTypes.end() ? it->second : MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::VIDEO_FRAME: return "video_frame";
        case MessageType::AUDIO_CHUNK: return "audio_chunk";
        case MessageType::GET_SNAPSHOT: return "get_snapshot";
        case MessageType::SET_INDICATORS: return "set_indicators";
        case MessageType::END_SESSION: return "end_session";
        case MessageType::PING: return "ping";
        case MessageType::SESSION_OPENED: return "session_opened";
        case MessageType::EMOTION_UPDATE: return "emotion_update";
        case MessageType::SNAPSHOT: return "snapshot";
        case MessageType::SESSION_CLOSED: return "session_closed";
        case MessageType::ASSESSMENT_READY: return "assessment_ready";
        case MessageType::ERROR: return "error";
        case MessageType::PONG: return "pong";
        default: return "unknown";
    }
}

} // namespace core
} // namespace panelsense
