#include "core/client_session.hpp"
#include "assessment/assessment_store.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace panelsense {
namespace core {

ClientSession::ClientSession(const std::string& sessionId, SessionController& controller,
                             std::shared_ptr<assessment::AssessmentStore> store,
                             SendFunction send, UpdateCoalescer::Scheduler scheduler, Executor background)
    : sessionId_(sessionId)
    , controller_(controller)
    , store_(std::move(store))
    , send_(std::move(send))
    , scheduler_(std::move(scheduler))
    , background_(std::move(background)) {
    utils::Logger::debug("Created client session: " + sessionId_);
}

ClientSession::~ClientSession() {
    utils::Logger::debug("Destroyed client session: " + sessionId_);
}

bool ClientSession::start() {
    std::shared_ptr<InterviewSession> session;
    try {
        session = controller_.openSession(sessionId_);
    } catch (const std::exception& e) {
        utils::Logger::warn("Cannot open session " + sessionId_ + ": " + e.what());
        sendError(e);
        return false;
    }

    SendFunction send = send_;
    coalescer_ = UpdateCoalescer::create(
        [send](const emotion::EmotionSnapshot& snapshot) {
            if (send) {
                send(EmotionUpdateMessage(snapshot).serialize());
            }
        },
        scheduler_);

    std::weak_ptr<UpdateCoalescer> weak = coalescer_;
    session->setUpdateSink([weak](const emotion::EmotionSnapshot& snapshot) {
        if (auto coalescer = weak.lock()) {
            coalescer->publish(snapshot);
        }
    });

    opened_ = true;
    sendMessage(SessionOpenedMessage(sessionId_));
    return true;
}

void ClientSession::handleMessage(const std::string& message) {
    if (!opened_) {
        utils::Logger::warn("Received message for unopened session: " + sessionId_);
        return;
    }

    auto parsed = MessageProtocol::parseMessage(message);
    if (!parsed) {
        utils::Logger::warn("Failed to parse message from session " + sessionId_);
        sendMessage(ErrorMessage("Malformed message", "invalid_frame"));
        return;
    }

    try {
        switch (parsed->getType()) {
            case MessageType::VIDEO_FRAME:
                processVideoFrame(static_cast<const VideoFrameMessage*>(parsed.get()));
                break;
            case MessageType::AUDIO_CHUNK:
                processAudioChunk(static_cast<const AudioChunkMessage*>(parsed.get()));
                break;
            case MessageType::GET_SNAPSHOT:
                processSnapshotRequest();
                break;
            case MessageType::SET_INDICATORS:
                processIndicators(static_cast<const SetIndicatorsMessage*>(parsed.get()));
                break;
            case MessageType::END_SESSION:
                processEndSession();
                break;
            case MessageType::PING:
                processPing();
                break;
            default:
                utils::Logger::warn("Unexpected message type from client session " + sessionId_);
                break;
        }
    } catch (const std::exception& e) {
        sendError(e);
    }
}

void ClientSession::handleBinaryMessage(std::string_view data) {
    if (!opened_) {
        utils::Logger::warn("Received binary data for unopened session: " + sessionId_);
        return;
    }

    try {
        controller_.ingestAudioBytes(sessionId_, reinterpret_cast<const uint8_t*>(data.data()), data.size());
    } catch (const std::exception& e) {
        sendError(e);
    }
}

void ClientSession::processVideoFrame(const VideoFrameMessage* message) {
    controller_.ingestFrame(sessionId_, emotion::Modality::FACIAL, message->getFrame(), message->getTimestamp());
}

void ClientSession::processAudioChunk(const AudioChunkMessage* message) {
    controller_.ingestFrame(sessionId_, emotion::Modality::VOICE, message->getAudio(), message->getTimestamp());
}

void ClientSession::processSnapshotRequest() {
    sendMessage(SnapshotMessage(controller_.requestSnapshot(sessionId_)));
}

void ClientSession::processIndicators(const SetIndicatorsMessage* message) {
    if (!store_) {
        throw utils::ConfigurationException("Assessment is not configured on this server");
    }
    store_->setIndicators(sessionId_, message->getIndicators());
}

void ClientSession::processEndSession() {
    if (ended_.exchange(true)) {
        utils::Logger::debug("Session " + sessionId_ + " already ending");
        return;
    }
    utils::Logger::info("Session " + sessionId_ + " requested to end");

    std::weak_ptr<ClientSession> weak = shared_from_this();
    SessionController* controller = &controller_;
    std::string sessionId = sessionId_;
    SendFunction send = send_;

    auto job = [weak, controller, sessionId, send]() {
        try {
            FinalizedSession result = controller->closeSession(sessionId);
            if (send) {
                send(SessionClosedMessage(result.sessionId, result.audioArtifact, result.sampleCount).serialize());
            }
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "end session", sessionId);
            if (auto self = weak.lock()) {
                self->sendError(e);
            }
        }
    };

    if (background_) {
        background_(std::move(job));
    } else {
        job();
    }
}

void ClientSession::processPing() {
    sendMessage(PongMessage());
}

void ClientSession::disconnect() {
    if (!opened_ || ended_.exchange(true)) {
        return;
    }

    utils::Logger::info("Client disconnected without ending session " + sessionId_);

    SessionController* controller = &controller_;
    std::string sessionId = sessionId_;
    auto store = store_;
    auto job = [controller, store, sessionId]() {
        try {
            controller->abortSession(sessionId);
            // An aborted session is never assessed, so its indicators go too
            if (store) {
                store->forgetSession(sessionId);
            }
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "abort on disconnect", sessionId);
        }
    };

    if (background_) {
        background_(std::move(job));
    } else {
        job();
    }
}

void ClientSession::sendMessage(const Message& message) {
    if (!send_) {
        utils::Logger::warn("Attempted to send message without a connection: " + sessionId_);
        return;
    }
    send_(message.serialize());
}

void ClientSession::sendError(const std::exception& error) {
    std::string code = "internal";
    std::string text = error.what();
    if (auto* known = dynamic_cast<const utils::PanelSenseException*>(&error)) {
        code = known->code();
        text = known->getErrorInfo().message;
    }
    utils::Logger::debug("Session " + sessionId_ + " error [" + code + "]: " + text);
    sendMessage(ErrorMessage(text, code));
}

} // namespace core
} // namespace panelsense
