#pragma once

#include "core/message_protocol.hpp"
#include "core/session_controller.hpp"
#include "core/update_coalescer.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace panelsense {
namespace assessment {
class AssessmentStore;
}

namespace core {

/**
 * Protocol handler for one interview connection.
 *
 * Translates inbound messages into SessionController calls and
 * controller results into outbound messages. Transport agnostic: the
 * owner supplies a thread-safe send function, a scheduler that runs
 * work on the network thread and an executor for blocking work such as
 * the close drain.
 */
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    using SendFunction = std::function<void(const std::string&)>;
    using Executor = std::function<void(std::function<void()>)>;

    ClientSession(const std::string& sessionId, SessionController& controller,
                  std::shared_ptr<assessment::AssessmentStore> store,
                  SendFunction send, UpdateCoalescer::Scheduler scheduler, Executor background);
    ~ClientSession();

    /**
     * Open the interview session. On failure an error message is sent
     * and false is returned; the caller should close the connection.
     */
    bool start();

    void handleMessage(const std::string& message);
    void handleBinaryMessage(std::string_view data);

    /**
     * The connection went away. Aborts the session unless the client
     * already ended it.
     */
    void disconnect();

    void sendMessage(const Message& message);

    const std::string& getSessionId() const { return sessionId_; }
    bool isOpen() const { return opened_ && !ended_; }
    bool isEnded() const { return ended_; }

private:
    void processVideoFrame(const VideoFrameMessage* message);
    void processAudioChunk(const AudioChunkMessage* message);
    void processSnapshotRequest();
    void processIndicators(const SetIndicatorsMessage* message);
    void processEndSession();
    void processPing();

    void sendError(const std::exception& error);

    std::string sessionId_;
    SessionController& controller_;
    std::shared_ptr<assessment::AssessmentStore> store_;
    SendFunction send_;
    UpdateCoalescer::Scheduler scheduler_;
    Executor background_;
    std::shared_ptr<UpdateCoalescer> coalescer_;

    std::atomic<bool> opened_{false};
    std::atomic<bool> ended_{false};
};

} // namespace core
} // namespace panelsense
