#pragma once

#include <memory>
#include <string>

namespace panelsense {
namespace core {

class PanelServices;

/**
 * uWebSockets front end.
 *
 *   WS   /ws/interview/:sessionId        live capture, one session per socket
 *   GET  /health
 *   GET  /settings/scoring-weights
 *   PUT  /settings/scoring-weights
 *   PUT  /sessions/:id/manual-scores
 *   POST /sessions/:id/assessment
 *   GET  /sessions/:id/assessment
 *
 * All socket access happens on the loop thread; workers hand outbound
 * messages to the loop through defer().
 */
class WebSocketServer {
public:
    WebSocketServer(int port, PanelServices& services);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void start();

    // Blocks until stop() closes the listen socket and all connections end
    void run();

    // Safe from any thread
    void stop();

    /**
     * Queue a text message for the socket bound to sessionId.
     * Safe from any thread; dropped if the socket is gone.
     */
    void sendMessage(const std::string& sessionId, const std::string& message);

private:
    struct Impl;

    int port_;
    PanelServices& services_;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace panelsense
