#include "core/websocket_server.hpp"
#include "core/admin_api.hpp"
#include "core/client_session.hpp"
#include "core/panel_services.hpp"
#include "utils/logging.hpp"

#include <App.h>

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace panelsense {
namespace core {

namespace {

// Per-socket data structure
struct PerSocketData {
    std::string sessionId;
    uint64_t connectionId = 0;
    std::shared_ptr<ClientSession> client;
};

using InterviewSocket = uWS::WebSocket<false, true, PerSocketData>;

constexpr unsigned int kMaxPayloadBytes = 8 * 1024 * 1024;
constexpr unsigned short kIdleTimeoutSeconds = 120;

void writeResponse(uWS::HttpResponse<false>* res, const ApiResponse& response) {
    res->writeStatus(response.statusLine())
       ->writeHeader("Content-Type", "application/json")
       ->writeHeader("Cache-Control", "no-cache")
       ->end(response.body);
}

/**
 * Collect the request body, then hand it to the handler on the loop thread.
 */
template<typename Handler>
void readBody(uWS::HttpResponse<false>* res, Handler handler) {
    auto aborted = std::make_shared<bool>(false);
    auto body = std::make_shared<std::string>();

    res->onAborted([aborted]() {
        *aborted = true;
    });

    res->onData([res, aborted, body, handler = std::move(handler)](std::string_view chunk, bool last) mutable {
        body->append(chunk.data(), chunk.size());
        if (last && !*aborted) {
            writeResponse(res, handler(*body));
        }
    });
}

} // namespace

struct WebSocketServer::Impl {
    explicit Impl(PanelServices& services) : api(services) {}

    AdminApi api;
    std::unique_ptr<uWS::App> app;
    uWS::Loop* loop = nullptr;
    us_listen_socket_t* listenSocket = nullptr;
    std::atomic<bool> running{false};
    std::atomic<uint64_t> nextConnectionId{1};

    // Loop thread only
    std::unordered_map<std::string, InterviewSocket*> sockets;

    // Guards clients, which worker callbacks read
    std::mutex clientsMutex;
    std::unordered_map<std::string, std::weak_ptr<ClientSession>> clients;
};

WebSocketServer::WebSocketServer(int port, PanelServices& services)
    : port_(port), services_(services), impl_(std::make_unique<Impl>(services)) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    utils::Logger::info("Starting WebSocket server on port " + std::to_string(port_));

    impl_->app = std::make_unique<uWS::App>();
    impl_->loop = uWS::Loop::get();
    Impl* impl = impl_.get();

    services_.pipeline()->setAssessmentReadyCallback([this](const assessment::Assessment& assessment) {
        sendMessage(assessment.sessionId, AssessmentReadyMessage(assessment).serialize());
    });

    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.compression = uWS::DISABLED;
    behavior.maxPayloadLength = kMaxPayloadBytes;
    behavior.idleTimeout = kIdleTimeoutSeconds;

    behavior.upgrade = [impl](auto* res, auto* req, auto* context) {
        std::string sessionId(req->getParameter(0));
        if (sessionId.empty()) {
            res->writeStatus("400 Bad Request")->end("missing session id");
            return;
        }

        utils::Logger::info("WebSocket upgrade request for session " + sessionId);
        res->template upgrade<PerSocketData>(
            PerSocketData{sessionId, impl->nextConnectionId++, nullptr},
            req->getHeader("sec-websocket-key"),
            req->getHeader("sec-websocket-protocol"),
            req->getHeader("sec-websocket-extensions"),
            context);
    };

    behavior.open = [this, impl](auto* ws) {
        PerSocketData* data = ws->getUserData();
        const std::string sessionId = data->sessionId;
        const uint64_t connectionId = data->connectionId;
        uWS::Loop* loop = impl->loop;

        // Outbound messages always hop to the loop thread
        auto send = [this](const std::string& id) {
            return [this, id](const std::string& message) { sendMessage(id, message); };
        };
        auto scheduler = [loop](std::function<void()> job) {
            loop->defer(std::move(job));
        };
        auto background = [this](std::function<void()> job) {
            services_.runInBackground(std::move(job));
        };

        auto client = std::make_shared<ClientSession>(sessionId, services_.controller(), services_.store(),
                                                      send(sessionId), scheduler, background);

        // A rejected duplicate must not steal the live socket's route
        if (impl->sockets.count(sessionId) > 0) {
            ws->send(ErrorMessage("Session " + sessionId + " is already open", "already_open").serialize(),
                     uWS::OpCode::TEXT);
            ws->end(1008, "already_open");
            return;
        }

        impl->sockets[sessionId] = ws;
        if (!client->start()) {
            // Close after the queued error message has been sent
            loop->defer([impl, sessionId, ws]() {
                auto it = impl->sockets.find(sessionId);
                if (it != impl->sockets.end() && it->second == ws) {
                    impl->sockets.erase(it);
                    ws->end(1008, "session rejected");
                }
            });
            return;
        }

        data->client = client;
        {
            std::lock_guard<std::mutex> lock(impl->clientsMutex);
            impl->clients[sessionId] = client;
        }
        utils::Logger::info("Client connected: " + sessionId + " (connection " + std::to_string(connectionId) + ")");
    };

    behavior.message = [](auto* ws, std::string_view message, uWS::OpCode opCode) {
        PerSocketData* data = ws->getUserData();
        if (!data->client) {
            return;
        }
        if (opCode == uWS::OpCode::TEXT) {
            data->client->handleMessage(std::string(message));
        } else if (opCode == uWS::OpCode::BINARY) {
            data->client->handleBinaryMessage(message);
        }
    };

    behavior.close = [impl](auto* ws, int code, std::string_view /*message*/) {
        PerSocketData* data = ws->getUserData();
        auto it = impl->sockets.find(data->sessionId);
        if (it != impl->sockets.end() && it->second == ws) {
            impl->sockets.erase(it);
        }
        if (!data->client) {
            return;
        }

        utils::Logger::info("Client disconnected: " + data->sessionId + " (code " + std::to_string(code) + ")");
        {
            std::lock_guard<std::mutex> lock(impl->clientsMutex);
            impl->clients.erase(data->sessionId);
        }
        data->client->disconnect();
        data->client.reset();
    };

    impl_->app->ws<PerSocketData>("/ws/interview/:id", std::move(behavior));

    impl_->app->get("/health", [impl](auto* res, auto* /*req*/) {
        writeResponse(res, impl->api.health());
    });

    impl_->app->get("/settings/scoring-weights", [impl](auto* res, auto* /*req*/) {
        writeResponse(res, impl->api.getScoringWeights());
    });

    impl_->app->put("/settings/scoring-weights", [impl](auto* res, auto* /*req*/) {
        readBody(res, [impl](const std::string& body) {
            return impl->api.putScoringWeights(body);
        });
    });

    impl_->app->put("/sessions/:id/manual-scores", [impl](auto* res, auto* req) {
        std::string sessionId(req->getParameter(0));
        readBody(res, [impl, sessionId](const std::string& body) {
            return impl->api.putManualScore(sessionId, body);
        });
    });

    impl_->app->post("/sessions/:id/assessment", [impl](auto* res, auto* req) {
        writeResponse(res, impl->api.postAssessment(std::string(req->getParameter(0))));
    });

    impl_->app->get("/sessions/:id/assessment", [impl](auto* res, auto* req) {
        writeResponse(res, impl->api.getAssessment(std::string(req->getParameter(0))));
    });

    impl_->app->any("/*", [](auto* res, auto* /*req*/) {
        writeResponse(res, ApiResponse{404, "{\"error\":\"route not found\",\"code\":\"not_found\"}"});
    });
}

void WebSocketServer::run() {
    if (!impl_->app) {
        utils::Logger::error("Server not started. Call start() first.");
        return;
    }

    Impl* impl = impl_.get();
    impl_->app->listen(port_, [this, impl](us_listen_socket_t* listenSocket) {
        if (listenSocket) {
            impl->listenSocket = listenSocket;
            impl->running = true;
            utils::Logger::info("WebSocket server listening on port " + std::to_string(port_));
        } else {
            utils::Logger::error("Failed to listen on port " + std::to_string(port_));
        }
    });

    if (impl_->running) {
        utils::Logger::info("Server started successfully. Press Ctrl+C to stop.");
        impl_->app->run();
    }
    impl_->running = false;
}

void WebSocketServer::stop() {
    if (!impl_ || !impl_->running.exchange(false)) {
        return;
    }

    utils::Logger::info("Stopping WebSocket server");
    Impl* impl = impl_.get();
    impl->loop->defer([impl]() {
        if (impl->listenSocket) {
            us_listen_socket_close(0, impl->listenSocket);
            impl->listenSocket = nullptr;
        }
        // end() runs the close handler, which edits the map
        std::vector<InterviewSocket*> open;
        for (auto& entry : impl->sockets) {
            open.push_back(entry.second);
        }
        for (auto* ws : open) {
            ws->end(1001, "server shutting down");
        }
    });
}

void WebSocketServer::sendMessage(const std::string& sessionId, const std::string& message) {
    Impl* impl = impl_.get();
    if (!impl->loop) {
        utils::Logger::warn("Attempted to send before the server started: " + sessionId);
        return;
    }

    impl->loop->defer([impl, sessionId, message]() {
        auto it = impl->sockets.find(sessionId);
        if (it == impl->sockets.end()) {
            utils::Logger::debug("Dropping message for disconnected session: " + sessionId);
            return;
        }
        it->second->send(message, uWS::OpCode::TEXT);
    });
}

} // namespace core
} // namespace panelsense
