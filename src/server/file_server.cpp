#include "fileshare/server/file_server.h"
#include "fileshare/server/index_page.h"
#include "fileshare/base/logger.h"
#include "fileshare/http/connection.h"
#include "fileshare/transfer/download_engine.h"
#include "fileshare/transfer/upload_engine.h"
#include "fileshare/util/net_utils.h"
#include <elio/elio.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <future>
#include <optional>
#include <thread>

using json = nlohmann::json;

namespace fileshare {

struct FileServer::Impl {
    ServerConfig config;
    std::shared_ptr<TransferSession> session;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> listen_port{0};
    std::thread server_thread;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::optional<elio::net::tcp_listener> listener;

    // Accept connections until stop()
    elio::coro::task<void> accept_loop() {
        while (running.load()) {
            auto stream_result = co_await listener->accept();
            if (!stream_result) {
                if (running.load()) {
                    Logger::instance().error("Accept error: {}", std::strerror(errno));
                }
                continue;
            }

            auto handler = handle_connection(std::move(*stream_result));
            scheduler->spawn(handler.release());
        }
        Logger::instance().debug("Accept loop stopped");
    }

    elio::coro::task<void> handle_connection(elio::net::tcp_stream stream) {
        HttpConnection conn(std::move(stream), config.max_header_bytes);
        std::string peer_id = normalize_peer_id(conn.peer_address());
        Logger::instance().debug("Connection from {}", conn.peer_address());

        try {
            auto read_result = co_await conn.read_request();
            if (read_result.ok()) {
                const auto& request = read_result.request;
                Logger::instance().debug("{} {} from {}", request.method, request.path, peer_id);
                co_await dispatch(conn, request, peer_id);
            } else if (read_result.error == ErrorCode::HeaderTooLarge) {
                co_await conn.send_response(error_response(431, "Request header too large"));
            } else if (read_result.error == ErrorCode::MalformedRequest) {
                co_await conn.send_response(error_response(400, "Malformed request"));
            } else {
                Logger::instance().debug("Connection from {} closed before a request: {}",
                                         peer_id, to_string(read_result.error));
            }
        } catch (const std::exception& e) {
            Logger::instance().error("Error handling request from {}: {}", peer_id, e.what());
        }

        co_await conn.close();
    }

    elio::coro::task<void> dispatch(HttpConnection& conn, const HttpRequest& request,
                                    const std::string& peer_id) {
        const std::string& path = request.path;
        const bool is_get = request.method == "GET";
        const bool is_post = request.method == "POST";

        if (path == "/") {
            if (!is_get) {
                co_await conn.send_response(error_response(405, "Method not allowed"));
                co_return;
            }
            co_await conn.send_response(HttpResponse(200, "text/html; charset=utf-8", index_html()));
        } else if (path == "/api/info") {
            if (!is_get) {
                co_await conn.send_response(error_response(405, "Method not allowed"));
                co_return;
            }
            co_await conn.send_response(json_response(200, session->snapshot().to_json()));
        } else if (path == "/api/events") {
            if (!is_get) {
                co_await conn.send_response(error_response(405, "Method not allowed"));
                co_return;
            }
            co_await handle_events(conn, peer_id);
        } else if (path == "/api/download") {
            co_await handle_download(conn, request, peer_id);
        } else if (path == "/api/upload") {
            co_await handle_upload(conn, request, peer_id);
        } else if (path == "/api/cancel") {
            if (!is_post) {
                co_await conn.send_response(error_response(405, "Method not allowed"));
                co_return;
            }
            session->cancel(peer_id);
            Logger::instance().warning("Transfer cancelled by {}", peer_id);
            json body = {{"status", "cancelled"}};
            co_await conn.send_response(json_response(200, body.dump()));
        } else if (path == "/api/log") {
            if (!is_get) {
                co_await conn.send_response(error_response(405, "Method not allowed"));
                co_return;
            }
            json body = session->log_entries();
            co_await conn.send_response(json_response(200, body.dump()));
        } else {
            json body = {{"error", "Not Found"}, {"path", path}};
            co_await conn.send_response(json_response(404, body.dump()));
        }
    }

    elio::coro::task<void> handle_download(HttpConnection& conn, const HttpRequest& request,
                                           const std::string& peer_id) {
        if (session->mode() != TransferMode::Send) {
            co_await conn.send_response(error_response(400, "Server is not in send mode"));
            co_return;
        }
        if (request.method != "GET") {
            co_await conn.send_response(error_response(405, "Method not allowed"));
            co_return;
        }
        if (!session->try_admit(peer_id)) {
            Logger::instance().info("Rejected download from {}: another client is active", peer_id);
            co_await conn.send_response(error_response(503, "Another client is already connected"));
            co_return;
        }

        PeerLease lease(session, peer_id);
        session->add_log("Client " + peer_id + " connected");

        DownloadEngine engine(session);
        auto outcome = co_await engine.serve(conn, peer_id, request.get_header("range"));
        Logger::instance().debug("Download for {} {}: {} bytes {}", peer_id,
                                 to_string(outcome.result), outcome.bytes, outcome.message);
    }

    elio::coro::task<void> handle_upload(HttpConnection& conn, const HttpRequest& request,
                                         const std::string& peer_id) {
        std::optional<uint64_t> length;
        if (!request.is_chunked()) {
            length = request.content_length();
        }

        if (session->mode() != TransferMode::Recv) {
            co_await reject_upload(conn, length, error_response(400, "Server is not in receive mode"));
            co_return;
        }
        if (request.method != "POST") {
            co_await reject_upload(conn, length, error_response(405, "Method not allowed"));
            co_return;
        }
        if (!length) {
            co_await conn.send_response(error_response(411, "Content-Length required"));
            co_return;
        }
        if (!session->try_admit(peer_id)) {
            Logger::instance().info("Rejected upload from {}: another client is active", peer_id);
            co_await reject_upload(conn, length, error_response(503, "Another client is already connected"));
            co_return;
        }

        PeerLease lease(session, peer_id);
        session->add_log("Client " + peer_id + " connected");

        BodyReader body(conn, *length);
        UploadEngine engine(session);
        auto result = co_await engine.receive(body, request.get_header("content-type"),
                                              *length, peer_id);

        HttpResponse response = upload_response(result);
        if (!co_await conn.send_response(std::move(response))) {
            co_return;
        }
        // Read what the engine left unread (the closing delimiter, or the rest
        // of a cancelled or failed upload) so the close does not reset the peer
        if (!co_await body.drain()) {
            Logger::instance().debug("Upload body from {} ended early: {} bytes unread",
                                     peer_id, body.remaining());
        }
    }

    static HttpResponse upload_response(const UploadResult& result) {
        switch (result.status) {
            case UploadStatus::Completed: {
                json response = {
                    {"status", "success"},
                    {"path", result.saved_path.string()},
                    {"size", result.size}
                };
                return json_response(200, response.dump());
            }
            case UploadStatus::Conflict: {
                json response = {
                    {"error", "file_exists"},
                    {"message", result.message},
                    {"path", result.saved_path.string()}
                };
                return json_response(409, response.dump());
            }
            case UploadStatus::BadRequest:
                return error_response(400, result.message);
            case UploadStatus::Cancelled: {
                json response = {
                    {"error", "cancelled"},
                    {"message", "Transfer cancelled"},
                    {"size", result.size}
                };
                return json_response(409, response.dump());
            }
            case UploadStatus::Failed:
                break;
        }
        return error_response(500, result.message);
    }

    // Answer, then consume the body so the peer is not reset mid-upload
    elio::coro::task<void> reject_upload(HttpConnection& conn, std::optional<uint64_t> length,
                                         HttpResponse response) {
        if (!co_await conn.send_response(std::move(response))) {
            co_return;
        }
        if (length) {
            BodyReader body(conn, *length);
            co_await body.drain();
        }
    }

    elio::coro::task<void> handle_events(HttpConnection& conn, const std::string& peer_id) {
        HttpResponse head(200, "text/event-stream", "");
        head.set_header("Cache-Control", "no-cache");
        if (!co_await conn.send_head(std::move(head))) {
            co_return;
        }

        auto channel = session->subscribe();
        Logger::instance().debug("Observer {} subscribed ({} total)", peer_id, session->observer_count());

        const auto heartbeat = std::chrono::milliseconds(session->config().heartbeat_interval_ms);
        const auto poll = std::chrono::milliseconds(session->config().event_poll_interval_ms);

        std::string frame = "data: " + session->snapshot().to_json() + "\n\n";
        bool connected = co_await conn.write(frame.data(), frame.size());
        auto last_heartbeat = std::chrono::steady_clock::now();

        while (connected && running.load() && !channel->is_closed()) {
            while (auto message = channel->try_pop()) {
                frame = "data: " + *message + "\n\n";
                if (!co_await conn.write(frame.data(), frame.size())) {
                    connected = false;
                    break;
                }
            }
            if (!connected) {
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_heartbeat >= heartbeat) {
                static const std::string heartbeat_frame = ":heartbeat\n\n";
                if (!co_await conn.write(heartbeat_frame.data(), heartbeat_frame.size())) {
                    break;
                }
                last_heartbeat = now;
            }

            co_await elio::time::sleep_for(poll);
        }

        session->unsubscribe(channel);
        Logger::instance().debug("Observer {} left, {} dropped updates", peer_id, channel->dropped());
    }
};

FileServer::FileServer(const ServerConfig& config, std::shared_ptr<TransferSession> session)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->session = std::move(session);
}

FileServer::~FileServer() {
    stop();
}

bool FileServer::start() {
    if (impl_->running.load()) {
        Logger::instance().warning("File server already running");
        return true;
    }

    std::promise<bool> bound;
    auto bound_future = bound.get_future();
    impl_->running = true;

    impl_->server_thread = std::thread([this, &bound]() {
        auto& config = impl_->config;

        impl_->scheduler = std::make_shared<elio::runtime::scheduler>(
            config.worker_threads > 0 ? config.worker_threads : 2);
        impl_->scheduler->start();

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;
        opts.backlog = 64;

        elio::net::socket_address bind_addr;
        if (config.bind_address == "0.0.0.0") {
            bind_addr = elio::net::socket_address(elio::net::ipv4_address(config.port));
        } else {
            bind_addr = elio::net::socket_address(config.bind_address, config.port);
        }

        auto listener_result = elio::net::tcp_listener::bind(bind_addr, opts);
        if (!listener_result) {
            Logger::instance().error("Failed to bind {}:{}: {}", config.bind_address,
                                     config.port, std::strerror(errno));
            impl_->running = false;
            impl_->scheduler->shutdown();
            bound.set_value(false);
            return;
        }

        impl_->listener = std::move(*listener_result);
        impl_->listen_port = impl_->listener->local_address().port();
        Logger::instance().info("File server listening on {}:{}", config.bind_address,
                                impl_->listen_port.load());

        auto accept_loop = impl_->accept_loop();
        impl_->scheduler->spawn(accept_loop.release());
        bound.set_value(true);

        // Keep thread alive while running
        while (impl_->running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (impl_->listener) {
            impl_->listener->close();
        }
        impl_->session->close_observers();

        // Let observer loops see the closed channels
        std::this_thread::sleep_for(std::chrono::milliseconds(
            impl_->session->config().event_poll_interval_ms * 2));
        impl_->scheduler->shutdown();
        Logger::instance().info("File server stopped");
    });

    if (!bound_future.get()) {
        impl_->server_thread.join();
        return false;
    }
    return true;
}

void FileServer::stop() {
    impl_->running = false;
    if (impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
}

bool FileServer::is_running() const {
    return impl_->running.load();
}

uint16_t FileServer::get_listen_port() const {
    return impl_->listen_port.load();
}

std::shared_ptr<TransferSession> FileServer::session() const {
    return impl_->session;
}

bool FileServer::transfer_finished() const {
    return impl_->session->finished();
}

} // namespace fileshare
