#pragma once

#include "config/config_types.hpp"
#include "core/pipeline.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Forward-declare httplib types (keeps the header-only library out of every TU)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace piiguard {

class ShutdownCoordinator;

/**
 * @brief HTTP sidecar adapter around InterceptorPipeline
 *
 * Routes:
 *   POST /v1/sanitize   body in, sanitized body (or fallback) out
 *   GET  /health        liveness; 503 while draining
 *   GET  /stats         pipeline and audit counters
 *   POST /admin/reload  reload config from disk and swap the snapshot
 *
 * The sanitize response carries X-PII-State, X-PII-Redacted and the
 * X-Request-Id used as document id. A redact_all fallback is returned
 * with 200 and X-PII-State: DEGRADED; a reject fallback uses the
 * configured status and a {"error","code"} body.
 */
class HttpServer {
public:
    /// Reloads configuration and returns the new snapshot version; throws on failure
    using ReloadHandler = std::function<uint64_t()>;

    HttpServer(std::shared_ptr<InterceptorPipeline> pipeline, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }
    void set_reload_handler(ReloadHandler handler) { reload_handler_ = std::move(handler); }

    /// Blocks until stop(); throws std::runtime_error if the socket cannot be bound
    void start();
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Map a pipeline result onto an HTTP response
    static void write_response(const InterceptResult& result, httplib::Response& res);

    struct HttpStats {
        uint64_t requests;
        uint64_t payload_too_large;
        uint64_t shutdown_rejects;
        uint64_t admin_rejects;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

    // Route handlers (callable without a listening socket)
    void handle_sanitize(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_reload(const httplib::Request& req, httplib::Response& res);

private:
    void register_routes(httplib::Server& svr);

    [[nodiscard]] std::string build_stats_json() const;

    std::shared_ptr<InterceptorPipeline> pipeline_;
    ServerConfig config_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;
    ReloadHandler reload_handler_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> payload_too_large_{0};
    std::atomic<uint64_t> shutdown_rejects_{0};
    std::atomic<uint64_t> admin_rejects_{0};
};

} // namespace piiguard
