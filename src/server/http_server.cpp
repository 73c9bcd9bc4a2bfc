#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"
#include "document/json_document.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <format>
#include <stdexcept>

namespace piiguard {

namespace {

/// Timing-safe comparison for the admin token
bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

bool require_admin(std::string_view admin_token,
                   const httplib::Request& req, httplib::Response& res) {
    if (admin_token.empty()) return true;
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix ||
        !constant_time_equals(std::string_view(auth).substr(http::kBearerPrefix.size()), admin_token)) {
        res.status = httplib::StatusCode::Unauthorized_401;
        res.set_content(R"({"success":false,"error":"Unauthorized"})", http::kJsonContentType);
        return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<InterceptorPipeline> pipeline, ServerConfig config)
    : pipeline_(std::move(pipeline)),
      config_(std::move(config)) {
    if (!pipeline_) {
        throw std::invalid_argument("HttpServer requires a pipeline");
    }

    if (config_.tls.enabled) {
        server_ = std::make_unique<httplib::SSLServer>(
            config_.tls.cert_file.c_str(), config_.tls.key_file.c_str());
        if (!server_->is_valid()) {
            throw std::runtime_error(std::format(
                "TLS setup failed (cert={}, key={})", config_.tls.cert_file, config_.tls.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}",
                                     config_.tls.cert_file, config_.tls.key_file));
    } else {
        server_ = std::make_unique<httplib::Server>();
    }

    const size_t pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    // Slightly above the limit so oversize bodies reach handle_sanitize and get our 413 body
    server_->set_payload_max_length(config_.max_body_bytes + 1);

    register_routes(*server_);
}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    utils::log::info(std::format("Starting PII Guard sidecar on {}:{} ({}, {} threads)",
        config_.host, config_.port, config_.tls.enabled ? "HTTPS" : "HTTP", config_.thread_pool_size));

    if (!server_->listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

bool HttpServer::is_running() const {
    return server_ && server_->is_running();
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .payload_too_large = payload_too_large_.load(std::memory_order_relaxed),
        .shutdown_rejects = shutdown_rejects_.load(std::memory_order_relaxed),
        .admin_rejects = admin_rejects_.load(std::memory_order_relaxed),
    };
}

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kSanitizePath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_sanitize(req, res);
    });
    svr.Get(http::kHealthPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get(http::kStatsPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });
    svr.Post(http::kReloadPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_reload(req, res);
    });
}

// ============================================================================
// Handler: POST /v1/sanitize
// ============================================================================

void HttpServer::write_response(const InterceptResult& result, httplib::Response& res) {
    res.status = result.http_status;
    res.set_header(http::kStateHeader, std::string(state_to_string(result.state)));
    res.set_header(http::kRedactedHeader, utils::booltostr(result.redacted));
    res.set_header(http::kSnapshotHeader, std::to_string(result.snapshot_version));
    if (!result.document_id.empty()) {
        res.set_header(http::kRequestIdHeader, result.document_id);
    }
    res.set_content(result.body, http::kJsonContentType);
}

void HttpServer::handle_sanitize(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_coordinator_ && !shutdown_coordinator_->try_enter_request()) {
        shutdown_rejects_.fetch_add(1, std::memory_order_relaxed);
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"error":"Server shutting down","code":"SHUTTING_DOWN"})", http::kJsonContentType);
        return;
    }
    RequestGuard guard{shutdown_coordinator_.get()};

    if (req.body.size() > config_.max_body_bytes) {
        payload_too_large_.fetch_add(1, std::memory_order_relaxed);
        res.status = httplib::StatusCode::PayloadTooLarge_413;
        res.set_content(std::format(R"({{"error":"Body exceeds {} bytes","code":"PAYLOAD_TOO_LARGE"}})",
                                    config_.max_body_bytes),
                        http::kJsonContentType);
        return;
    }

    // process() never throws
    auto result = pipeline_->process(req.body, req.get_header_value(http::kRequestIdHeader));
    write_response(result, res);
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    if (shutdown_coordinator_ && shutdown_coordinator_->is_shutting_down()) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"status":"draining","service":"pii-guard"})", http::kJsonContentType);
        return;
    }

    const auto snapshot = pipeline_->registry()->current();
    res.set_content(std::format(
        R"({{"status":"healthy","service":"pii-guard","snapshot_version":{},"detectors":{}}})",
        snapshot->version(), snapshot->matcher().detectors().size()),
        http::kJsonContentType);
}

// ============================================================================
// Handler: GET /stats
// ============================================================================

std::string HttpServer::build_stats_json() const {
    const auto ps = pipeline_->get_stats();
    const auto hs = get_http_stats();
    const auto snapshot = pipeline_->registry()->current();

    std::string out = std::format(
        R"({{"pipeline":{{"total_requests":{},"forwarded":{},"redacted":{},"degraded":{},)"
        R"("rejected":{},"fallback_redacted":{},"cancelled":{},"budget_exceeded":{},)"
        R"("fields_scanned":{},"spans_detected":{}}},)",
        ps.total_requests, ps.forwarded, ps.redacted, ps.degraded,
        ps.rejected, ps.fallback_redacted, ps.cancelled, ps.budget_exceeded,
        ps.fields_scanned, ps.spans_detected);

    out += std::format(
        R"("http":{{"requests":{},"payload_too_large":{},"shutdown_rejects":{},"admin_rejects":{}}},)",
        hs.requests, hs.payload_too_large, hs.shutdown_rejects, hs.admin_rejects);

    if (const auto emitter = pipeline_->audit_emitter()) {
        const auto as = emitter->get_stats();
        out += std::format(
            R"("audit":{{"emitted":{},"written":{},"overflow_dropped":{},"sink_write_failures":{}}},)",
            as.total_emitted, as.total_written, as.overflow_dropped, as.sink_write_failures);
    }

    out += std::format(R"("snapshot":{{"version":{},"reloads":{}}}}})",
                       snapshot->version(), pipeline_->registry()->reload_count());
    return out;
}

void HttpServer::handle_stats(const httplib::Request&, httplib::Response& res) {
    res.set_content(build_stats_json(), http::kJsonContentType);
}

// ============================================================================
// Handler: POST /admin/reload
// ============================================================================

void HttpServer::handle_reload(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(config_.admin_token, req, res)) {
        admin_rejects_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (!reload_handler_) {
        res.status = httplib::StatusCode::NotImplemented_501;
        res.set_content(R"({"success":false,"error":"Reload not configured"})", http::kJsonContentType);
        return;
    }

    try {
        const uint64_t version = reload_handler_();
        res.set_content(std::format(R"({{"success":true,"snapshot_version":{}}})", version),
                        http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Reload via {} failed: {}", http::kReloadPath, e.what()));
        res.status = httplib::StatusCode::BadRequest_400;
        res.set_content(std::format(R"({{"success":false,"error":{}}})",
                                    json_codec::encode_string(e.what())),
                        http::kJsonContentType);
    }
}

} // namespace piiguard
