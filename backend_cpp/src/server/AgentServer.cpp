#include "server/AgentServer.hpp"
#include "errors/AgentErrors.hpp"
#include "LogManager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <spdlog/spdlog.h>

namespace data_agent {

namespace {

bool is_question_file(const std::string& filename) {
    static const std::string suffix = "questions.txt";
    if (filename.size() < suffix.size()) return false;
    std::string tail = filename.substr(filename.size() - suffix.size());
    std::transform(tail.begin(), tail.end(), tail.begin(), [](unsigned char c) { return std::tolower(c); });
    return tail == suffix;
}

HttpReply error_reply(int status, const std::string& message) {
    HttpReply reply;
    reply.status = status;
    reply.body = json{{"error", message}}.dump(-1, ' ', false, json::error_handler_t::replace);
    return reply;
}

std::string preview(const std::optional<std::string>& question) {
    if (!question) return "";
    std::string p = question->substr(0, 80);
    std::replace(p.begin(), p.end(), '\n', ' ');
    return p;
}

}

AgentServer::AgentServer(std::shared_ptr<RequestOrchestrator> orchestrator, std::string host, int port)
    : orchestrator_(std::move(orchestrator)), host_(std::move(host)), port_(port) {
    setup_routes();
}

void AgentServer::run() {
    spdlog::info("🚀 Data agent listening on {}:{}", host_, port_);
    if (!server_.listen(host_, port_)) {
        throw std::runtime_error("Cannot listen on " + host_ + ":" + std::to_string(port_));
    }
}

void AgentServer::stop() {
    server_.stop();
}

RequestInput AgentServer::collect_upload(const std::vector<UploadedFile>& files) {
    RequestInput input;
    for (const auto& f : files) {
        if (f.filename.empty()) continue;
        if (!input.question && is_question_file(f.filename)) {
            input.question = f.content;
            continue;
        }
        input.attachments.push_back({f.filename, f.content});
    }
    return input;
}

HttpReply AgentServer::answer(RequestInput input) {
    auto start = std::chrono::steady_clock::now();
    if (input.request_id.empty()) input.request_id = RequestOrchestrator::make_request_id();
    RequestLog log;
    log.request_id = input.request_id;
    log.question_preview = preview(input.question);

    HttpReply reply;
    try {
        AgentAnswer result = orchestrator_->handle(std::move(input));
        reply.body = result.body();
        reply.content_type = result.is_json() ? "application/json" : "text/plain; charset=utf-8";
        log.outcome = result.is_json() ? "json" : "text";
    } catch (const ValidationError& e) {
        spdlog::warn("⚠️ Rejected request: {}", e.what());
        reply = error_reply(400, e.what());
        log.outcome = "validation";
    } catch (const TimeoutError& e) {
        spdlog::warn("⏰ Request timed out: {}", e.what());
        reply = error_reply(504, "Timed out");
        log.outcome = "timeout";
    } catch (const std::exception& e) {
        spdlog::error("❌ Request failed: {}", e.what());
        reply = error_reply(500, e.what());
        log.outcome = "error";
    }

    log.http_status = reply.status;
    log.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    LogManager::instance().add_log(std::move(log));
    return reply;
}

void AgentServer::setup_routes() {
    // --- CORS HEADERS ---
    server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });
    server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(kUsageHint, "text/plain; charset=utf-8");
    });

    server_.Post("/api/", [this](const httplib::Request& req, httplib::Response& res) {
        std::vector<UploadedFile> uploads;
        for (const auto& [field, file] : req.files) {
            uploads.push_back({field, file.filename, file.content});
        }
        spdlog::info("📨 POST /api/ with {} upload(s)", uploads.size());

        HttpReply reply = answer(collect_upload(uploads));
        res.status = reply.status;
        res.set_content(reply.body, reply.content_type);
    });

    server_.Get("/api/admin/traces", [](const httplib::Request&, httplib::Response& res) {
        json payload;
        payload["logs"] = LogManager::instance().get_logs_json();
        payload["agent_traces"] = LogManager::instance().get_traces_json();
        res.set_content(payload.dump(), "application/json");
    });
}

}
