#pragma once
#include <memory>
#include <string>
#include <vector>
#include <httplib.h>

#include "agent/RequestOrchestrator.hpp"

namespace data_agent {

struct UploadedFile {
    std::string field;
    std::string filename;
    std::string content;
};

struct HttpReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

// REST front end: GET / usage hint, POST /api/ multipart questions + files,
// GET /api/admin/traces for the recent state transitions.
class AgentServer {
public:
    static constexpr const char* kUsageHint =
        "POST multipart: questions.txt (required) + optional files; returns the answer in the requested format.";

    AgentServer(std::shared_ptr<RequestOrchestrator> orchestrator, std::string host, int port);

    void run();    // blocks until stop()
    void stop();

    // First upload whose filename ends in questions.txt (any case) is the
    // question; every other named upload is an attachment.
    static RequestInput collect_upload(const std::vector<UploadedFile>& files);

    // Runs the orchestrator and maps the outcome onto an HTTP reply.
    HttpReply answer(RequestInput input);

private:
    void setup_routes();

    std::shared_ptr<RequestOrchestrator> orchestrator_;
    std::string host_;
    int port_;
    httplib::Server server_;
};

}
