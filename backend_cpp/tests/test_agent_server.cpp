#include <gtest/gtest.h>
#include "server/AgentServer.hpp"
#include "LogManager.hpp"
#include "fakes.hpp"

using namespace data_agent;

namespace {

struct ServerFixture : public ::testing::Test {
    std::shared_ptr<fakes::FakeContainerEngine> engine = std::make_shared<fakes::FakeContainerEngine>();
    std::shared_ptr<fakes::ScriptedProvider> provider = std::make_shared<fakes::ScriptedProvider>();
    std::shared_ptr<AgentServer> server;

    void SetUp() override {
        engine->image_present = true;
        auto registry = std::make_shared<UnitRegistry>(engine);
        auto runtime = std::make_shared<SandboxRuntime>(engine, registry, SandboxSettings{});
        OrchestratorSettings settings;
        settings.request_timeout = std::chrono::milliseconds(300);
        auto orchestrator = std::make_shared<RequestOrchestrator>(provider, runtime, settings);
        server = std::make_shared<AgentServer>(orchestrator, "127.0.0.1", 0);
    }
};

}

TEST(AgentServerUpload, PicksQuestionFileCaseInsensitively) {
    auto in = AgentServer::collect_upload({
        {"files", "data.csv", "a,b"},
        {"files", "My_Questions.TXT", "what?"},
        {"files", "other_questions.txt", "second"},
        {"files", "", "no name"}
    });
    ASSERT_TRUE(in.question.has_value());
    EXPECT_EQ(*in.question, "what?");
    ASSERT_EQ(in.attachments.size(), 2u);
    EXPECT_EQ(in.attachments[0].filename, "data.csv");
    EXPECT_EQ(in.attachments[1].filename, "other_questions.txt");
}

TEST(AgentServerUpload, NoQuestionFile) {
    auto in = AgentServer::collect_upload({{"files", "questions.csv", "x"}});
    EXPECT_FALSE(in.question.has_value());
    EXPECT_EQ(in.attachments.size(), 1u);
}

TEST_F(ServerFixture, MissingQuestionIs400) {
    auto reply = server->answer(AgentServer::collect_upload({{"files", "data.csv", "x"}}));
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(nlohmann::json::parse(reply.body)["error"], "questions.txt is required");
}

TEST_F(ServerFixture, JsonAnswerIs200Json) {
    provider->push(R"({"python_blocks": []})");
    provider->push(R"([1, 2])");
    auto reply = server->answer(AgentServer::collect_upload({{"files", "questions.txt", "q"}}));
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type, "application/json");
    EXPECT_EQ(nlohmann::json::parse(reply.body), nlohmann::json::array({1, 2}));
}

TEST_F(ServerFixture, TextAnswerIsPlainText) {
    provider->push(R"({"python_blocks": []})");
    provider->push("forty two");
    auto reply = server->answer(AgentServer::collect_upload({{"files", "questions.txt", "q"}}));
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.content_type.rfind("text/plain", 0), 0u);
    EXPECT_EQ(reply.body, "forty two");
}

TEST_F(ServerFixture, DeadlineIs504) {
    engine->hang_exec = true;
    provider->push(R"({"python_blocks": [{"code": "loop"}]})");
    auto reply = server->answer(AgentServer::collect_upload({{"files", "questions.txt", "q"}}));
    EXPECT_EQ(reply.status, 504);
    EXPECT_EQ(nlohmann::json::parse(reply.body)["error"], "Timed out");
    EXPECT_EQ(engine->live_units(), 0u);
}

TEST_F(ServerFixture, OtherFailuresAre500WithMessage) {
    auto reply = server->answer(AgentServer::collect_upload({{"files", "questions.txt", "q"}}));
    EXPECT_EQ(reply.status, 500);
    EXPECT_NE(nlohmann::json::parse(reply.body)["error"].get<std::string>().find("no scripted reply"),
              std::string::npos);
}

TEST_F(ServerFixture, OutcomesAreLogged) {
    LogManager::instance().clear();
    server->answer(AgentServer::collect_upload({}));
    auto logs = LogManager::instance().get_logs_json();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0]["status"], 400);
    EXPECT_EQ(logs[0]["outcome"], "validation");
    EXPECT_FALSE(logs[0]["request_id"].get<std::string>().empty());
}
