#include "planq/agent/command_agent.hpp"
#include "planq/util/json.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using namespace planq;
using namespace planq::test;
using namespace std::chrono_literals;

namespace {

auto script_agent(std::string script,
                  std::chrono::seconds timeout = std::chrono::seconds(10))
    -> CommandAgent {
  return CommandAgent(AgentConfig{.command = "sh",
                                  .args = {"-c", std::move(script)},
                                  .timeout = timeout});
}

auto request(std::string cwd = "/tmp") -> AgentRequest {
  auto task = make_task("p", "a", 0);
  task.acceptance_criteria = {"tests pass"};
  return AgentRequest{.plan_id = PlanId{"p"},
                      .plan_summary = "Test plan",
                      .task = std::move(task),
                      .context = "\nRetry attempt: #1\n",
                      .cwd = std::move(cwd),
                      .branch = "planq/p/a-1",
                      .retry_count = 1};
}

} // namespace

TEST(CommandAgentTest, ReportsNoticesAndResult) {
  auto agent = script_agent(R"(cat > /dev/null
echo '{"kind":"session","session_id":"s-1"}'
echo '{"kind":"todo","todos":[{"content":"c","status":"pending","activeForm":"C"}]}'
echo 'plain output'
echo '{"kind":"result","result":"done","stop_reason":"end_turn","cost_usd":0.5,"duration_ms":42}'
)");

  std::vector<std::string> sessions;
  std::vector<std::string> logs;
  std::size_t todo_count = 0;
  bool got_handle = false;
  AgentCallbacks cb;
  cb.on_session = [&](std::string id) { sessions.push_back(std::move(id)); };
  cb.on_log = [&](std::string_view line) { logs.emplace_back(line); };
  cb.on_todo = [&](std::vector<TodoItem> todos) { todo_count = todos.size(); };
  cb.on_interruptible = [&](std::shared_ptr<IInterruptible> h) {
    got_handle = h != nullptr;
  };

  auto result = run_coro(agent.run_task(request(), std::move(cb)));
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->session_id, "s-1");
  EXPECT_EQ(result->result_text, "done");
  EXPECT_EQ(result->stop_reason, "end_turn");
  EXPECT_EQ(result->cost_usd, 0.5);
  EXPECT_EQ(result->duration_ms, 42);
  EXPECT_EQ(sessions, std::vector<std::string>{"s-1"});
  EXPECT_EQ(logs, std::vector<std::string>{"plain output"});
  EXPECT_EQ(todo_count, 1U);
  EXPECT_TRUE(got_handle);
}

TEST(CommandAgentTest, WritesRequestToStdin) {
  const auto dir = make_temp_dir();
  ASSERT_FALSE(dir.empty());
  auto agent = script_agent("cat > request.json");

  auto result = run_coro(agent.run_task(request(dir), {}));
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->stop_reason, "exit");

  std::ifstream in(std::filesystem::path(dir) / "request.json");
  std::stringstream text;
  text << in.rdbuf();
  auto doc = parse_json(text.str());
  ASSERT_TRUE(doc.has_value());
  const auto &obj = doc->get_object();
  EXPECT_EQ(obj.at("plan_id").get_string(), "p");
  EXPECT_EQ(obj.at("branch").get_string(), "planq/p/a-1");
  EXPECT_EQ(obj.at("context").get_string(), "\nRetry attempt: #1\n");
  EXPECT_EQ(obj.at("task").get_object().at("id").get_string(), "a");
  EXPECT_EQ(obj.at("task").get_object().at("acceptance_criteria").get_array().size(),
            1U);
  std::filesystem::remove_all(dir);
}

TEST(CommandAgentTest, NonZeroExitCarriesStderr) {
  auto agent = script_agent("cat > /dev/null; echo 'compile failed' >&2; exit 2");
  auto result = run_coro(agent.run_task(request(), {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::AgentFailed));
  EXPECT_NE(result.error().reason.find("Agent exited with code 2"),
            std::string::npos);
  EXPECT_NE(result.error().reason.find("compile failed"), std::string::npos);
}

TEST(CommandAgentTest, ErrorResultFailsTheCall) {
  auto agent = script_agent(
      R"(cat > /dev/null; echo '{"kind":"result","is_error":true,"error":"rate limited"}')");
  auto result = run_coro(agent.run_task(request(), {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().reason, "rate limited");
}

TEST(CommandAgentTest, DisallowedGitCommandStopsAgent) {
  auto agent = script_agent(R"(cat > /dev/null
echo '{"kind":"tool_use","tool":"Bash","command":"git push origin main"}'
sleep 5
)");
  const auto before = std::chrono::steady_clock::now();
  auto result = run_coro(agent.run_task(request(), {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::PolicyViolation));
  EXPECT_NE(result.error().reason.find("git push origin main"),
            std::string::npos);
  EXPECT_LT(std::chrono::steady_clock::now() - before, 4s);
}

TEST(CommandAgentTest, TimeoutIsReported) {
  auto agent = script_agent("cat > /dev/null; sleep 5", std::chrono::seconds(1));
  auto result = run_coro(agent.run_task(request(), {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::Timeout));
  EXPECT_EQ(result.error().reason, "Agent timed out after 1s.");
}

TEST(CommandAgentTest, MissingCommand) {
  CommandAgent agent(AgentConfig{.command = "/nonexistent/planq-agent"});
  auto result = run_coro(agent.run_task(request(), {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::ProcessSpawnFailed));
  EXPECT_EQ(result.error().reason,
            "Failed to start agent command '/nonexistent/planq-agent'.");
}

TEST(CommandAgentTest, InterruptSendsSigint) {
  auto agent = script_agent(R"(trap 'echo interrupted; exit 130' INT
cat > /dev/null
while true; do sleep 0.05; done
)");
  boost::asio::io_context io;
  std::shared_ptr<IInterruptible> handle;
  std::optional<Outcome<AgentResult>> outcome;
  AgentCallbacks cb;
  cb.on_interruptible = [&](std::shared_ptr<IInterruptible> h) {
    handle = std::move(h);
  };
  co_spawn(
      io,
      [&]() -> task<void> {
        outcome = co_await agent.run_task(request(), std::move(cb));
      },
      detached);

  ASSERT_TRUE(pump_until(io, [&] { return handle != nullptr; }));
  // Give the shell time to install its trap.
  (void)pump_until(io, [] { return false; }, 200ms);
  auto interrupted = run_on(io, handle->interrupt());
  EXPECT_TRUE(interrupted.has_value());

  ASSERT_TRUE(pump_until(io, [&] { return outcome.has_value(); }));
  ASSERT_FALSE(outcome->has_value());
  EXPECT_NE((*outcome).error().reason.find("Agent exited with code 130"),
            std::string::npos);
}
