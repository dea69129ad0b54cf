#include "planq/agent/agent_notice.hpp"

#include <gtest/gtest.h>

#include <variant>

using namespace planq;

TEST(AgentNoticeTest, PlainLinesAreNotNotices) {
  EXPECT_FALSE(parse_agent_notice("").has_value());
  EXPECT_FALSE(parse_agent_notice("Compiling src/main.cpp").has_value());
  EXPECT_FALSE(parse_agent_notice("{not json").has_value());
  EXPECT_FALSE(parse_agent_notice(R"({"message":"no kind"})").has_value());
  EXPECT_FALSE(parse_agent_notice(R"({"kind":"telemetry"})").has_value());
}

TEST(AgentNoticeTest, Session) {
  auto n = parse_agent_notice(R"({"kind":"session","session_id":"s-42"})");
  ASSERT_TRUE(n.has_value());
  ASSERT_TRUE(std::holds_alternative<SessionNotice>(*n));
  EXPECT_EQ(std::get<SessionNotice>(*n).session_id, "s-42");

  EXPECT_FALSE(
      parse_agent_notice(R"({"kind":"session","session_id":""})").has_value());
}

TEST(AgentNoticeTest, TodoList) {
  auto n = parse_agent_notice(
      R"({"kind":"todo","todos":[)"
      R"({"content":"write tests","status":"completed","activeForm":"Writing tests"},)"
      R"({"content":"fix bug","status":"in_progress","activeForm":"Fixing bug"}]})");
  ASSERT_TRUE(n.has_value());
  const auto &todos = std::get<TodoNotice>(*n).todos;
  ASSERT_EQ(todos.size(), 2U);
  EXPECT_EQ(todos[0].content, "write tests");
  EXPECT_EQ(todos[0].status, TodoStatus::Completed);
  EXPECT_EQ(todos[0].active_form, "Writing tests");
  EXPECT_EQ(todos[1].status, TodoStatus::InProgress);
}

TEST(AgentNoticeTest, ToolUse) {
  auto n = parse_agent_notice(
      R"({"kind":"tool_use","tool":"Bash","command":"git push origin main"})");
  ASSERT_TRUE(n.has_value());
  const auto &tool = std::get<ToolUseNotice>(*n);
  EXPECT_EQ(tool.tool, "Bash");
  EXPECT_EQ(tool.command, "git push origin main");
}

TEST(AgentNoticeTest, SubagentKeepsPayload) {
  auto n = parse_agent_notice(
      R"({"kind":"subagent","data":{"agent":"reviewer","turns":3}})");
  ASSERT_TRUE(n.has_value());
  const auto &data = std::get<SubagentNotice>(*n).data;
  ASSERT_TRUE(data.is_object());
  EXPECT_TRUE(data.get_object().contains("agent"));
}

TEST(AgentNoticeTest, Result) {
  auto n = parse_agent_notice(
      R"({"kind":"result","result":"All done","stop_reason":"end_turn",)"
      R"("cost_usd":0.25,"duration_ms":4200})");
  ASSERT_TRUE(n.has_value());
  const auto &r = std::get<ResultNotice>(*n);
  EXPECT_EQ(r.result, "All done");
  EXPECT_EQ(r.stop_reason, "end_turn");
  EXPECT_EQ(r.cost_usd, 0.25);
  EXPECT_EQ(r.duration_ms, 4200);
  EXPECT_FALSE(r.is_error);

  auto err = parse_agent_notice(
      R"({"kind":"result","is_error":true,"error":"rate limited"})");
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(std::get<ResultNotice>(*err).is_error);
  EXPECT_EQ(std::get<ResultNotice>(*err).error, "rate limited");
}
