#pragma once

#include "planq/agent/agent.hpp"
#include "planq/config/system_config.hpp"

namespace planq {

/// Runs the configured agent command once per task. The request is written
/// to stdin as a JSON document; stdout is read line by line as agent
/// notices. Interrupting sends SIGINT and waits for the process to exit.
/// Tool uses that mutate git beyond add/commit stop the process with a
/// policy violation.
class CommandAgent final : public IAgentService {
public:
  explicit CommandAgent(AgentConfig config);

  auto run_task(AgentRequest req, AgentCallbacks callbacks)
      -> task<Outcome<AgentResult>> override;

private:
  AgentConfig cfg_;
};

/// The JSON document written to the agent's stdin.
[[nodiscard]] auto agent_request_to_json(const AgentRequest &req)
    -> std::string;

} // namespace planq
