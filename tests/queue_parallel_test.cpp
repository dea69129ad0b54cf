#include "planq/git/git.hpp"
#include "planq/orchestrator/orchestrator.hpp"
#include "planq/orchestrator/queue_workspace.hpp"
#include "planq/store/memory_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

using namespace planq;
using namespace planq::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

// Worktree directories are named <task>-<suffix> under the scratch root.
auto has_worktree(const fs::path &scratch, std::string_view task_id) -> bool {
  const auto prefix = std::string(task_id) + "-";
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(scratch, ec)) {
    if (entry.is_directory() &&
        entry.path().filename().string().starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

auto commit_text_impl(AgentRequest &req, AgentCallbacks &cb,
                      ScriptedAgent &self, std::string file, std::string text,
                      std::string message) -> task<Outcome<AgentResult>> {
  write_file(fs::path(req.cwd) / file, text);
  git::Repo repo(req.cwd);
  if (auto r = co_await repo.commit_all(message); !r) {
    co_return fail_with(std::move(r.error()));
  }
  co_return co_await ScriptedAgent::succeed()(req, cb, self);
}

// Writes `text` into `file` and commits it.
auto commit_text(std::string file, std::string text, std::string message)
    -> ScriptedAgent::Behavior {
  return [file, text, message](AgentRequest &req, AgentCallbacks &cb,
                               ScriptedAgent &self) {
    return commit_text_impl(req, cb, self, file, text, message);
  };
}

auto commit_after_impl(AgentRequest &req, AgentCallbacks &cb,
                       ScriptedAgent &self, fs::path awaited, bool *seen,
                       std::string file, std::string message)
    -> task<Outcome<AgentResult>> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  for (int i = 0; i < 500 && !fs::exists(awaited); ++i) {
    timer.expires_after(std::chrono::milliseconds(20));
    (void)co_await timer.async_wait(use_nothrow);
  }
  *seen = fs::exists(awaited);
  co_return co_await ScriptedAgent::commit(file, message)(req, cb, self);
}

// Waits until `awaited` exists (or ten seconds pass), then commits `file`.
auto commit_after(fs::path awaited, bool *seen, std::string file,
                  std::string message) -> ScriptedAgent::Behavior {
  return [awaited, seen, file, message](AgentRequest &req, AgentCallbacks &cb,
                                        ScriptedAgent &self) {
    return commit_after_impl(req, cb, self, awaited, seen, file, message);
  };
}

} // namespace

class QueueParallelTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!git_available()) {
      GTEST_SKIP() << "git not available";
    }
    root_ = make_temp_dir("planq_queue_");
    ASSERT_FALSE(root_.empty());
    repo_ = (fs::path(root_) / "repo").string();
    fs::create_directories(repo_);
    ASSERT_TRUE(init_git_repo(repo_));

    QueueConfig queue;
    queue.parallel = true;
    queue.cancel_timeout = 500ms;
    queue.worktree_root = (fs::path(root_) / "worktrees").string();
    ASSERT_TRUE(run_on(io_, store_.open()).has_value());
    orch_ = std::make_unique<Orchestrator>(io_.get_executor(), store_, agent_,
                                           queue, PolicyConfig{});
    orch_->set_milestone_sink(
        [this](const Milestone &m) { milestones_.push_back(m); });
  }

  void TearDown() override {
    orch_.reset();
    if (!root_.empty()) {
      std::error_code ec;
      fs::remove_all(root_, ec);
    }
  }

  auto save(std::vector<Task> tasks) -> void {
    ASSERT_TRUE(
        run_on(io_, store_.save_plan(make_plan("p", repo_, std::move(tasks))))
            .has_value());
  }

  auto start_queue() -> void {
    auto started = run_on(io_, orch_->run_all(plan_id_));
    ASSERT_TRUE(started.has_value()) << started.error().message();
    ASSERT_FALSE(started->reason.has_value()) << *started->reason;
  }

  auto run_queue() -> void {
    start_queue();
    run_on(io_, orch_->wait_for_queue(plan_id_), 60s);
  }

  auto count_events(const RunId &id, EventType type) -> std::size_t {
    auto page = run_on(io_, store_.list_events(id, 1000, std::nullopt));
    EXPECT_TRUE(page.has_value());
    return std::ranges::count(page->events, type, &RunEvent::type);
  }

  auto head_of(const std::string &ref) -> std::string {
    auto head = run_on(io_, git::Repo(repo_).rev_parse(ref));
    EXPECT_TRUE(head.has_value());
    return head ? *head : std::string{};
  }

  auto plan() -> Plan {
    auto p = run_on(io_, store_.get_plan(plan_id_));
    EXPECT_TRUE(p.has_value());
    return p ? *p : Plan{};
  }

  auto runs_of(std::string_view task_id) -> std::vector<Run> {
    auto runs = run_on(io_, store_.list_runs(plan_id_));
    EXPECT_TRUE(runs.has_value());
    std::vector<Run> out;
    for (const auto &r : *runs) {
      if (r.task_id == task_id) {
        out.push_back(r);
      }
    }
    return out;
  }

  auto status_of(std::string_view task_id) -> TaskStatus {
    auto p = plan();
    const auto *t = p.find_task(TaskId{std::string(task_id)});
    return t ? t->status : TaskStatus::Pending;
  }

  std::string root_;
  std::string repo_;
  boost::asio::io_context io_;
  InMemoryStore store_;
  ScriptedAgent agent_;
  std::unique_ptr<Orchestrator> orch_;
  std::vector<Milestone> milestones_;
  const PlanId plan_id_{"p"};
};

TEST_F(QueueParallelTest, PhasesRunInWorktreesAndMergeIntoMain) {
  save({make_task("p", "a", 0), make_task("p", "b", 1, {"a"}),
        make_task("p", "c", 2, {"a"})});
  agent_.on_task("a", ScriptedAgent::commit("a.txt", "feat: add a"));

  // b and c share a phase: each checks its sibling's worktree already exists.
  int siblings_seen = 0;
  auto sibling_aware = [&siblings_seen](std::string file, std::string sibling,
                                        std::string message) {
    return [&siblings_seen, file, sibling,
            message](AgentRequest &req, AgentCallbacks &cb,
                     ScriptedAgent &self) {
      if (has_worktree(fs::path(req.cwd).parent_path(), sibling)) {
        ++siblings_seen;
      }
      return ScriptedAgent::commit(file, message)(req, cb, self);
    };
  };
  agent_.on_task("b", sibling_aware("b.txt", "c", "feat(b): add b"));
  agent_.on_task("c", sibling_aware("c.txt", "b", "test: add c"));

  run_queue();

  EXPECT_EQ(plan().status, PlanStatus::Completed);
  EXPECT_EQ(siblings_seen, 2);
  for (const auto *f : {"a.txt", "b.txt", "c.txt"}) {
    EXPECT_TRUE(fs::exists(fs::path(repo_) / f)) << f;
  }
  EXPECT_TRUE(sh(repo_, "test \"$(git rev-parse --abbrev-ref HEAD)\" = main"));
  EXPECT_TRUE(sh(repo_, "test -z \"$(git branch --list 'planq/*')\""));
  EXPECT_TRUE(sh(repo_, "git log --oneline main | grep -q 'merge task b'"));

  ASSERT_EQ(agent_.requests.size(), 3U);
  const auto &b_req = *std::ranges::find_if(
      agent_.requests, [](const AgentRequest &r) { return r.task.id == "b"; });
  EXPECT_TRUE(b_req.branch.starts_with("planq/p/b-"));
  EXPECT_NE(b_req.context.find("phase=2"), std::string::npos);
  EXPECT_NE(b_req.cwd, repo_);

  const auto merged = std::ranges::count(milestones_, MilestoneKind::TaskMerged,
                                         &Milestone::kind);
  EXPECT_EQ(merged, 3);
}

TEST_F(QueueParallelTest, FailureCancelsSiblingAndLeavesMainUntouched) {
  save({make_task("p", "a", 0), make_task("p", "b", 1),
        make_task("p", "c", 2, {"a", "b"})});
  agent_.on_task("a", ScriptedAgent::failing("compile error"));
  agent_.on_task("b", ScriptedAgent::hang());
  const auto before = head_of("main");

  run_queue();

  EXPECT_EQ(plan().status, PlanStatus::Failed);
  EXPECT_EQ(status_of("a"), TaskStatus::Failed);
  EXPECT_EQ(status_of("b"), TaskStatus::Pending);
  EXPECT_EQ(status_of("c"), TaskStatus::Pending);
  ASSERT_EQ(runs_of("b").size(), 1U);
  EXPECT_EQ(runs_of("b").front().status, RunStatus::Cancelled);
  EXPECT_EQ(agent_.calls_for("c"), 0);
  EXPECT_EQ(head_of("main"), before);
  EXPECT_TRUE(std::ranges::any_of(milestones_, [](const Milestone &m) {
    return m.kind == MilestoneKind::PhaseFailed;
  }));
}

TEST_F(QueueParallelTest, NonConventionalCommitIsRejected) {
  save({make_task("p", "a", 0)});
  agent_.on_task("a", ScriptedAgent::commit("a.txt", "Added a file"));
  const auto before = head_of("main");

  run_queue();

  auto runs = runs_of("a");
  ASSERT_EQ(runs.size(), 1U);
  EXPECT_EQ(runs[0].status, RunStatus::Failed);
  ASSERT_TRUE(runs[0].error_text.has_value());
  EXPECT_NE(runs[0].error_text->find("is not Conventional Commit compliant"),
            std::string::npos);
  EXPECT_EQ(plan().status, PlanStatus::Failed);
  EXPECT_EQ(head_of("main"), before);
  // The rejected branch is kept for inspection.
  EXPECT_FALSE(sh(repo_, "test -z \"$(git branch --list 'planq/*')\""));
}

TEST_F(QueueParallelTest, ForbiddenTrailerIsRejected) {
  save({make_task("p", "a", 0)});
  agent_.on_task(
      "a", ScriptedAgent::commit(
               "a.txt",
               "feat: add a\n\nCo-Authored-By: Claude <noreply@anthropic.com>"));

  run_queue();

  auto runs = runs_of("a");
  ASSERT_EQ(runs.size(), 1U);
  EXPECT_EQ(runs[0].status, RunStatus::Failed);
  EXPECT_NE(runs[0].error_text.value_or("").find("forbidden co-author trailer"),
            std::string::npos);
}

TEST_F(QueueParallelTest, TaskWithoutCommitsFails) {
  save({make_task("p", "a", 0)});

  run_queue();

  auto runs = runs_of("a");
  ASSERT_EQ(runs.size(), 1U);
  EXPECT_EQ(runs[0].status, RunStatus::Failed);
  EXPECT_NE(runs[0].error_text.value_or("").find("No commits found in task a"),
            std::string::npos);
}

TEST_F(QueueParallelTest, DirtyTreeIsSnapshottedBeforeQueue) {
  save({make_task("p", "a", 0)});
  agent_.on_task("a", ScriptedAgent::commit("a.txt", "feat: add a"));
  write_file(fs::path(repo_) / "notes.md", "uncommitted\n");

  run_queue();

  EXPECT_EQ(plan().status, PlanStatus::Completed);
  EXPECT_TRUE(sh(repo_, std::string("git log --format=%s main | grep -qF '") +
                            std::string(kSnapshotCommitMessage) + "'"));
  EXPECT_TRUE(sh(repo_, "git diff --quiet HEAD"));
}

TEST_F(QueueParallelTest, ThreeTaskPhaseCreatesEveryWorktreeFirst) {
  save({make_task("p", "a", 0), make_task("p", "b", 1),
        make_task("p", "c", 2)});
  int siblings_seen = 0;
  for (const auto *id : {"a", "b", "c"}) {
    agent_.on_task(id, [&siblings_seen, id = std::string(id)](
                           AgentRequest &req, AgentCallbacks &cb,
                           ScriptedAgent &self) {
      const auto scratch = fs::path(req.cwd).parent_path();
      for (const auto *other : {"a", "b", "c"}) {
        if (other != id && has_worktree(scratch, other)) {
          ++siblings_seen;
        }
      }
      return ScriptedAgent::commit(id + ".txt", "feat: add " + id)(req, cb,
                                                                   self);
    });
  }

  run_queue();

  EXPECT_EQ(siblings_seen, 6);
  EXPECT_EQ(plan().status, PlanStatus::Completed);
  for (const auto *f : {"a.txt", "b.txt", "c.txt"}) {
    EXPECT_TRUE(fs::exists(fs::path(repo_) / f)) << f;
  }
}

TEST_F(QueueParallelTest, FinishedTaskMergesWhileSiblingStillRuns) {
  save({make_task("p", "a", 0), make_task("p", "b", 1)});
  agent_.on_task("a", ScriptedAgent::commit("a.txt", "feat: add a"));
  // b only finishes once a's change is visible in the main checkout.
  bool b_saw_merge = false;
  agent_.on_task("b", commit_after(fs::path(repo_) / "a.txt", &b_saw_merge,
                                   "b.txt", "feat: add b"));

  run_queue();

  EXPECT_TRUE(b_saw_merge);
  EXPECT_EQ(plan().status, PlanStatus::Completed);
  EXPECT_TRUE(sh(repo_, "git log --format=%s -1 main | grep -q "
                        "'merge task b'"));
}

TEST_F(QueueParallelTest, AbortDuringPhaseCancelsEveryRun) {
  save({make_task("p", "a", 0), make_task("p", "b", 1),
        make_task("p", "c", 2, {"a", "b"})});
  agent_.on_task("a", ScriptedAgent::hang());
  agent_.on_task("b", ScriptedAgent::hang());
  const auto before = head_of("main");

  start_queue();
  ASSERT_TRUE(pump_until(io_, [&] { return agent_.handles.size() == 2; }));
  run_on(io_, orch_->abort_queue(plan_id_));
  run_on(io_, orch_->wait_for_queue(plan_id_), 30s);

  for (const auto *id : {"a", "b"}) {
    auto runs = runs_of(id);
    ASSERT_EQ(runs.size(), 1U) << id;
    EXPECT_EQ(runs[0].status, RunStatus::Cancelled) << id;
    EXPECT_EQ(status_of(id), TaskStatus::Pending) << id;
  }
  EXPECT_EQ(agent_.handles[0]->interrupts, 1);
  EXPECT_EQ(agent_.handles[1]->interrupts, 1);
  EXPECT_EQ(agent_.calls_for("c"), 0);
  EXPECT_EQ(plan().status, PlanStatus::Ready);
  EXPECT_FALSE(orch_->is_queue_running(plan_id_));
  EXPECT_EQ(head_of("main"), before);
  EXPECT_TRUE(sh(repo_, "test \"$(git rev-parse --abbrev-ref HEAD)\" = main"));
  EXPECT_TRUE(sh(repo_, "test $(git worktree list | wc -l) -eq 1"));
}

TEST_F(QueueParallelTest, MergeConflictKeepsMainCleanAndFailsPhase) {
  save({make_task("p", "a", 0), make_task("p", "b", 1),
        make_task("p", "c", 2, {"a", "b"})});
  agent_.on_task("a", commit_text("shared.txt", "from a\n", "feat: a"));
  agent_.on_task("b", commit_text("shared.txt", "from b\n", "feat: b"));

  run_queue();

  const auto a = runs_of("a");
  const auto b = runs_of("b");
  ASSERT_EQ(a.size(), 1U);
  ASSERT_EQ(b.size(), 1U);
  // Whichever finished first merged; the other hit the conflict.
  const bool a_won = a[0].status == RunStatus::Completed;
  const auto &winner = a_won ? a[0] : b[0];
  const auto &loser = a_won ? b[0] : a[0];
  EXPECT_EQ(winner.status, RunStatus::Completed);
  EXPECT_EQ(loser.status, RunStatus::Failed);
  EXPECT_NE(loser.error_text.value_or("").find("Merge conflict"),
            std::string::npos);

  EXPECT_EQ(plan().status, PlanStatus::Failed);
  EXPECT_EQ(agent_.calls_for("c"), 0);
  EXPECT_TRUE(sh(repo_, "git diff --quiet HEAD"));
  EXPECT_TRUE(sh(repo_, "test -z \"$(git status --porcelain)\""));
  EXPECT_TRUE(sh(repo_, "test ! -e \"$(git rev-parse --git-dir)/MERGE_HEAD\""));
  EXPECT_TRUE(sh(repo_, std::string("grep -q 'from ") + (a_won ? "a" : "b") +
                            "' shared.txt"));
  // The conflicting branch is kept for inspection.
  EXPECT_TRUE(sh(repo_, std::string("git branch --list 'planq/p/") +
                            (a_won ? "b" : "a") + "-*' | grep -q ."));
  EXPECT_TRUE(std::ranges::any_of(milestones_, [](const Milestone &m) {
    return m.kind == MilestoneKind::PhaseFailed;
  }));
}

TEST_F(QueueParallelTest, ForceCancelDuringIntegrationIsIgnored) {
  save({make_task("p", "a", 0)});
  agent_.on_task("a", ScriptedAgent::commit("a.txt", "feat: add a"));
  // Holds the merge commit until the test releases it.
  const auto entered = fs::path(root_) / "entered";
  const auto release = fs::path(root_) / "release";
  const auto hook = fs::path(repo_) / ".git" / "hooks" / "pre-merge-commit";
  fs::create_directories(hook.parent_path());
  write_file(hook, "#!/bin/sh\ntouch '" + entered.string() +
                       "'\nwhile [ ! -f '" + release.string() +
                       "' ]; do sleep 0.05; done\n");
  ASSERT_TRUE(sh(repo_, "chmod +x .git/hooks/pre-merge-commit"));

  start_queue();
  ASSERT_TRUE(pump_until(io_, [&] { return fs::exists(entered); }, 20s));
  auto runs = runs_of("a");
  ASSERT_EQ(runs.size(), 1U);
  const auto id = runs[0].id;

  run_on(io_, orch_->force_cancel_run(id));
  EXPECT_EQ(run_on(io_, store_.get_run(id))->status, RunStatus::InProgress);

  write_file(release, "");
  run_on(io_, orch_->wait_for_queue(plan_id_), 30s);

  EXPECT_EQ(run_on(io_, store_.get_run(id))->status, RunStatus::Completed);
  EXPECT_EQ(count_events(id, EventType::Cancelled), 0U);
  EXPECT_EQ(count_events(id, EventType::Completed), 1U);
  EXPECT_EQ(status_of("a"), TaskStatus::Completed);
  EXPECT_TRUE(fs::exists(fs::path(repo_) / "a.txt"));
}

TEST_F(QueueParallelTest, TaskIdsWithSameSafeFormGetOwnWorktrees) {
  save({make_task("p", "a/b", 0), make_task("p", "a-b", 1)});
  agent_.on_task("a/b", ScriptedAgent::commit("slash.txt", "feat: slash"));
  agent_.on_task("a-b", ScriptedAgent::commit("dash.txt", "feat: dash"));

  run_queue();

  EXPECT_EQ(plan().status, PlanStatus::Completed);
  ASSERT_EQ(agent_.requests.size(), 2U);
  EXPECT_NE(agent_.requests[0].cwd, agent_.requests[1].cwd);
  EXPECT_TRUE(fs::exists(fs::path(repo_) / "slash.txt"));
  EXPECT_TRUE(fs::exists(fs::path(repo_) / "dash.txt"));
}

TEST_F(QueueParallelTest, DetachedHeadWithoutDefaultBranchIsRefused) {
  ASSERT_TRUE(sh(repo_, "git checkout -q --detach"));
  ASSERT_TRUE(sh(repo_, "git branch -m main trunk"));
  const auto before = head_of("HEAD");
  write_file(fs::path(repo_) / "notes.md", "uncommitted\n");

  QueueConfig cfg;
  cfg.worktree_root = (fs::path(root_) / "worktrees").string();
  auto ws = run_on(io_, QueueWorkspace::prepare(io_.get_executor(), repo_,
                                                plan_id_, cfg));
  ASSERT_FALSE(ws.has_value());
  EXPECT_EQ(ws.error().code, make_error_code(Error::InvalidState));
  EXPECT_NE(ws.error().reason.find("detached HEAD"), std::string::npos);
  EXPECT_EQ(head_of("HEAD"), before);
  // Nothing was snapshotted.
  EXPECT_FALSE(sh(repo_, "test -z \"$(git status --porcelain)\""));

  save({make_task("p", "a", 0)});
  run_queue();
  EXPECT_EQ(plan().status, PlanStatus::Failed);
  EXPECT_EQ(agent_.calls_for("a"), 0);
  EXPECT_EQ(head_of("HEAD"), before);
}
