#pragma once

#include "planq/config/system_config.hpp"
#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/git/commit_policy.hpp"
#include "planq/git/git.hpp"
#include "planq/util/id.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/system/error_code.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace planq {

inline constexpr std::string_view kSnapshotCommitMessage =
    "chore(planq): snapshot working tree before queue run";

struct QueueGitContext {
  std::string repo_root;
  /// Branch every task branch is merged into.
  std::string target_branch;
  /// Branch (or detached commit) checked out before the queue started.
  std::string original_branch;
  std::filesystem::path scratch_root;
};

struct PhaseWorktree {
  TaskId task_id;
  std::string branch;
  std::string path;
  std::string base_commit;
};

/// Git state of one parallel queue run: the main working copy checked out on
/// the merge target plus a scratch directory holding one worktree per task.
/// Merges into the main working copy are serialized.
class QueueWorkspace {
public:
  QueueWorkspace(boost::asio::any_io_executor executor, QueueGitContext ctx);

  QueueWorkspace(const QueueWorkspace &) = delete;
  auto operator=(const QueueWorkspace &) -> QueueWorkspace & = delete;

  /// Resolves the repository root from `project_path`, commits a dirty tree,
  /// checks out the merge target and creates the scratch root.
  [[nodiscard]] static auto prepare(boost::asio::any_io_executor executor,
                                    std::string project_path,
                                    const PlanId &plan_id,
                                    const QueueConfig &cfg)
      -> task<Outcome<std::shared_ptr<QueueWorkspace>>>;

  [[nodiscard]] auto context() const noexcept -> const QueueGitContext & {
    return ctx_;
  }

  /// New branch from the current merge-target head, checked out in its own
  /// worktree under the scratch root.
  [[nodiscard]] auto add_worktree(const PlanId &plan_id, const TaskId &task_id)
      -> task<Outcome<PhaseWorktree>>;

  /// HEAD must still be on the task branch and every commit over the base
  /// must pass `policy`; at least one commit is required.
  [[nodiscard]] auto validate(const PhaseWorktree &wt,
                              const git::CommitPolicy &policy) const
      -> task<Outcome<void>>;

  /// Merges the task branch into the target with --no-ff, checks that the
  /// target advanced, then removes the worktree and deletes the branch.
  [[nodiscard]] auto merge(const PhaseWorktree &wt) -> task<Outcome<void>>;

  /// Removes the worktree and keeps its branch for inspection.
  auto discard(const PhaseWorktree &wt) -> task<void>;

  /// Restores the original branch, removes the scratch root and prunes
  /// worktree metadata. Failures are logged.
  auto release() -> task<void>;

private:
  using Gate = boost::asio::experimental::channel<void(
      boost::system::error_code)>;

  QueueGitContext ctx_;
  git::Repo root_;
  Gate merge_gate_;
};

/// Replaces characters git refs and paths should not carry with '-'.
[[nodiscard]] auto ref_safe(std::string_view text) -> std::string;

} // namespace planq
