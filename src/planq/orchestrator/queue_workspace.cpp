#include "planq/orchestrator/queue_workspace.hpp"

#include "planq/core/asio_awaitable.hpp"
#include "planq/util/log.hpp"

#include <boost/algorithm/string/join.hpp>

#include <cctype>
#include <format>
#include <system_error>
#include <utility>

namespace planq {

namespace {

// Holds one slot of the merge gate until destroyed.
class GateSlot {
public:
  using Gate =
      boost::asio::experimental::channel<void(boost::system::error_code)>;

  explicit GateSlot(Gate &gate) : gate_(gate) {}
  ~GateSlot() {
    (void)gate_.try_receive([](boost::system::error_code) {});
  }

  GateSlot(const GateSlot &) = delete;
  auto operator=(const GateSlot &) -> GateSlot & = delete;

private:
  Gate &gate_;
};

[[nodiscard]] auto scratch_base(const QueueConfig &cfg)
    -> std::filesystem::path {
  if (!cfg.worktree_root.empty()) {
    return std::filesystem::path(cfg.worktree_root);
  }
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    tmp = "/tmp";
  }
  return tmp / "planq-worktrees";
}

} // namespace

auto ref_safe(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.'
                      ? c
                      : '-');
  }
  if (out.empty() || out.front() == '.' || out.front() == '-') {
    out.insert(out.begin(), 'x');
  }
  return out;
}

QueueWorkspace::QueueWorkspace(boost::asio::any_io_executor executor,
                               QueueGitContext ctx)
    : ctx_(std::move(ctx)), root_(ctx_.repo_root),
      merge_gate_(std::move(executor), 1) {}

auto QueueWorkspace::prepare(boost::asio::any_io_executor executor,
                             std::string project_path, const PlanId &plan_id,
                             const QueueConfig &cfg)
    -> task<Outcome<std::shared_ptr<QueueWorkspace>>> {
  auto toplevel = co_await git::Repo(std::move(project_path)).show_toplevel();
  if (!toplevel) {
    co_return fail_with(std::move(toplevel.error()));
  }
  git::Repo root(*toplevel);

  auto current = co_await root.current_branch();
  if (!current) {
    co_return fail_with(std::move(current.error()));
  }
  std::string original = *current;
  if (original == "HEAD") {
    auto head = co_await root.head_commit();
    if (!head) {
      co_return fail_with(std::move(head.error()));
    }
    original = *head;
  }

  std::string target = *current;
  for (const auto &candidate : cfg.default_branches) {
    auto exists = co_await root.branch_exists(candidate);
    if (!exists) {
      co_return fail_with(std::move(exists.error()));
    }
    if (*exists) {
      target = candidate;
      break;
    }
  }
  // Merges onto a detached HEAD would be lost when it is restored.
  if (target == "HEAD") {
    co_return fail_with(
        Error::InvalidState,
        std::format("Cannot run a parallel queue on a detached HEAD ({}) "
                    "without one of the branches {}.",
                    original, boost::algorithm::join(cfg.default_branches,
                                                     ", ")));
  }

  auto dirty = co_await root.is_dirty();
  if (!dirty) {
    co_return fail_with(std::move(dirty.error()));
  }
  if (*dirty) {
    log::info("auto-committing dirty working tree in {}", *toplevel);
    if (auto r = co_await root.commit_all(std::string(kSnapshotCommitMessage));
        !r) {
      co_return fail_with(std::move(r.error()));
    }
  }

  if (target != *current) {
    if (auto r = co_await root.checkout(target); !r) {
      co_return fail_with(std::move(r.error()));
    }
  }

  auto scratch = scratch_base(cfg) /
                 std::format("{}-{}", ref_safe(plan_id.value()),
                             detail::generate_short_uuid());
  std::error_code ec;
  std::filesystem::create_directories(scratch, ec);
  if (ec) {
    co_return fail_with(Error::FileOpenFailed,
                        std::format("Failed to create worktree root {}: {}",
                                    scratch.string(), ec.message()));
  }

  log::info("queue workspace ready: repo={} target={} scratch={}", *toplevel,
            target, scratch.string());
  co_return std::make_shared<QueueWorkspace>(
      std::move(executor),
      QueueGitContext{.repo_root = *toplevel,
                      .target_branch = std::move(target),
                      .original_branch = std::move(original),
                      .scratch_root = std::move(scratch)});
}

auto QueueWorkspace::add_worktree(const PlanId &plan_id, const TaskId &task_id)
    -> task<Outcome<PhaseWorktree>> {
  auto base = co_await root_.rev_parse(ctx_.target_branch);
  if (!base) {
    co_return fail_with(std::move(base.error()));
  }
  // Distinct ids can share a ref_safe form; the suffix keeps both apart.
  const auto leaf = std::format("{}-{}", ref_safe(task_id.value()),
                                detail::generate_short_uuid());
  PhaseWorktree wt{
      .task_id = task_id,
      .branch = std::format("planq/{}/{}", ref_safe(plan_id.value()), leaf),
      .path = (ctx_.scratch_root / leaf).string(),
      .base_commit = *base,
  };
  if (auto r = co_await root_.worktree_add(wt.path, wt.branch, wt.base_commit);
      !r) {
    co_return fail_with(std::move(r.error()));
  }
  log::debug("worktree for task {} at {} on {}", task_id, wt.path, wt.branch);
  co_return wt;
}

auto QueueWorkspace::validate(const PhaseWorktree &wt,
                              const git::CommitPolicy &policy) const
    -> task<Outcome<void>> {
  git::Repo repo(wt.path);
  auto head = co_await repo.current_branch();
  if (!head) {
    co_return fail_with(std::move(head.error()));
  }
  if (*head != wt.branch) {
    co_return fail_with(
        Error::PolicyViolation,
        std::format("Task {} moved HEAD of its worktree to '{}' instead of "
                    "branch {}.",
                    wt.task_id, *head, wt.branch));
  }
  co_return co_await policy.validate_range(
      repo, std::format("{}..{}", wt.base_commit, wt.branch),
      std::format("task {} ({})", wt.task_id, wt.branch));
}

auto QueueWorkspace::merge(const PhaseWorktree &wt) -> task<Outcome<void>> {
  {
    auto [ec] = co_await merge_gate_.async_send(boost::system::error_code{},
                                                use_nothrow);
    if (ec) {
      co_return fail_with(Error::Cancelled, "Merge aborted.");
    }
    GateSlot slot(merge_gate_);

    auto before = co_await root_.head_commit();
    if (!before) {
      co_return fail_with(std::move(before.error()));
    }
    if (auto r = co_await root_.merge_no_ff(
            wt.branch, std::format("chore(planq): merge task {}", wt.task_id));
        !r) {
      co_return fail_with(std::move(r.error()));
    }
    auto after = co_await root_.head_commit();
    if (!after) {
      co_return fail_with(std::move(after.error()));
    }
    if (*after == *before) {
      co_return fail_with(Error::GitCommandFailed,
                          std::format("Merging {} did not advance {}.",
                                      wt.branch, ctx_.target_branch));
    }
    log::info("merged {} into {} ({})", wt.branch, ctx_.target_branch, *after);
  }

  if (auto r = co_await root_.worktree_remove(wt.path); !r) {
    co_return fail_with(std::move(r.error()));
  }
  if (auto r = co_await root_.delete_branch(wt.branch); !r) {
    co_return fail_with(std::move(r.error()));
  }
  co_return Outcome<void>{};
}

auto QueueWorkspace::discard(const PhaseWorktree &wt) -> task<void> {
  if (auto r = co_await root_.worktree_remove(wt.path); !r) {
    log::warn("{}", r.error().message());
    std::error_code ec;
    std::filesystem::remove_all(wt.path, ec);
  }
  log::info("kept branch {} of task {}", wt.branch, wt.task_id);
}

auto QueueWorkspace::release() -> task<void> {
  if (ctx_.original_branch != ctx_.target_branch) {
    if (auto r = co_await root_.checkout(ctx_.original_branch); !r) {
      log::warn("failed to restore branch {}: {}", ctx_.original_branch,
                r.error().message());
    }
  }
  std::error_code ec;
  std::filesystem::remove_all(ctx_.scratch_root, ec);
  if (ec) {
    log::warn("failed to remove {}: {}", ctx_.scratch_root.string(),
              ec.message());
  }
  if (auto r = co_await root_.worktree_prune(); !r) {
    log::warn("{}", r.error().message());
  }
}

} // namespace planq
