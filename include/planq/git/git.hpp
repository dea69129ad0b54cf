#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace planq::git {

struct CommitInfo {
  std::string hash;
  std::string subject;
  std::string body;
};

/// Thin async wrapper over the `git` executable bound to one working
/// directory. Every failure carries "git <args> failed in <cwd>: <stderr>".
class Repo {
public:
  explicit Repo(std::string cwd,
                std::chrono::milliseconds timeout = std::chrono::minutes(2));

  [[nodiscard]] auto cwd() const noexcept -> const std::string & {
    return cwd_;
  }

  /// Runs `git <args>` and returns its stdout with trailing whitespace removed.
  [[nodiscard]] auto run(std::vector<std::string> args) const
      -> task<Outcome<std::string>>;

  [[nodiscard]] auto show_toplevel() const -> task<Outcome<std::string>>;
  [[nodiscard]] auto current_branch() const -> task<Outcome<std::string>>;
  [[nodiscard]] auto head_commit() const -> task<Outcome<std::string>>;
  [[nodiscard]] auto rev_parse(std::string ref) const
      -> task<Outcome<std::string>>;
  [[nodiscard]] auto is_dirty() const -> task<Outcome<bool>>;
  [[nodiscard]] auto branch_exists(std::string name) const
      -> task<Outcome<bool>>;

  /// Stages everything (`add -A`) and commits with `message`.
  [[nodiscard]] auto commit_all(std::string message) const
      -> task<Outcome<void>>;
  [[nodiscard]] auto checkout(std::string branch) const -> task<Outcome<void>>;
  [[nodiscard]] auto delete_branch(std::string name) const
      -> task<Outcome<void>>;

  [[nodiscard]] auto worktree_add(std::string path, std::string branch,
                                  std::string base) const
      -> task<Outcome<void>>;
  [[nodiscard]] auto worktree_remove(std::string path) const
      -> task<Outcome<void>>;
  [[nodiscard]] auto worktree_prune() const -> task<Outcome<void>>;

  /// `merge --no-ff --no-edit -m <message> <branch>`. A conflicting merge is
  /// aborted before returning Error::MergeConflict.
  [[nodiscard]] auto merge_no_ff(std::string branch, std::string message) const
      -> task<Outcome<void>>;

  /// Commits of `range` (newest first).
  [[nodiscard]] auto log_range(std::string range) const
      -> task<Outcome<std::vector<CommitInfo>>>;

private:
  std::string cwd_;
  std::chrono::milliseconds timeout_;
};

/// Splits `git log --format=%H%x1f%s%x1f%B%x1e` output into commits.
[[nodiscard]] auto parse_log_records(std::string_view output)
    -> std::vector<CommitInfo>;

} // namespace planq::git
