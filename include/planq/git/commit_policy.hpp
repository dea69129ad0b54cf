#pragma once

#include "planq/core/coroutine.hpp"
#include "planq/core/error.hpp"
#include "planq/git/git.hpp"

#include <regex>
#include <span>
#include <string>
#include <string_view>

namespace planq::git {

/// `type(scope)!: description` with a lowercase type.
[[nodiscard]] auto is_conventional_header(std::string_view subject) -> bool;

/// True for git invocations that change repository state (add, commit,
/// merge, rebase, reset, worktree and friends).
[[nodiscard]] auto is_mutating_git_command(std::string_view command) -> bool;

/// Tasks may stage and commit inside their worktree; every other mutating
/// git command is a runtime policy violation.
[[nodiscard]] auto is_allowed_task_git_command(std::string_view command)
    -> bool;

class CommitPolicy {
public:
  explicit CommitPolicy(const std::string &forbidden_trailer_pattern);

  [[nodiscard]] auto has_forbidden_trailer(std::string_view body) const
      -> bool;

  /// Checks every commit: the header must be Conventional Commit compliant
  /// and the body must not carry a forbidden co-author trailer. An empty
  /// list fails with "No commits found in <context>.".
  [[nodiscard]] auto validate(std::span<const CommitInfo> commits,
                              std::string_view context) const
      -> Outcome<void>;

  /// Reads `range` from `repo` and validates it.
  [[nodiscard]] auto validate_range(const Repo &repo, std::string range,
                                    std::string context) const
      -> task<Outcome<void>>;

private:
  std::regex forbidden_trailer_;
};

} // namespace planq::git
