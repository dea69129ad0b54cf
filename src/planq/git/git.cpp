#include "planq/git/git.hpp"

#include "planq/process/process.hpp"
#include "planq/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <format>
#include <ranges>
#include <utility>

namespace planq::git {

namespace {

inline constexpr std::string_view kLogFormat = "--format=%H%x1f%s%x1f%B%x1e";

[[nodiscard]] auto join_args(const std::vector<std::string> &args)
    -> std::string {
  std::string out;
  for (const auto &a : args) {
    if (!out.empty()) {
      out += ' ';
    }
    out += a;
  }
  return out;
}

[[nodiscard]] auto failure_reason(const std::vector<std::string> &args,
                                  const std::string &cwd,
                                  const ProcessResult &res) -> std::string {
  auto details = boost::algorithm::trim_copy(res.stderr_output);
  if (details.empty()) {
    details = res.timed_out ? std::string{"timed out"}
                            : std::format("exit code {}", res.exit_code);
  }
  return std::format("git {} failed in {}: {}", join_args(args), cwd, details);
}

[[nodiscard]] auto spawn_failure(const std::vector<std::string> &args,
                                 const std::string &cwd, std::error_code ec)
    -> Failure {
  return Failure{.code = make_error_code(Error::GitCommandFailed),
                 .reason = std::format("git {} failed in {}: {}",
                                       join_args(args), cwd, ec.message())};
}

} // namespace

Repo::Repo(std::string cwd, std::chrono::milliseconds timeout)
    : cwd_(std::move(cwd)), timeout_(timeout) {}

auto Repo::run(std::vector<std::string> args) const
    -> task<Outcome<std::string>> {
  ProcessRequest req{.program = "git",
                     .args = args,
                     .working_dir = cwd_,
                     .timeout = timeout_};
  auto res = co_await run_process(std::move(req));
  if (!res) {
    co_return fail_with(spawn_failure(args, cwd_, res.error()));
  }
  if (!res->success()) {
    auto reason = failure_reason(args, cwd_, *res);
    log::debug("{}", reason);
    co_return fail_with(Error::GitCommandFailed, std::move(reason));
  }
  boost::algorithm::trim_right(res->stdout_output);
  co_return std::move(res->stdout_output);
}

auto Repo::show_toplevel() const -> task<Outcome<std::string>> {
  co_return co_await run({"rev-parse", "--show-toplevel"});
}

auto Repo::current_branch() const -> task<Outcome<std::string>> {
  co_return co_await run({"rev-parse", "--abbrev-ref", "HEAD"});
}

auto Repo::head_commit() const -> task<Outcome<std::string>> {
  co_return co_await run({"rev-parse", "HEAD"});
}

auto Repo::rev_parse(std::string ref) const -> task<Outcome<std::string>> {
  co_return co_await run({"rev-parse", "--verify", std::move(ref)});
}

auto Repo::is_dirty() const -> task<Outcome<bool>> {
  auto out = co_await run({"status", "--porcelain"});
  if (!out) {
    co_return fail_with(std::move(out.error()));
  }
  co_return !out->empty();
}

auto Repo::branch_exists(std::string name) const -> task<Outcome<bool>> {
  std::vector<std::string> args{"show-ref", "--verify", "--quiet",
                                "refs/heads/" + name};
  ProcessRequest req{.program = "git",
                     .args = args,
                     .working_dir = cwd_,
                     .timeout = timeout_};
  auto res = co_await run_process(std::move(req));
  if (!res) {
    co_return fail_with(spawn_failure(args, cwd_, res.error()));
  }
  if (res->exit_code == 0) {
    co_return true;
  }
  if (res->exit_code == 1 && !res->timed_out) {
    co_return false;
  }
  co_return fail_with(Error::GitCommandFailed,
                      failure_reason(args, cwd_, *res));
}

auto Repo::commit_all(std::string message) const -> task<Outcome<void>> {
  if (auto added = co_await run({"add", "-A"}); !added) {
    co_return fail_with(std::move(added.error()));
  }
  auto committed = co_await run({"commit", "-m", std::move(message)});
  if (!committed) {
    co_return fail_with(std::move(committed.error()));
  }
  co_return Outcome<void>{};
}

auto Repo::checkout(std::string branch) const -> task<Outcome<void>> {
  auto res = co_await run({"checkout", std::move(branch)});
  if (!res) {
    co_return fail_with(std::move(res.error()));
  }
  co_return Outcome<void>{};
}

auto Repo::delete_branch(std::string name) const -> task<Outcome<void>> {
  auto res = co_await run({"branch", "-D", std::move(name)});
  if (!res) {
    co_return fail_with(std::move(res.error()));
  }
  co_return Outcome<void>{};
}

auto Repo::worktree_add(std::string path, std::string branch,
                        std::string base) const -> task<Outcome<void>> {
  auto res = co_await run({"worktree", "add", "-b", std::move(branch),
                           std::move(path), std::move(base)});
  if (!res) {
    co_return fail_with(std::move(res.error()));
  }
  co_return Outcome<void>{};
}

auto Repo::worktree_remove(std::string path) const -> task<Outcome<void>> {
  auto res = co_await run({"worktree", "remove", "--force", std::move(path)});
  if (!res) {
    co_return fail_with(std::move(res.error()));
  }
  co_return Outcome<void>{};
}

auto Repo::worktree_prune() const -> task<Outcome<void>> {
  auto res = co_await run({"worktree", "prune"});
  if (!res) {
    co_return fail_with(std::move(res.error()));
  }
  co_return Outcome<void>{};
}

auto Repo::merge_no_ff(std::string branch, std::string message) const
    -> task<Outcome<void>> {
  auto merged = co_await run(
      {"merge", "--no-ff", "--no-edit", "-m", std::move(message), branch});
  if (merged) {
    co_return Outcome<void>{};
  }

  auto unmerged = co_await run({"diff", "--name-only", "--diff-filter=U"});
  const bool conflicted = unmerged && !unmerged->empty();
  if (!conflicted) {
    co_return fail_with(std::move(merged.error()));
  }

  log::warn("Merge of '{}' conflicts in {}; aborting merge", branch, cwd_);
  if (auto aborted = co_await run({"merge", "--abort"}); !aborted) {
    log::error("git merge --abort failed: {}", aborted.error().message());
  }
  co_return fail_with(
      Error::MergeConflict,
      std::format("Merge conflict while merging {} into {}: {}", branch, cwd_,
                  boost::algorithm::trim_copy(*unmerged)));
}

auto Repo::log_range(std::string range) const
    -> task<Outcome<std::vector<CommitInfo>>> {
  auto out = co_await run({"log", std::string(kLogFormat), std::move(range)});
  if (!out) {
    co_return fail_with(std::move(out.error()));
  }
  co_return parse_log_records(*out);
}

auto parse_log_records(std::string_view output) -> std::vector<CommitInfo> {
  std::vector<CommitInfo> commits;
  for (auto record_range : output | std::views::split('\x1e')) {
    auto record = boost::algorithm::trim_copy(
        std::string(record_range.begin(), record_range.end()));
    if (record.empty()) {
      continue;
    }
    CommitInfo info;
    const auto first = record.find('\x1f');
    if (first == std::string::npos) {
      info.hash = std::move(record);
      commits.emplace_back(std::move(info));
      continue;
    }
    info.hash = record.substr(0, first);
    const auto second = record.find('\x1f', first + 1);
    if (second == std::string::npos) {
      info.subject = record.substr(first + 1);
    } else {
      info.subject = record.substr(first + 1, second - first - 1);
      info.body = record.substr(second + 1);
    }
    boost::algorithm::trim(info.subject);
    commits.emplace_back(std::move(info));
  }
  return commits;
}

} // namespace planq::git
