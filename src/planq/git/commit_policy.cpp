#include "planq/git/commit_policy.hpp"

#include "planq/util/log.hpp"

#include <cctype>
#include <format>
#include <string>

namespace planq::git {

namespace {

auto conventional_header_re() -> const std::regex & {
  static const std::regex re(R"(^[a-z]+(?:\([^)]+\))?!?: .+)");
  return re;
}

auto mutating_git_re() -> const std::regex & {
  static const std::regex re(
      R"(\bgit\s+(?:add|am|apply|branch|checkout|cherry-pick|commit|merge|mv|pull|push|rebase|reset|revert|rm|stash|switch|tag|update-ref|worktree)\b)",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

auto mutating_git_token_re() -> const std::regex & {
  static const std::regex re(R"(\bgit\s+([a-z-]+))",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

[[nodiscard]] auto lowercase(std::string s) -> std::string {
  for (auto &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

} // namespace

auto is_conventional_header(std::string_view subject) -> bool {
  const std::string s(subject);
  return std::regex_search(s, conventional_header_re(),
                           std::regex_constants::match_continuous);
}

auto is_mutating_git_command(std::string_view command) -> bool {
  const std::string s(command);
  return std::regex_search(s, mutating_git_re());
}

auto is_allowed_task_git_command(std::string_view command) -> bool {
  const std::string s(command);
  for (auto it = std::sregex_iterator(s.begin(), s.end(),
                                      mutating_git_token_re());
       it != std::sregex_iterator(); ++it) {
    const auto verb = lowercase((*it)[1].str());
    if (verb == "add" || verb == "commit") {
      continue;
    }
    if (is_mutating_git_command(std::format("git {}", verb))) {
      return false;
    }
  }
  return true;
}

CommitPolicy::CommitPolicy(const std::string &forbidden_trailer_pattern)
    : forbidden_trailer_(forbidden_trailer_pattern,
                         std::regex::ECMAScript | std::regex::icase) {}

auto CommitPolicy::has_forbidden_trailer(std::string_view body) const
    -> bool {
  const std::string s(body);
  return std::regex_search(s, forbidden_trailer_);
}

auto CommitPolicy::validate(std::span<const CommitInfo> commits,
                            std::string_view context) const -> Outcome<void> {
  if (commits.empty()) {
    return fail_with(Error::PolicyViolation,
                     std::format("No commits found in {}.", context));
  }
  for (const auto &c : commits) {
    if (!is_conventional_header(c.subject)) {
      return fail_with(
          Error::PolicyViolation,
          std::format("Commit policy violation in {}: commit {} is not "
                      "Conventional Commit compliant.",
                      context, c.hash));
    }
    if (has_forbidden_trailer(c.body)) {
      return fail_with(
          Error::PolicyViolation,
          std::format("Commit policy violation in {}: commit {} includes "
                      "forbidden co-author trailer.",
                      context, c.hash));
    }
  }
  return {};
}

auto CommitPolicy::validate_range(const Repo &repo, std::string range,
                                  std::string context) const
    -> task<Outcome<void>> {
  auto commits = co_await repo.log_range(std::move(range));
  if (!commits) {
    co_return fail_with(std::move(commits.error()));
  }
  auto verdict = validate(*commits, context);
  if (!verdict) {
    log::error("{}", verdict.error().reason);
  }
  co_return verdict;
}

} // namespace planq::git
