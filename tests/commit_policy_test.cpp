#include "planq/config/system_config.hpp"
#include "planq/git/commit_policy.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace planq;
using namespace planq::git;

TEST(CommitPolicyTest, ConventionalHeaders) {
  EXPECT_TRUE(is_conventional_header("feat: add login"));
  EXPECT_TRUE(is_conventional_header("fix(auth): handle expiry"));
  EXPECT_TRUE(is_conventional_header("refactor!: drop v1 api"));
  EXPECT_TRUE(is_conventional_header("chore(deps)!: bump"));

  EXPECT_FALSE(is_conventional_header("Add login"));
  EXPECT_FALSE(is_conventional_header("Feat: add login"));
  EXPECT_FALSE(is_conventional_header("feat:add login"));
  EXPECT_FALSE(is_conventional_header("feat(): nothing"));
  EXPECT_FALSE(is_conventional_header(""));
}

TEST(CommitPolicyTest, MutatingGitCommands) {
  EXPECT_TRUE(is_mutating_git_command("git push origin main"));
  EXPECT_TRUE(is_mutating_git_command("cd x && git reset --hard"));
  EXPECT_TRUE(is_mutating_git_command("git worktree add ../y"));
  EXPECT_FALSE(is_mutating_git_command("git status"));
  EXPECT_FALSE(is_mutating_git_command("git log --oneline"));
  EXPECT_FALSE(is_mutating_git_command("ls -la"));
}

TEST(CommitPolicyTest, TasksMayOnlyStageAndCommit) {
  EXPECT_TRUE(is_allowed_task_git_command("git add -A && git commit -m x"));
  EXPECT_TRUE(is_allowed_task_git_command("git diff HEAD"));
  EXPECT_TRUE(is_allowed_task_git_command("npm test"));

  EXPECT_FALSE(is_allowed_task_git_command("git checkout main"));
  EXPECT_FALSE(is_allowed_task_git_command("git add . && git push"));
  EXPECT_FALSE(is_allowed_task_git_command("git rebase -i HEAD~2"));
  EXPECT_FALSE(is_allowed_task_git_command("GIT MERGE other"));
}

TEST(CommitPolicyTest, ForbiddenTrailerIsCaseInsensitive) {
  CommitPolicy policy(PolicyConfig{}.forbidden_trailer_pattern);
  EXPECT_TRUE(policy.has_forbidden_trailer(
      "feat: x\n\nCo-Authored-By: Claude <noreply@anthropic.com>\n"));
  EXPECT_TRUE(policy.has_forbidden_trailer("co-authored-by: claude"));
  EXPECT_FALSE(policy.has_forbidden_trailer(
      "feat: x\n\nCo-Authored-By: Jane Doe <jane@example.com>\n"));
}

TEST(CommitPolicyTest, ValidateReportsFirstOffendingCommit) {
  CommitPolicy policy(PolicyConfig{}.forbidden_trailer_pattern);
  std::vector<CommitInfo> good{{"aaa", "feat: one", "feat: one\n"},
                               {"bbb", "test(api): two", "test(api): two\n"}};
  EXPECT_TRUE(policy.validate(good, "task a").has_value());

  std::vector<CommitInfo> bad_header{{"ccc", "WIP", "WIP\n"}};
  auto r1 = policy.validate(bad_header, "task a (planq/p/a)");
  ASSERT_FALSE(r1.has_value());
  EXPECT_EQ(r1.error().code, make_error_code(Error::PolicyViolation));
  EXPECT_EQ(r1.error().reason,
            "Commit policy violation in task a (planq/p/a): commit ccc is not "
            "Conventional Commit compliant.");

  std::vector<CommitInfo> trailer{
      {"ddd", "fix: y", "fix: y\n\nCo-authored-by: Claude <c@x>\n"}};
  auto r2 = policy.validate(trailer, "task b");
  ASSERT_FALSE(r2.has_value());
  EXPECT_EQ(r2.error().reason,
            "Commit policy violation in task b: commit ddd includes forbidden "
            "co-author trailer.");
}

TEST(CommitPolicyTest, EmptyRangeIsAViolation) {
  CommitPolicy policy(PolicyConfig{}.forbidden_trailer_pattern);
  auto r = policy.validate({}, "task c");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, make_error_code(Error::PolicyViolation));
  EXPECT_EQ(r.error().reason, "No commits found in task c.");
}
