#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitagent {

struct BranchList {
  // Local branches, the current one first.
  std::vector<std::string> local;
  // Remote-tracking branch names (without the remote) that have no local
  // branch of the same name.
  std::vector<std::string> remote;
  std::string current;
};

struct CommitCounts {
  long total = 0;
  long unpushed = 0;
  long behind = 0;
};

// Thin wrapper over the git CLI for one working tree.
class GitRepo {
public:
  explicit GitRepo(std::filesystem::path root);

  const std::filesystem::path &root() const { return root_; }

  bool is_repo() const;

  // `git status --porcelain -u`: one line per changed or untracked path.
  std::optional<std::string> status_porcelain(std::string *err = nullptr) const;
  // `git status -s -u`, the human-facing short form.
  std::optional<std::string> status_short(std::string *err = nullptr) const;
  std::optional<std::string> diff_head(const std::string &rel_path,
                                       std::string *err = nullptr) const;
  std::optional<std::string> current_branch(std::string *err = nullptr) const;
  std::optional<std::string> log_oneline(int limit,
                                         std::string *err = nullptr) const;
  std::optional<std::string> remote_url(const std::string &remote,
                                        std::string *err = nullptr) const;

  // Stages everything and commits it.
  std::optional<std::string> commit_all(const std::string &message,
                                        std::string *err = nullptr) const;
  std::optional<std::string> push(std::string *err = nullptr) const;
  std::optional<std::string> pull(std::string *err = nullptr) const;

  std::optional<std::string> stage(const std::string &rel_path,
                                   std::string *err = nullptr) const;
  std::optional<std::string> unstage(const std::string &rel_path,
                                     std::string *err = nullptr) const;
  // Restores the HEAD version of a tracked path.
  std::optional<std::string> restore_head(const std::string &rel_path,
                                          std::string *err = nullptr) const;
  bool in_head(const std::string &rel_path) const;

  std::optional<BranchList> branches(std::string *err = nullptr) const;
  std::optional<std::string> checkout(const std::string &branch,
                                      std::string *err = nullptr) const;
  // Creates `branch` tracking `upstream` and switches to it.
  std::optional<std::string> checkout_tracking(const std::string &branch,
                                               const std::string &upstream,
                                               std::string *err = nullptr) const;
  std::optional<std::string> create_branch(const std::string &branch,
                                           bool switch_to,
                                           std::string *err = nullptr) const;

  // Total commits on HEAD and ahead/behind counts against the upstream.
  // Without an upstream every commit counts as unpushed.
  std::optional<CommitCounts> commit_counts(std::string *err = nullptr) const;

  bool run_git(const std::vector<std::string> &args, int &rc,
               std::string *out = nullptr, std::string *err = nullptr) const;

private:
  std::optional<std::string> capture(const std::vector<std::string> &args,
                                     std::string *err) const;

  std::filesystem::path root_;
};

// Two-letter porcelain code ("??", " M", "A ") of `rel_path`, if listed.
std::optional<std::string> porcelain_code(const std::string &porcelain,
                                          const std::string &rel_path);

// Reads "## main...origin/main [ahead 1, behind 2]" into `counts`.
void parse_branch_header(const std::string &line, long total,
                         CommitCounts &counts);

// Branch names acceptable on a git command line.
bool valid_branch_name(const std::string &name);

} // namespace gitagent
