#include <gitagent/git.hpp>
#include <gitagent/util.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

namespace gitagent {

GitRepo::GitRepo(fs::path root) : root_(std::move(root)) {}

bool GitRepo::is_repo() const {
  std::error_code ec;
  return fs::exists(root_ / ".git", ec);
}

bool GitRepo::run_git(const std::vector<std::string> &args, int &rc,
                      std::string *out, std::string *err) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back("git");
  argv.insert(argv.end(), args.begin(), args.end());

  auto r = run_command(argv, root_);
  rc = r.exit_code;
  if (out)
    *out = std::move(r.out);
  if (err)
    *err = std::move(r.err);
  return rc == 0;
}

std::optional<std::string> GitRepo::capture(const std::vector<std::string> &args,
                                            std::string *err) const {
  int rc = 0;
  std::string out, e;
  if (!run_git(args, rc, &out, &e)) {
    spdlog::debug("[git] {} failed rc={} err={}", fmt::join(args, " "), rc,
                  e);
    if (err)
      *err = e.empty() ? fmt::format("git exited with {}", rc) : e;
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> GitRepo::status_porcelain(std::string *err) const {
  return capture({"status", "--porcelain", "-u"}, err);
}

std::optional<std::string> GitRepo::status_short(std::string *err) const {
  return capture({"status", "-s", "-u"}, err);
}

std::optional<std::string> GitRepo::diff_head(const std::string &rel_path,
                                              std::string *err) const {
  return capture({"diff", "HEAD", "--", rel_path}, err);
}

std::optional<std::string> GitRepo::current_branch(std::string *err) const {
  auto out = capture({"rev-parse", "--abbrev-ref", "HEAD"}, err);
  if (!out)
    return std::nullopt;
  return trim(*out);
}

std::optional<std::string> GitRepo::log_oneline(int limit,
                                                std::string *err) const {
  return capture({"log", "--oneline", "-n", std::to_string(limit)}, err);
}

std::optional<std::string> GitRepo::remote_url(const std::string &remote,
                                               std::string *err) const {
  auto out = capture({"remote", "get-url", remote}, err);
  if (!out)
    return std::nullopt;
  return trim(*out);
}

std::optional<std::string> GitRepo::commit_all(const std::string &message,
                                               std::string *err) const {
  if (!capture({"add", "."}, err))
    return std::nullopt;
  return capture({"commit", "-m", message}, err);
}

std::optional<std::string> GitRepo::push(std::string *err) const {
  return capture({"push"}, err);
}

std::optional<std::string> GitRepo::pull(std::string *err) const {
  return capture({"pull"}, err);
}

std::optional<std::string> GitRepo::stage(const std::string &rel_path,
                                          std::string *err) const {
  return capture({"add", "--", rel_path}, err);
}

std::optional<std::string> GitRepo::unstage(const std::string &rel_path,
                                            std::string *err) const {
  return capture({"reset", "-q", "HEAD", "--", rel_path}, err);
}

std::optional<std::string> GitRepo::restore_head(const std::string &rel_path,
                                                 std::string *err) const {
  return capture({"checkout", "HEAD", "--", rel_path}, err);
}

bool GitRepo::in_head(const std::string &rel_path) const {
  auto out = capture({"ls-tree", "HEAD", "--", rel_path}, nullptr);
  return out && !trim(*out).empty();
}

static std::vector<std::string> branch_lines(const std::string &out) {
  std::vector<std::string> names;
  std::istringstream in(out);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] == '*')
      line.erase(0, 1);
    line = trim(line);
    if (!line.empty())
      names.push_back(line);
  }
  return names;
}

std::optional<BranchList> GitRepo::branches(std::string *err) const {
  auto local = capture({"branch"}, err);
  if (!local)
    return std::nullopt;
  BranchList b;
  b.local = branch_lines(*local);
  b.current = current_branch().value_or("");

  auto cur = std::find(b.local.begin(), b.local.end(), b.current);
  if (cur != b.local.end())
    std::rotate(b.local.begin(), cur, cur + 1);

  // a repository without remotes simply has no remote branches
  auto remote = capture({"branch", "-r"}, nullptr);
  if (remote) {
    for (auto &line : branch_lines(*remote)) {
      if (line.find("HEAD") != std::string::npos)
        continue;
      auto slash = line.rfind('/');
      if (slash == std::string::npos)
        continue;
      std::string name = line.substr(slash + 1);
      if (name.empty() ||
          std::find(b.local.begin(), b.local.end(), name) != b.local.end() ||
          std::find(b.remote.begin(), b.remote.end(), name) != b.remote.end())
        continue;
      b.remote.push_back(name);
    }
  }
  return b;
}

std::optional<std::string> GitRepo::checkout(const std::string &branch,
                                             std::string *err) const {
  return capture({"checkout", branch, "--"}, err);
}

std::optional<std::string>
GitRepo::checkout_tracking(const std::string &branch,
                           const std::string &upstream,
                           std::string *err) const {
  return capture({"checkout", "-b", branch, upstream}, err);
}

std::optional<std::string> GitRepo::create_branch(const std::string &branch,
                                                  bool switch_to,
                                                  std::string *err) const {
  if (switch_to)
    return capture({"checkout", "-b", branch}, err);
  return capture({"branch", branch}, err);
}

std::optional<CommitCounts> GitRepo::commit_counts(std::string *err) const {
  auto total = capture({"rev-list", "--count", "HEAD"}, err);
  if (!total)
    return std::nullopt;
  CommitCounts c;
  c.total = std::strtol(trim(*total).c_str(), nullptr, 10);
  auto sb = capture({"status", "-sb"}, nullptr);
  if (sb) {
    std::string first = sb->substr(0, sb->find('\n'));
    parse_branch_header(first, c.total, c);
  }
  return c;
}

std::optional<std::string> porcelain_code(const std::string &porcelain,
                                          const std::string &rel_path) {
  std::istringstream in(porcelain);
  std::string line;
  while (std::getline(in, line)) {
    if (line.size() < 4)
      continue;
    std::string path = line.substr(3);
    auto arrow = path.find(" -> ");
    if (arrow != std::string::npos)
      path = path.substr(arrow + 4);
    if (path.size() >= 2 && path.front() == '"' && path.back() == '"')
      path = path.substr(1, path.size() - 2);
    if (path == rel_path)
      return line.substr(0, 2);
  }
  return std::nullopt;
}

static long count_after(const std::string &line, const std::string &word) {
  auto pos = line.find(word);
  if (pos == std::string::npos)
    return 0;
  return std::strtol(line.c_str() + pos + word.size(), nullptr, 10);
}

void parse_branch_header(const std::string &line, long total,
                         CommitCounts &counts) {
  if (line.find("...") == std::string::npos) {
    counts.unpushed = total;
    counts.behind = 0;
    return;
  }
  counts.unpushed = count_after(line, "ahead ");
  counts.behind = count_after(line, "behind ");
}

bool valid_branch_name(const std::string &name) {
  if (name.empty() || name.front() == '-')
    return false;
  return std::none_of(name.begin(), name.end(), [](char c) {
    return c == ' ' || c == '~' || c == '^' || c == ':' || c == '\\' ||
           static_cast<unsigned char>(c) < 0x20;
  });
}

} // namespace gitagent
