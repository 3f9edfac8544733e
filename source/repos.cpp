#include <gitagent/git.hpp>
#include <gitagent/repos.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;

namespace gitagent {

std::vector<fs::path> default_search_roots(const fs::path &home) {
  return {home / "Documents" / "GitHub", home / "Documents", home / "source",
          home / "repos", home / "Projects"};
}

std::string github_owner(const std::string &remote_url) {
  std::string rest;
  for (const char *host : {"github.com/", "github.com:"}) {
    auto pos = remote_url.find(host);
    if (pos != std::string::npos) {
      rest = remote_url.substr(pos + std::char_traits<char>::length(host));
      break;
    }
  }
  auto slash = rest.find('/');
  if (rest.empty() || slash == std::string::npos || slash == 0)
    return {};
  return rest.substr(0, slash);
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

namespace {

struct Finder {
  int max_depth;
  std::set<std::string> visited;
  std::vector<RepoEntry> found;

  void scan(const fs::path &dir, int depth) {
    if (depth >= max_depth)
      return;
    std::error_code ec;
    fs::path canon = fs::weakly_canonical(dir, ec);
    if (ec || !fs::is_directory(canon, ec))
      return;
    if (!visited.insert(canon.string()).second)
      return;

    GitRepo repo(canon);
    if (repo.is_repo()) {
      RepoEntry e;
      e.name = canon.filename().string();
      e.path = canon;
      e.organization = github_owner(repo.remote_url("origin").value_or(""));
      if (e.organization.empty())
        e.organization = "Other";
      found.push_back(std::move(e));
      return;
    }

    for (fs::directory_iterator it(canon, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::string name = it->path().filename().string();
      std::error_code dec;
      if (name.empty() || name[0] == '.' || !it->is_directory(dec))
        continue;
      scan(it->path(), depth + 1);
    }
    if (ec)
      spdlog::debug("[repos] cannot list {}: {}", canon.string(), ec.message());
  }
};

} // namespace

std::vector<RepoEntry> find_repositories(const std::vector<fs::path> &roots,
                                         int max_depth) {
  Finder f{max_depth, {}, {}};
  for (auto &r : roots)
    f.scan(r, 0);
  std::sort(f.found.begin(), f.found.end(),
            [](const RepoEntry &a, const RepoEntry &b) {
              auto oa = lower(a.organization), ob = lower(b.organization);
              if (oa != ob)
                return oa < ob;
              return lower(a.name) < lower(b.name);
            });
  return f.found;
}

} // namespace gitagent
