#include <gitagent/scanner.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace gitagent {

IgnoreSet default_ignore_dirs() {
  return {".git", "__pycache__", "node_modules", "venv", ".idea", ".vscode"};
}

std::optional<std::string> GitStatusScanner::scan(std::string *err) {
  return repo_.status_porcelain(err);
}

std::optional<std::vector<std::string>>
TreeLister::list_files(const fs::path &root, const IgnoreSet &ignore,
                       std::string *err) {
  std::vector<std::string> files;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    if (err)
      *err = fmt::format("not a directory: {}", root.string());
    return std::nullopt;
  }

  for (auto it = fs::recursive_directory_iterator(root, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code fec;
    if (it->is_directory(fec)) {
      if (ignore.count(it->path().filename().string()))
        it.disable_recursion_pending();
      continue;
    }
    files.push_back(it->path().lexically_relative(root).generic_string());
  }
  if (ec) {
    if (err)
      *err = fmt::format("listing {} failed: {}", root.string(), ec.message());
    return std::nullopt;
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace gitagent
