#include <gitagent/util.hpp>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <xxhash.h>

namespace gitagent {

static int safe_pipe(int fds[2]) { return pipe2(fds, O_CLOEXEC); }

// Reads both pipes until EOF on each.
static void drain(int out_fd, int err_fd, std::string &out, std::string &err) {
  std::array<char, 4096> buf{};
  pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
  std::string *dst[2] = {&out, &err};
  int open_count = 2;
  while (open_count > 0) {
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      return;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        dst[i]->append(buf.data(), static_cast<size_t>(n));
      } else if (n < 0 && errno == EINTR) {
        continue;
      } else {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

CmdResult run_command(const std::vector<std::string> &args,
                      const std::filesystem::path &cwd) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }

  pid_t pid = fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = "fork failed";
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(126);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    std::vector<char *> argv_c;
    argv_c.reserve(args.size() + 1);
    for (auto &s : args)
      argv_c.push_back(const_cast<char *>(s.c_str()));
    argv_c.push_back(nullptr);

    execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);

  drain(out_pipe[0], err_pipe[0], res.out, res.err);
  close(out_pipe[0]);
  close(err_pipe[0]);

  int status = 0;
  if (waitpid(pid, &status, 0) == -1) {
    res.exit_code = -1;
    return res;
  }
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = 128 + WTERMSIG(status);
  else
    res.exit_code = -1;

  return res;
}

std::string trim(const std::string &s) {
  size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

std::string trim_right(const std::string &s) {
  size_t e = s.size();
  while (e > 0 && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(0, e);
}

std::uint64_t content_hash(const std::string &s) {
  return XXH3_64bits(s.data(), s.size());
}

std::uint64_t content_hash(const std::vector<std::string> &items) {
  XXH3_state_t *st = XXH3_createState();
  XXH3_64bits_reset(st);
  for (auto &it : items) {
    XXH3_64bits_update(st, it.data(), it.size());
    XXH3_64bits_update(st, "\0", 1);
  }
  auto h = XXH3_64bits_digest(st);
  XXH3_freeState(st);
  return h;
}

std::vector<std::string> split_words(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

} // namespace gitagent
