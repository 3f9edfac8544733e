#include <gitagent/analyzer.hpp>
#include <gitagent/json.hpp>
#include <gitagent/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace gitagent {

static const char *kDslHelp = R"(   - `cd <path>`
   - `repo`
   - `status`
   - `commit "<message>"`
   - `push "<message>"` (the message is optional; when given, commit before pushing)
   - `pull`
   - `deploy "<command>"`)";

std::string build_prompt(const std::string &status) {
  return fmt::format(
      R"(You are a Git assistant. This is the `git status -s` output of a repository:

{}

1. Summarize concisely what has changed.
2. Write a script that commits these changes. The script language supports:
{}

Answer with a JSON object with the keys "summary" and "dsl", for example:
{{"summary": "Modified login page and added new icon.", "dsl": "commit \"Update login page\""}}
)",
      status, kDslHelp);
}

std::string build_chat_prompt(const std::string &message,
                              const std::string &status,
                              const std::string &log) {
  return fmt::format(
      R"(You are a helpful Git assistant.

Current git status:
{}

Recent commit log:
{}

User message: "{}"

1. Respond to the user's message in a helpful way.
2. If the user asks for a git operation, write a script that performs it. The
   script language supports:
{}
   - `undo`
   - `log <limit>`

Answer with a JSON object with the keys "response" and "dsl" (null when no
action is needed).
)",
      status, log, message, kDslHelp);
}

std::string strip_fences(const std::string &text) {
  std::string out = text;
  for (const char *fence : {"```json", "```"}) {
    std::string f = fence;
    for (size_t pos = out.find(f); pos != std::string::npos;
         pos = out.find(f, pos))
      out.erase(pos, f.size());
  }
  return trim(out);
}

std::optional<Analysis> parse_analysis(const std::string &text) {
  auto obj = json_parse_object(strip_fences(text));
  if (!obj)
    return std::nullopt;
  Analysis a;
  a.summary = json_get_string(*obj, "summary");
  a.dsl = json_get_string(*obj, "dsl");
  if (!a.summary && !a.dsl)
    return std::nullopt;
  return a;
}

ChatReply parse_chat(const std::string &text) {
  std::string body = strip_fences(text);
  ChatReply r;
  auto obj = json_parse_object(body);
  auto response = obj ? json_get_string(*obj, "response") : std::nullopt;
  if (!response) {
    r.response = body;
    return r;
  }
  r.response = *response;
  r.dsl = json_get_string(*obj, "dsl");
  return r;
}

std::optional<Analysis> Analyzer::analyze(const std::string &status,
                                          std::string *err) {
  auto answer = complete(build_prompt(status), err);
  if (!answer)
    return std::nullopt;
  auto parsed = parse_analysis(*answer);
  if (!parsed) {
    spdlog::debug("[analyze] unparseable answer: {}", *answer);
    Analysis a;
    a.summary = "Could not parse analyzer response.";
    return a;
  }
  return parsed;
}

std::optional<ChatReply> Analyzer::chat(const std::string &message,
                                        const std::string &status,
                                        const std::string &log,
                                        std::string *err) {
  auto answer = complete(build_chat_prompt(message, status, log), err);
  if (!answer)
    return std::nullopt;
  return parse_chat(*answer);
}

CommandAnalyzer::CommandAnalyzer(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

std::optional<std::string> CommandAnalyzer::complete(const std::string &prompt,
                                                     std::string *err) {
  if (argv_.empty()) {
    if (err)
      *err = "analyzer command is not configured";
    return std::nullopt;
  }

  std::string tmpl =
      (fs::temp_directory_path() / "gitagent_prompt_XXXXXX").string();
  int fd = ::mkstemp(tmpl.data());
  if (fd < 0) {
    if (err)
      *err = "cannot create prompt file";
    return std::nullopt;
  }
  ::close(fd);
  {
    std::ofstream o(tmpl, std::ios::binary | std::ios::trunc);
    o << prompt;
  }

  auto argv = argv_;
  argv.push_back(tmpl);
  auto r = run_command(argv, {});
  std::error_code ec;
  fs::remove(tmpl, ec);

  if (r.exit_code != 0) {
    spdlog::warn("[analyze] {} exited with {}: {}", argv_.front(), r.exit_code,
                 trim(r.err));
    if (err)
      *err = fmt::format("analyzer failed (exit {}): {}", r.exit_code,
                         trim(r.err));
    return std::nullopt;
  }
  return r.out;
}

} // namespace gitagent
