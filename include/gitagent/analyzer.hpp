#pragma once
#include <optional>
#include <string>
#include <vector>

namespace gitagent {

struct Analysis {
  std::optional<std::string> summary;
  std::optional<std::string> dsl;
};

struct ChatReply {
  std::string response;
  std::optional<std::string> dsl;
};

// Language-model backend. Implementations only provide complete(); the
// prompts and answer parsing are shared.
class Analyzer {
public:
  virtual ~Analyzer() = default;

  // Raw answer to `prompt`, or nullopt with `err` set.
  virtual std::optional<std::string> complete(const std::string &prompt,
                                              std::string *err) = 0;

  // Describes a `git status -s` listing. An answer that is not the expected
  // object becomes the summary "Could not parse analyzer response.".
  std::optional<Analysis> analyze(const std::string &status, std::string *err);

  std::optional<ChatReply> chat(const std::string &message,
                                const std::string &status,
                                const std::string &log, std::string *err);
};

std::string build_prompt(const std::string &status);
std::string build_chat_prompt(const std::string &message,
                              const std::string &status,
                              const std::string &log);

// Removes markdown code fences around a model answer and trims it.
std::string strip_fences(const std::string &text);

// Reads {"summary": ..., "dsl": ...}. nullopt when the answer is not such an
// object.
std::optional<Analysis> parse_analysis(const std::string &text);
// Reads {"response": ..., "dsl": ...}; any other answer is returned verbatim
// as the response.
ChatReply parse_chat(const std::string &text);

// Runs an external program (typically a wrapper around an LLM endpoint)
// with the prompt written to a temporary file passed as the last argument;
// the program prints the model's answer on stdout.
class CommandAnalyzer : public Analyzer {
public:
  explicit CommandAnalyzer(std::vector<std::string> argv);

  std::optional<std::string> complete(const std::string &prompt,
                                      std::string *err) override;

private:
  std::vector<std::string> argv_;
};

} // namespace gitagent
