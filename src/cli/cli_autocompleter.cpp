#include "cli/cli_autocompleter.hpp"

#include <algorithm>
#include <sstream>

#include "kernel/interaction.hpp"

namespace tb {

CliAutocompleter::CliAutocompleter(tb::InteractionService& svc) : svc_(svc) {
  // This list should be kept in sync with commands in `process_command`
  commands_ = {"clear", "cls",  "config", "errors", "exit",   "help", "info",
               "list",  "ls",   "q",      "quit",   "run",    "select"};
  std::sort(commands_.begin(), commands_.end());
}

CompletionResult CliAutocompleter::Complete(const std::string& line,
                                            int cursor_pos) {
  CompletionResult result;
  result.new_line = line;
  result.new_cursor_pos = cursor_pos;

  const std::string head = line.substr(0, cursor_pos);
  std::vector<std::string> tokens = Tokenize(head);

  // Start of the text being completed. Unit names may contain spaces, so for
  // unit-taking commands it is everything after the command word.
  size_t start_of_word = head.find_last_of(" \t");
  start_of_word = (start_of_word == std::string::npos) ? 0 : start_of_word + 1;

  bool completing_unit = false;
  if (tokens.empty() || (tokens.size() == 1 && head.back() != ' ')) {
    CompleteCommand(head.substr(start_of_word), result.options);
  } else {
    const std::string& cmd = tokens[0];
    if (cmd == "help") {
      CompleteCommand(head.substr(start_of_word), result.options);
    } else if (cmd == "run" || cmd == "select" || cmd == "info") {
      size_t arg_start = head.find(cmd) + cmd.size();
      while (arg_start < head.size() && (head[arg_start] == ' ' || head[arg_start] == '\t'))
        ++arg_start;
      start_of_word = arg_start;
      completing_unit = true;
      CompleteUnitName(head.substr(arg_start), result.options);
    } else if (cmd == "config" &&
               (tokens.size() == 1 || (tokens.size() == 2 && head.back() != ' '))) {
      CompleteConfigArgs(head.substr(start_of_word), result.options);
    }
  }

  result.replace_start = static_cast<int>(start_of_word);
  if (result.options.empty()) {
    return result;
  }

  std::string common_prefix = FindLongestCommonPrefix(result.options);
  if (common_prefix.empty()) {
    return result;
  }

  // Replace the partial text with the common prefix
  result.new_line =
      line.substr(0, start_of_word) + common_prefix + line.substr(cursor_pos);
  result.new_cursor_pos = static_cast<int>(start_of_word + common_prefix.length());

  // A single exact match gets a trailing space, except for unit names which
  // end the command
  if (result.options.size() == 1 && common_prefix == result.options[0] &&
      !completing_unit) {
    result.new_line.insert(result.new_cursor_pos, " ");
    result.new_cursor_pos++;
  }

  return result;
}

std::vector<std::string> CliAutocompleter::Tokenize(const std::string& line) const {
  std::vector<std::string> tokens;
  std::istringstream iss(line);
  for (std::string token; iss >> token;) tokens.push_back(token);
  return tokens;
}

std::string CliAutocompleter::FindLongestCommonPrefix(
    const std::vector<std::string>& options) const {
  if (options.empty()) return "";
  std::string prefix = options.front();
  for (const auto& opt : options) {
    auto mismatch = std::mismatch(prefix.begin(), prefix.end(), opt.begin(), opt.end());
    prefix.erase(mismatch.first, prefix.end());
    if (prefix.empty()) break;
  }
  return prefix;
}

}  // namespace tb
