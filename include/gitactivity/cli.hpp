#pragma once
#include <optional>
#include <string>
#include <variant>

namespace gitactivity {

struct CmdExport {
  std::string input;
  std::string format = "console";
  bool anonymize = false;
  bool with_links = false;
  std::optional<std::string> output_dir;
  std::optional<std::string> work_dir;
};
struct CmdCheck {};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdExport, CmdCheck, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace gitactivity
