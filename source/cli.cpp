#include <gitactivity/cli.hpp>

#include <string_view>

namespace gitactivity {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static ParseResult parse_export(int argc, char **argv) {
  ParseResult r{};
  CmdExport c{};
  for (int i = 2; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--input" && has_arg(i, argc))
      c.input = argv[++i];
    else if (a == "--format" && has_arg(i, argc))
      c.format = argv[++i];
    else if (a == "--anonymize")
      c.anonymize = true;
    else if (a == "--with-links")
      c.with_links = true;
    else if (a == "--output-dir" && has_arg(i, argc))
      c.output_dir = std::string(argv[++i]);
    else if (a == "--work-dir" && has_arg(i, argc))
      c.work_dir = std::string(argv[++i]);
    else {
      r.error = "export: unexpected argument '" + std::string(a) + "'";
      return r;
    }
  }
  if (c.input.empty()) {
    r.error = "export: --input <file> required";
    return r;
  }
  r.cmd = c;
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }
  if (cmd == "check") {
    r.cmd = CmdCheck{};
    return r;
  }
  if (cmd == "export")
    return parse_export(argc, argv);

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace gitactivity
