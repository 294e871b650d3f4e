#include "metro/Log.hpp"
#include "metro/ScriptRunner.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

void PrintHelp()
{
  std::cout
      << "metro_script (deterministic scenario runner)\n\n"
      << "Usage:\n"
      << "  metro_script [--quiet] [--log-level <level>] <script.txt> [more.txt ...]\n\n"
      << "Each script runs in the same session, so later files see the game built by\n"
      << "earlier ones. The exit code is non-zero on the first failing command.\n";
}

} // namespace

int main(int argc, char** argv)
{
  using namespace metro;

  bool quiet = false;
  std::vector<std::string> scripts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--quiet" || arg == "-q") {
      quiet = true;
    } else if (arg == "--log-level") {
      if (i + 1 >= argc) {
        std::cerr << "--log-level requires a level\n";
        return 2;
      }
      SetLogLevel(ParseLogLevel(argv[++i], LogLevel::Warn));
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown argument: " << arg << "\n\n";
      PrintHelp();
      return 2;
    } else {
      scripts.push_back(arg);
    }
  }

  if (scripts.empty()) {
    PrintHelp();
    return 2;
  }

  ScriptRunner runner;
  ScriptCallbacks cb;
  cb.print = [](const std::string& line) { std::cout << line << '\n'; };
  cb.info = [](const std::string& line) { std::cerr << line << '\n'; };
  cb.error = [](const std::string& line) { std::cerr << line << '\n'; };
  runner.setCallbacks(std::move(cb));

  ScriptRunOptions opt;
  opt.quiet = quiet;
  runner.setOptions(opt);

  for (const std::string& path : scripts) {
    if (!runner.runFile(path)) return 1;
  }
  return 0;
}
