#include "catalog/catalog.hpp"
#include "catalog/exporter.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "utils/text.hpp"
#include <iostream>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  std::string export_dir{"."};
  std::string log_file{"bookcat.log"};
  bookcat::logging::severity_level log_level{boost::log::trivial::info};
  bool show_help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-e <dir>] [-l <file>] [-v <level>]\n"
        << "Optional arguments:\n"
        << "  -e, --export-dir   Directory for export files (default: .)\n"
        << "  -l, --log-file     Log file path (default: bookcat.log)\n"
        << "  -v, --log-level    trace, debug, info, warning, error or fatal (default: info)\n"
        << "      --help         Show this message\n"
        << "Example: " << program_name << " -e exports -v debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string> flag_map = {
    {"-e", "--export-dir"},
    {"--export-dir", "--export-dir"},
    {"-l", "--log-file"},
    {"--log-file", "--log-file"},
    {"-v", "--log-level"},
    {"--log-level", "--log-level"}
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help" || flag == "-h") {
      options.show_help = true;
      options.valid = true;
      return options;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (it->second == "--export-dir") {
      options.export_dir = value;
    } else if (it->second == "--log-file") {
      options.log_file = value;
    } else if (auto level = bookcat::logging::parse_log_level(value)) {
      options.log_level = *level;
    } else {
      std::cerr << "Error: Invalid log level: " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

void run_catalog(const ProgramOptions& options) {
  try {
    bookcat::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    // Keep the console clean when no log file can be used
    bookcat::logging::disable_logging();
  }

  // Case folding locale for searches
  bookcat::utils::text_locale();

  bookcat::catalog::Catalog catalog;
  bookcat::catalog::Exporter exporter(options.export_dir);
  bookcat::cli::CLI cli(catalog, exporter);

  cli.run();
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  run_catalog(options);
  return 0;
}
