#include <toad/app/shell.h>
#include <toad/app/terminal.h>
#include <toad/core/config.h>
#include <toad/core/diagnostics.h>
#include <toad/core/settings.h>
#include <toad/engine/session.h>
#include <toad/net/http_client.h>
#include <toad/paint/color_quantizer.h>

#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr const char kProgramName[] = "toad";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName << " [--size=COLUMNSxROWS] [url]\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }
  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }
  value = parsed;
  return true;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_size_flag(std::string_view text, int& columns, int& rows) {
  constexpr std::string_view kSizePrefix = "--size=";
  if (!starts_with(text, kSizePrefix)) {
    return false;
  }
  const std::string_view dimensions = text.substr(kSizePrefix.size());
  const std::size_t separator = dimensions.find('x');
  if (separator == std::string_view::npos) {
    return false;
  }
  int parsed_columns = 0;
  int parsed_rows = 0;
  if (!parse_positive_int(dimensions.substr(0, separator), parsed_columns) ||
      !parse_positive_int(dimensions.substr(separator + 1), parsed_rows)) {
    return false;
  }
  columns = parsed_columns;
  rows = parsed_rows;
  return true;
}

// Appends every diagnostic to the file named by TOAD_LOG.
void attach_log_observer(toad::core::DiagnosticEmitter& diagnostics) {
  const char* path = std::getenv(toad::core::config::kLogEnvVar);
  if (path == nullptr || *path == '\0') {
    return;
  }
  auto log = std::make_shared<std::ofstream>(path, std::ios::app);
  if (!*log) {
    std::cerr << "Cannot open log file: " << path << "\n";
    return;
  }
  diagnostics.add_observer([log](const toad::core::DiagnosticEvent& event) {
    *log << toad::core::format_diagnostic(event) << "\n";
    log->flush();
  });
}

// Non-interactive output: the whole page as plain text.
int dump_page(toad::engine::Session& session, const std::string& input) {
  const toad::engine::NavigationResult result = session.open(input);
  if (!result.ok) {
    std::cerr << result.message << "\n";
    return 1;
  }
  session.resize(session.columns(), session.max_scroll_row() + session.rows());
  std::cout << session.render().to_text() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  int columns = toad::core::config::kDefaultViewportColumns;
  int rows = toad::core::config::kDefaultViewportRows;
  bool has_size = false;
  std::string input;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index]);
    if (is_help_flag(argument)) {
      print_usage(std::cout);
      return 0;
    }
    if (is_version_flag(argument)) {
      std::cout << kProgramName << " " << toad::core::config::kVersion << "\n";
      return 0;
    }
    if (starts_with(argument, "--size")) {
      if (has_size || !parse_size_flag(argument, columns, rows)) {
        std::cerr << "Invalid --size: '" << argument
                  << "' (expected --size=COLUMNSxROWS with positive integers)\n";
        print_usage(std::cerr);
        return 1;
      }
      has_size = true;
      continue;
    }
    if (!input.empty()) {
      print_usage(std::cerr);
      return 1;
    }
    input = std::string(argument);
  }

  toad::core::DiagnosticEmitter diagnostics;
  attach_log_observer(diagnostics);

  const std::string settings_path = toad::core::default_settings_path();
  const toad::core::Settings settings = toad::core::load_settings(settings_path);

  toad::net::HttpClient transport;
  const bool interactive = toad::app::Terminal::is_terminal(STDIN_FILENO) &&
                           toad::app::Terminal::is_terminal(STDOUT_FILENO);

  if (!interactive) {
    if (input.empty()) {
      std::cerr << "No URL given and stdout is not a terminal\n";
      print_usage(std::cerr);
      return 1;
    }
    toad::engine::Session session(&transport, diagnostics, settings, columns, rows);
    return dump_page(session, input);
  }

  toad::app::Terminal terminal(STDIN_FILENO, STDOUT_FILENO);
  std::string err;
  if (!terminal.enter(err)) {
    std::cerr << err << "\n";
    return 1;
  }

  toad::engine::Session session(&transport, diagnostics, settings);
  toad::app::Shell shell(session, terminal, diagnostics,
                         toad::paint::detect_color_mode(std::getenv("COLORTERM")),
                         settings_path);
  const int exit_code = shell.run(input);
  terminal.leave();
  return exit_code;
}
