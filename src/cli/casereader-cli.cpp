/**
 * @file casereader-cli.cpp
 * @brief Command-line inspector for case stores
 *
 * Opens one store and runs either a single command given on the command
 * line or an interactive session.
 */

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "config/config.h"
#include "reader/case_reader.h"
#include "version.h"

// Try to use readline if available
#ifdef HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#include <strings.h>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define USE_READLINE 1
#endif

namespace {

using casereader::cases::Case;
using casereader::cases::Category;
using casereader::codec::NdArray;
using casereader::reader::CaseReader;

constexpr size_t kMaxPrintedElements = 10;  // Arrays longer than this are elided

#ifdef USE_READLINE
// Command list for tab completion
// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays,cppcoreguidelines-avoid-non-const-global-variables)
const char* command_list[] = {"INFO", "SOURCES", "LIST",  "TREE", "CASE", "DERIV", "VARS", "INPUTS",
                              "OUTPUTS", "META", "LOAD", "CACHE", "quit", "exit", "help", nullptr};

/**
 * @brief Command name generator for readline completion
 */
char* CommandGenerator(const char* text, int state) {
  static int list_index;
  static int len;
  const char* name = nullptr;

  if (state == 0) {
    list_index = 0;
    len = static_cast<int>(strlen(text));
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
  while ((name = command_list[list_index++]) != nullptr) {
    if (strncasecmp(name, text, len) == 0) {
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      return strdup(name);
    }
  }

  return nullptr;
}

/**
 * @brief Completion function for readline
 *
 * Only the command word is completed; arguments are coordinates and names
 * that are not worth enumerating.
 */
char** CommandCompletion(const char* text, int start, int /* end */) {
  rl_attempted_completion_over = 1;
  if (start == 0) {
    return rl_completion_matches(text, CommandGenerator);
  }
  return nullptr;
}
#endif

/**
 * @brief Split a command line into whitespace separated tokens
 */
std::vector<std::string> ParseTokens(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream iss(line);
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string ToUpper(std::string text) {
  for (char& character : text) {
    character = static_cast<char>(toupper(static_cast<unsigned char>(character)));
  }
  return text;
}

std::string FormatArray(const NdArray& array) {
  std::ostringstream out;
  out << "[";
  size_t shown = std::min(array.data.size(), kMaxPrintedElements);
  for (size_t i = 0; i < shown; ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << array.data[i];
  }
  if (shown < array.data.size()) {
    out << ", ... (" << array.data.size() << " values)";
  }
  out << "]";
  return out.str();
}

std::string FormatShape(const std::vector<size_t>& shape) {
  std::ostringstream out;
  out << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << shape[i];
  }
  out << ")";
  return out.str();
}

struct Config {
  std::string store_path;
  std::string config_path;
  bool interactive = true;
};

class CaseReaderShell {
 public:
  explicit CaseReaderShell(std::unique_ptr<CaseReader> reader) : reader_(std::move(reader)) {}

  /**
   * @brief Execute one command and return its printable output
   */
  std::string Execute(const std::string& line) {
    std::vector<std::string> tokens = ParseTokens(line);
    if (tokens.empty()) {
      return "";
    }
    std::string command = ToUpper(tokens[0]);
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (command == "INFO") {
      return Info();
    }
    if (command == "SOURCES") {
      return Sources();
    }
    if (command == "LIST") {
      return List(args);
    }
    if (command == "TREE") {
      return Tree(args);
    }
    if (command == "CASE" || command == "DERIV") {
      if (args.size() != 1) {
        return "(error) " + command + " requires exactly one coordinate";
      }
      return ShowCase(args[0], command == "DERIV");
    }
    if (command == "VARS") {
      if (args.size() != 1) {
        return "(error) VARS requires a source";
      }
      return SourceVars(args[0]);
    }
    if (command == "INPUTS" || command == "OUTPUTS") {
      return Variables(command == "OUTPUTS", args);
    }
    if (command == "META") {
      return Meta(args);
    }
    if (command == "LOAD") {
      auto loaded = reader_->LoadCases();
      return loaded ? "OK" : "(error) " + loaded.error().to_string();
    }
    if (command == "CACHE") {
      return Cache(args);
    }
    return "(error) Unknown command: " + tokens[0] + " (type 'help')";
  }

  void RunInteractive() {
    std::cout << "casereader-cli " << reader_->Path() << '\n';
    std::cout << "Type 'quit' or 'exit' to exit, 'help' for help" << '\n';
    std::cout << '\n';

#ifdef USE_READLINE
    rl_attempted_completion_function = CommandCompletion;
#endif

    while (true) {
      std::string line;

#ifdef USE_READLINE
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      char* raw_input = readline("casereader> ");
      if (raw_input == nullptr) {
        // EOF (Ctrl-D)
        std::cout << '\n';
        break;
      }
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      std::unique_ptr<char, decltype(&free)> input(raw_input, &free);
      line = input.get();
      if (!line.empty()) {
        add_history(input.get());
      }
#else
      std::cout << "casereader> ";
      std::cout.flush();
      if (!std::getline(std::cin, line)) {
        break;  // EOF
      }
#endif

      // Trim whitespace
      line.erase(0, line.find_first_not_of(" \t\r\n"));
      auto pos = line.find_last_not_of(" \t\r\n");
      if (pos != std::string::npos) {
        line.erase(pos + 1);
      }

      if (line.empty()) {
        continue;
      }
      if (line == "quit" || line == "exit") {
        std::cout << "Bye!" << '\n';
        break;
      }
      if (line == "help") {
        PrintHelp();
        continue;
      }

      PrintResponse(Execute(line));
    }
  }

  int RunSingleCommand(const std::string& command) {
    std::string response = Execute(command);
    PrintResponse(response);
    return response.rfind("(error)", 0) == 0 ? 1 : 0;
  }

 private:
  static void PrintHelp() {
    std::cout << "Available commands:" << '\n';
    std::cout << "  INFO                          - Show format version and case counts" << '\n';
    std::cout << "  SOURCES                       - List recording sources" << '\n';
    std::cout << "  LIST [source] [RECURSE]       - List case coordinates in execution order" << '\n';
    std::cout << "  TREE [source]                 - Show the case hierarchy below a source" << '\n';
    std::cout << "  CASE <coordinate|name>        - Show one case" << '\n';
    std::cout << "  DERIV <coordinate>            - Show the derivatives recorded at a driver iteration" << '\n';
    std::cout << "  VARS <source>                 - Show variable names recorded by a source" << '\n';
    std::cout << "  INPUTS                        - Latest inputs of every system" << '\n';
    std::cout << "  OUTPUTS [EXPLICIT|IMPLICIT] [TOL <x>]" << '\n';
    std::cout << "                                - Latest outputs of every system" << '\n';
    std::cout << "  META DRIVER                   - Driver metadata" << '\n';
    std::cout << "  META SYSTEM|SOLVER [id]       - System or solver metadata (ids when omitted)" << '\n';
    std::cout << "  LOAD                          - Decode every case into the cache" << '\n';
    std::cout << "  CACHE [CLEAR]                 - Show or clear the case caches" << '\n';
    std::cout << '\n';
    std::cout << "Sources are 'driver', 'problem', a hierarchy location such as 'root.mda'," << '\n';
    std::cout << "or an iteration coordinate. An omitted source means the root." << '\n';
    std::cout << '\n';
    std::cout << "Other commands:" << '\n';
    std::cout << "  quit/exit - Exit" << '\n';
    std::cout << "  help      - Show this help" << '\n';
  }

  static void PrintResponse(const std::string& response) {
    if (!response.empty()) {
      std::cout << response << '\n';
    }
    // Explicit flush so popen() callers see the output before exit
    std::cout << std::flush;
  }

  std::string Info() const {
    std::ostringstream out;
    out << "path: " << reader_->Path() << '\n';
    out << "format_version: " << reader_->FormatVersion() << '\n';
    for (auto category : {Category::kDriver, Category::kDriverDerivative, Category::kSystem, Category::kSolver,
                          Category::kProblem}) {
      out << casereader::cases::CategoryToString(category) << ": " << reader_->Store(category).Size() << '\n';
    }
    out << "variables: " << reader_->Catalog().VariableNames().size();
    return out.str();
  }

  std::string Sources() const {
    std::ostringstream out;
    auto sources = reader_->ListSources();
    if (sources.empty()) {
      return "(empty)";
    }
    for (size_t i = 0; i < sources.size(); ++i) {
      out << (i > 0 ? "\n" : "") << sources[i];
    }
    return out.str();
  }

  std::string List(std::vector<std::string> args) const {
    bool recurse = false;
    if (!args.empty() && ToUpper(args.back()) == "RECURSE") {
      recurse = true;
      args.pop_back();
    }
    if (args.size() > 1) {
      return "(error) LIST takes at most one source";
    }
    std::string source = args.empty() ? "" : args[0];
    auto coordinates = reader_->ListCases(source, recurse);
    if (!coordinates) {
      return "(error) " + coordinates.error().to_string();
    }
    std::ostringstream out;
    out << "(" << coordinates->size() << " cases)";
    for (size_t i = 0; i < coordinates->size(); ++i) {
      out << '\n' << (i + 1) << ") " << (*coordinates)[i];
    }
    return out.str();
  }

  static void PrintNodes(const std::vector<casereader::hierarchy::CoordinateNode>& nodes, size_t depth,
                         std::ostringstream& out) {
    for (const auto& node : nodes) {
      out << '\n' << std::string(depth * 2, ' ') << node.value.coordinate << "  ["
          << casereader::cases::CategoryToString(node.value.category) << " #" << node.value.counter << "]";
      PrintNodes(node.children, depth + 1, out);
    }
  }

  std::string Tree(const std::vector<std::string>& args) const {
    if (args.size() > 1) {
      return "(error) TREE takes at most one source";
    }
    auto nodes = reader_->ListCasesNested(args.empty() ? "" : args[0], true);
    if (!nodes) {
      return "(error) " + nodes.error().to_string();
    }
    std::ostringstream out;
    out << "(" << nodes->size() << " top-level cases)";
    PrintNodes(*nodes, 0, out);
    return out.str();
  }

  static void PrintValues(const char* label, const std::optional<casereader::cases::VariableValues>& values,
                          std::ostringstream& out) {
    if (!values) {
      out << '\n' << label << ": (not recorded)";
      return;
    }
    out << '\n' << label << ":";
    for (const auto& [name, value] : values->Items()) {
      out << "\n  " << name << " = " << FormatArray(value);
    }
  }

  std::string ShowCase(const std::string& id, bool derivatives) {
    auto found = derivatives ? reader_->GetDerivativeCase(id) : reader_->GetCase(id);
    if (!found) {
      return "(error) " + found.error().to_string();
    }
    const Case& shown = **found;
    std::ostringstream out;
    out << "coordinate: " << shown.Coordinate() << '\n';
    out << "category: " << casereader::cases::CategoryToString(shown.GetCategory()) << '\n';
    out << "source: " << shown.Source() << '\n';
    out << "counter: " << shown.Counter() << '\n';
    out << "timestamp: " << shown.Timestamp() << '\n';
    out << "success: " << (shown.Success() ? "true" : "false") << '\n';
    out << "msg: " << shown.Message();
    if (shown.AbsErr()) {
      out << "\nabs_err: " << *shown.AbsErr();
    }
    if (shown.RelErr()) {
      out << "\nrel_err: " << *shown.RelErr();
    }

    if (derivatives) {
      if (!shown.GetJacobian()) {
        out << "\nderivatives: (not recorded)";
        return out.str();
      }
      out << "\nderivatives:";
      for (const auto& key : shown.GetJacobian()->Keys()) {
        auto comma = key.find(',');
        auto block = shown.GetJacobian()->Get(key.substr(0, comma), key.substr(comma + 1));
        if (block) {
          out << "\n  " << key << " = " << FormatArray(*block);
        }
      }
      return out.str();
    }

    switch (shown.GetCategory()) {
      case Category::kDriver:
        PrintValues("inputs", shown.Inputs(), out);
        PrintValues("outputs", shown.Outputs(), out);
        break;
      case Category::kProblem:
        PrintValues("outputs", shown.Outputs(), out);
        break;
      default:
        PrintValues("inputs", shown.Inputs(), out);
        PrintValues("outputs", shown.Outputs(), out);
        PrintValues("residuals", shown.Residuals(), out);
        break;
    }
    return out.str();
  }

  std::string SourceVars(const std::string& source) {
    auto vars = reader_->ListSourceVars(source);
    if (!vars) {
      return "(error) " + vars.error().to_string();
    }
    std::ostringstream out;
    auto print = [&out](const char* label, const std::vector<std::string>& names) {
      out << label << ":";
      for (const auto& name : names) {
        out << " " << name;
      }
    };
    print("inputs", vars->inputs);
    out << '\n';
    print("outputs", vars->outputs);
    out << '\n';
    print("residuals", vars->residuals);
    return out.str();
  }

  std::string Variables(bool outputs, const std::vector<std::string>& args) {
    casereader::reader::OutputListOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
      std::string arg = ToUpper(args[i]);
      if (arg == "EXPLICIT") {
        options.implicit_outputs = false;
      } else if (arg == "IMPLICIT") {
        options.explicit_outputs = false;
      } else if (arg == "TOL" && i + 1 < args.size()) {
        try {
          options.residuals_tol = std::stod(args[++i]);
        } catch (const std::exception&) {
          return "(error) Invalid tolerance: " + args[i];
        }
      } else {
        return "(error) Unknown option: " + args[i];
      }
    }

    auto listings = outputs ? reader_->ListOutputs(nullptr, options) : reader_->ListInputs();
    if (!listings) {
      return "(error) " + listings.error().to_string();
    }
    std::ostringstream out;
    out << "(" << listings->size() << " " << (outputs ? "outputs" : "inputs") << ")";
    for (const auto& listing : *listings) {
      out << '\n' << listing.name << " = " << FormatArray(listing.value) << " shape=" << FormatShape(listing.shape);
      if (listing.units) {
        out << " units=" << *listing.units;
      }
      if (outputs) {
        out << (listing.explicit_output ? " explicit" : " implicit");
        if (listing.residuals) {
          out << " resids=" << FormatArray(*listing.residuals);
        }
      }
    }
    return out.str();
  }

  std::string Meta(const std::vector<std::string>& args) const {
    if (args.empty()) {
      return "(error) META requires DRIVER, SYSTEM or SOLVER";
    }
    std::string kind = ToUpper(args[0]);
    casereader::utils::Expected<nlohmann::json, casereader::utils::Error> meta =
        casereader::utils::MakeUnexpected(casereader::utils::MakeError(casereader::utils::ErrorCode::kInvalidArgument,
                                                                       "Unknown metadata kind", args[0]));
    if (kind == "DRIVER") {
      meta = reader_->DriverMetadata();
    } else if ((kind == "SYSTEM" || kind == "SOLVER") && args.size() == 1) {
      auto ids = kind == "SYSTEM" ? reader_->Catalog().SystemMetadataIds() : reader_->Catalog().SolverMetadataIds();
      std::ostringstream out;
      out << "(" << ids.size() << " ids)";
      for (const auto& id : ids) {
        out << '\n' << id;
      }
      return out.str();
    } else if (kind == "SYSTEM") {
      meta = reader_->SystemMetadata(args[1]);
    } else if (kind == "SOLVER") {
      meta = reader_->SolverMetadata(args[1]);
    }
    if (!meta) {
      return "(error) " + meta.error().to_string();
    }
    return meta->dump(2);
  }

  std::string Cache(const std::vector<std::string>& args) {
    bool clear = !args.empty() && ToUpper(args[0]) == "CLEAR";
    std::ostringstream out;
    bool first = true;
    for (auto category : {Category::kDriver, Category::kDriverDerivative, Category::kSystem, Category::kSolver,
                          Category::kProblem}) {
      auto& store = reader_->Store(category);
      if (clear) {
        store.ClearCache();
        continue;
      }
      out << (first ? "" : "\n") << casereader::cases::CategoryToString(category) << ": " << store.CacheSize() << "/"
          << store.Size();
      first = false;
    }
    return clear ? "OK" : out.str();
  }

  std::unique_ptr<CaseReader> reader_;
};

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] <store.sqlite> [COMMAND]" << '\n';
  std::cout << '\n';
  std::cout << "Options:" << '\n';
  std::cout << "  -c FILE         YAML configuration file" << '\n';
  std::cout << "  --version       Show version" << '\n';
  std::cout << "  --help          Show this help" << '\n';
  std::cout << '\n';
  std::cout << "Examples:" << '\n';
  std::cout << "  " << program_name << " cases.sql                        # Interactive mode" << '\n';
  std::cout << "  " << program_name << " cases.sql SOURCES                # List sources" << '\n';
  std::cout << "  " << program_name << " cases.sql LIST driver            # Driver iterations" << '\n';
  std::cout << "  " << program_name << " cases.sql CASE 'rank0:SLSQP|3'   # Show one case" << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  // Line-buffered stdout so popen() callers capture output before exit
  std::setvbuf(stdout, nullptr, _IOLBF, 0);

  Config config;
  std::vector<std::string> command_args;

  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help") {
      PrintUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      return 0;
    }
    if (arg == "--version") {
      std::cout << "casereader-cli " << casereader::Version::String() << " (store formats 1-"
                << casereader::Version::MaxFormatVersion() << ")" << '\n';
      return 0;
    }
    if (arg == "-c") {
      if (i + 1 < argc) {
        config.config_path = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      } else {
        std::cerr << "Error: -c requires an argument" << '\n';
        return 1;
      }
    } else if (config.store_path.empty()) {
      config.store_path = arg;
    } else {
      // Remaining args are a command
      for (int j = i; j < argc; ++j) {
        command_args.emplace_back(argv[j]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      config.interactive = false;
      break;
    }
  }

  if (config.store_path.empty()) {
    PrintUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return 1;
  }

  casereader::config::Config app_config;
  if (!config.config_path.empty()) {
    auto loaded = casereader::config::LoadConfig(config.config_path);
    if (!loaded) {
      std::cerr << "Failed to load config: " << loaded.error().to_string() << '\n';
      return 1;
    }
    app_config = *loaded;
  } else {
    // Keep stdout clean for command output unless configured otherwise
    app_config.logging.level = "warn";
  }
  auto logging = casereader::config::ApplyLoggingConfig(app_config.logging);
  if (!logging) {
    std::cerr << "Failed to configure logging: " << logging.error().to_string() << '\n';
    return 1;
  }

  auto reader = CaseReader::Open(config.store_path, app_config.reader);
  if (!reader) {
    std::cerr << "Failed to open " << config.store_path << ": " << reader.error().to_string() << '\n';
    return 1;
  }

  CaseReaderShell shell(std::move(*reader));
  if (config.interactive) {
    shell.RunInteractive();
    return 0;
  }

  std::ostringstream command;
  for (size_t i = 0; i < command_args.size(); ++i) {
    if (i > 0) {
      command << " ";
    }
    command << command_args[i];
  }
  return shell.RunSingleCommand(command.str());
}
