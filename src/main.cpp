#include <fstream>
#include <sstream>
#include <iostream>
#include <exception>

#include <fmt/core.h>
#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <msb/sandbox.h>

namespace {

msb::SandboxOptions options;
msb::StartOptions start_options;
std::shared_ptr<const msb::Language> language;
std::string source_path;
std::vector<std::string> shell_command;
bool print_metrics = false;

bool ParseConfig(const std::string& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string server_url = ini[""]["server_url"] | "";
  std::string api_key = ini[""]["api_key"] | "";
  std::string namespace_name = ini[""]["namespace"] | "";
  if (server_url.size()) options.server_url = server_url;
  if (api_key.size()) options.api_key = api_key;
  if (namespace_name.size()) options.namespace_name = namespace_name;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "msb-run");
  parser.add_argument("source")
    .default_value(std::string("-"))
    .help("Code file to run; - for stdin");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-l", "--language")
    .default_value(std::string("python"))
    .help("python or node");
  parser.add_argument("--server-url")
    .help("Sandbox server URL (default: $MSB_SERVER_URL or http://127.0.0.1:5555)");
  parser.add_argument("--api-key")
    .help("API key (default: $MSB_API_KEY)");
  parser.add_argument("--namespace")
    .help("Sandbox namespace (default: $MSB_NAMESPACE or \"default\")");
  parser.add_argument("--name")
    .help("Sandbox name (default: random)");
  parser.add_argument("--image")
    .help("Image to start (default: the language's image)");
  parser.add_argument("--memory")
    .scan<'d', int>()
    .help("Memory limit in MiB");
  parser.add_argument("--cpus")
    .scan<'g', double>()
    .help("Number of CPUs; rounded to the nearest integer");
  parser.add_argument("--metrics")
    .default_value(false)
    .implicit_value(true)
    .help("Print sandbox metrics after running");
  parser.add_argument("--shell")
    .remaining()
    .help("Run a shell command with arguments instead of code");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(1);
    }
  }
  if (auto val = parser.present("--server-url")) options.server_url = *val;
  if (auto val = parser.present("--api-key")) options.api_key = *val;
  if (auto val = parser.present("--namespace")) options.namespace_name = *val;
  if (auto val = parser.present("--name")) options.sandbox_name = *val;
  if (auto val = parser.present("--image")) start_options.image = *val;
  if (auto val = parser.present<int>("--memory")) start_options.memory = *val;
  if (auto val = parser.present<double>("--cpus")) start_options.cpus = *val;

  std::string lang_name = parser.get<std::string>("--language");
  language = msb::LanguageFromName(lang_name);
  if (!language) {
    spdlog::error("Unknown language {}", lang_name);
    exit(1);
  }
  source_path = parser.get<std::string>("source");
  print_metrics = parser["--metrics"] == true;
  if (auto val = parser.present<std::vector<std::string>>("--shell")) shell_command = *val;
}

bool ReadSource(std::string& code) {
  std::stringstream buf;
  if (source_path == "-") {
    buf << std::cin.rdbuf();
  } else {
    std::ifstream fin(source_path);
    if (!fin) return false;
    buf << fin.rdbuf();
  }
  code = buf.str();
  return true;
}

void LogError(const std::exception& err, int depth = 0) {
  spdlog::error("{}{}", depth ? "caused by: " : "", err.what());
  try {
    std::rethrow_if_nested(err);
  } catch (const std::exception& nested) {
    LogError(nested, depth + 1);
  }
}

int RunOnce(msb::Sandbox& sandbox) {
  if (shell_command.size()) {
    std::vector<std::string> args(shell_command.begin() + 1, shell_command.end());
    auto res = sandbox.Command(shell_command[0], args);
    fmt::print(stdout, "{}", res.stdout_text);
    fmt::print(stderr, "{}", res.stderr_text);
    if (res.IsSuccess()) return 0;
    // keep a failing status nonzero after truncation
    int status = static_cast<int>(res.exit_code & 0xff);
    return status ? status : 1;
  }
  std::string code;
  if (!ReadSource(code)) {
    spdlog::error("Failed to read {}", source_path);
    return 1;
  }
  auto execution = sandbox.Run(code);
  std::string out = execution.Output();
  if (out.size()) fmt::print(stdout, "{}\n", out);
  std::string err = execution.Error();
  if (err.size()) fmt::print(stderr, "{}\n", err);
  return execution.HasError() ? 1 : 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  ParseArgs(argc, argv);
  try {
    msb::SandboxSession session(language, options, start_options);
    int ret = RunOnce(*session);
    if (print_metrics) {
      auto metrics = session->Metrics();
      fmt::print(stderr, "{}/{} running={} cpu={}% memory={} disk={} network={}\n",
          metrics.namespace_name, metrics.name, metrics.running, metrics.cpu_usage,
          metrics.memory_usage, metrics.disk_usage, metrics.network_usage);
    }
    session.Close();
    return ret;
  } catch (const msb::Error& err) {
    LogError(err);
    return 1;
  }
}
