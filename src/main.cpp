#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/config.h>
#include <runbox/executor.h>
#include <runbox/logger.h>
#include <runbox/paths.h>
#include <runbox/toolchain.h>
#include <runbox/utils.h>

namespace {

struct Arguments {
  bool to_lock = true;
  bool list_languages = false;
  fs::path config_file;
  fs::path source_file;
  std::string stdin_file;
  std::string language;
  LimitOverride limits;
};

Arguments ParseArgs(int argc, char** argv) {
  Arguments args;
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox");
  parser.add_argument("source")
    .nargs(argparse::nargs_pattern::optional)
    .default_value(std::string(""))
    .help("Source file to compile and run");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/runbox.conf"))
    .help("Path of configuration file (built-in defaults are used if it does not exist)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-l", "--language")
    .default_value(std::string(""))
    .help("Language of the source file (detected from the extension if omitted)");
  parser.add_argument("-i", "--input")
    .default_value(std::string(""))
    .help("File whose content is fed to the program as stdin (\"-\" for our own stdin)");
  parser.add_argument("--wall-time")
    .scan<'d', long>()
    .help("Wall clock time limit in milliseconds");
  parser.add_argument("--cpu-time")
    .scan<'d', long>()
    .help("CPU time limit in milliseconds");
  parser.add_argument("--memory")
    .scan<'d', long>()
    .help("Memory limit in MiB");
  parser.add_argument("--max-output")
    .scan<'d', long>()
    .help("Captured bytes per output stream");
  parser.add_argument("--list-languages")
    .default_value(false)
    .implicit_value(true)
    .help("Print the available languages and exit");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  args.config_file = parser.get<std::string>("--config");
  args.source_file = parser.get<std::string>("source");
  args.stdin_file = parser.get<std::string>("--input");
  args.language = parser.get<std::string>("--language");
  args.list_languages = parser["--list-languages"] == true;
  args.to_lock = parser["--no-lock"] == false;
  if (auto val = parser.present<long>("--wall-time")) args.limits.wall_time = val.value() * 1000;
  if (auto val = parser.present<long>("--cpu-time")) args.limits.cpu_time = val.value() * 1000;
  if (auto val = parser.present<long>("--memory")) args.limits.memory = val.value() * 1024;
  if (auto val = parser.present<long>("--max-output")) args.limits.max_output = val.value();
  if (!args.list_languages && args.source_file.empty()) {
    std::cerr << "No source file given" << std::endl;
    std::cerr << parser;
    exit(1);
  }
  return args;
}

bool ReadFile(std::istream& fin, std::string& out) {
  out.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return !fin.bad();
}

bool ReadFile(const fs::path& path, std::string& out) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  return ReadFile(fin, out);
}

bool LockFile() {
  std::error_code ec;
  fs::create_directories(kBoxRoot, ec);
  fs::path lock_file = kBoxRoot / "lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  Arguments args = ParseArgs(argc, argv);

  ServiceConfig config;
  ToolchainRegistry registry = BuiltinRegistry();
  if (std::error_code ec; fs::exists(args.config_file, ec)) {
    if (!LoadConfig(args.config_file, config, registry)) {
      spdlog::error("Failed to parse configuration file {}", args.config_file.c_str());
      return 1;
    }
  } else {
    spdlog::info("Configuration file {} not found; using defaults", args.config_file.c_str());
  }

  if (args.list_languages) {
    nlohmann::json langs = nlohmann::json::array();
    for (auto& name : registry.Languages()) {
      auto& spec = registry.Find(name)->Spec();
      langs.push_back({
        {"name", name},
        {"extension", spec.extension},
        {"compiled", !spec.compile_command.empty()},
        {"limits", {
          {"wall_time_ms", spec.run_limits.wall_time / 1000},
          {"cpu_time_ms", spec.run_limits.cpu_time / 1000},
          {"memory_kib", spec.run_limits.memory},
          {"max_processes", spec.run_limits.max_processes},
          {"max_output_bytes", spec.run_limits.max_output},
        }},
      });
    }
    std::cout << langs.dump(2) << std::endl;
    return 0;
  }

  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  std::string language = args.language;
  if (language.empty()) {
    auto detected = registry.DetectLanguage(args.source_file);
    if (!detected) {
      spdlog::error("Cannot detect the language of {}; use --language", args.source_file.c_str());
      return 1;
    }
    language = *detected;
  }
  std::string source, input;
  if (!ReadFile(args.source_file, source)) {
    spdlog::error("Failed to read {}", args.source_file.c_str());
    return 1;
  }
  if (args.stdin_file == "-") {
    if (!ReadFile(std::cin, input)) {
      spdlog::error("Failed to read stdin");
      return 1;
    }
  } else if (args.stdin_file.size() && !ReadFile(fs::path(args.stdin_file), input)) {
    spdlog::error("Failed to read {}", args.stdin_file);
    return 1;
  }
  if (args.to_lock && !LockFile()) {
    spdlog::error("Another runbox instance is using {}.", kBoxRoot.c_str());
    return 1;
  }

  Executor executor(std::move(config), std::move(registry));
  ExecutionResponse resp = executor.Execute(language, std::move(source), std::move(input), args.limits);
  if (resp.Ok()) {
    spdlog::info("{}: {}", ExecStatusName(resp.result.status), ExecStatusToDesc(resp.result.status));
  } else {
    spdlog::info("{}: {}", ExecErrorName(resp.error), resp.message);
  }
  std::cout << ToJson(resp).dump(2) << std::endl;
  return resp.Ok() ? 0 : 2;
}
