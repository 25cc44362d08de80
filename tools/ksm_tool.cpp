#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client_config.h"
#include "config_store.h"
#include "platform_log.h"
#include "secrets_client.h"

namespace {

struct Options {
  std::string config_path{"ksm.ini"};
  std::string token;
  std::string command;
  std::vector<std::string> args;
  bool show_help{false};
};

void PrintUsage() {
  std::cout
      << "Usage: ksm_tool [--config PATH] [--token TOKEN] COMMAND [ARGS]\n"
         "  --config PATH   Host settings (default: ./ksm.ini)\n"
         "  --token TOKEN   One-time access token, redeemed on first use\n"
         "Commands:\n"
         "  list                    Print uid and title of every record\n"
         "  get NOTATION            Print the values a notation resolves to\n"
         "  set NOTATION VALUE      Write a field value and save the record\n"
         "  export                  Print the device config as base64\n";
}

bool ParseArgs(int argc, char** argv, Options& out, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      out.show_help = true;
      return true;
    }
    if (arg == "--config" || arg == "--token") {
      if (i + 1 >= argc) {
        error = arg + " requires a value";
        return false;
      }
      (arg == "--config" ? out.config_path : out.token) = argv[++i];
      continue;
    }
    if (out.command.empty()) {
      out.command = arg;
    } else {
      out.args.push_back(arg);
    }
  }
  if (out.command.empty()) {
    error = "missing command";
    return false;
  }
  const std::size_t want = out.command == "get"   ? 1
                           : out.command == "set" ? 2
                                                  : 0;
  if (out.command != "list" && out.command != "get" && out.command != "set" &&
      out.command != "export") {
    error = "unknown command: " + out.command;
    return false;
  }
  if (out.args.size() != want) {
    error = out.command + " takes " + std::to_string(want) + " argument(s)";
    return false;
  }
  return true;
}

void LogError(const std::string& msg) {
  std::cerr << "[ksm_tool] " << msg << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  std::string error;
  if (!ParseArgs(argc, argv, opt, error)) {
    LogError(error);
    PrintUsage();
    return 2;
  }
  if (opt.show_help) {
    PrintUsage();
    return 0;
  }

  ksm::core::ClientConfig cfg;
  if (!ksm::core::LoadClientConfig(opt.config_path, cfg, error)) {
    LogError(error);
    return 1;
  }
  ksm::platform::log::SetMinLevel(cfg.log_level);

  auto store = std::make_shared<ksm::core::ConfigStore>(
      ksm::core::JsonFileBackend{cfg.config_file});
  ksm::core::Error err;
  if (!store->Load(err)) {
    LogError(err.ToString());
    return 1;
  }
  if (opt.command == "export") {
    std::cout << store->ExportBase64() << "\n";
    return 0;
  }

  ksm::core::SecretsClientOptions options =
      ksm::core::MakeClientOptions(cfg, store);
  if (!opt.token.empty()) {
    options.token = opt.token;
  }
  ksm::core::SecretsClient client(std::move(options));
  if (!client.Init(err)) {
    LogError(err.ToString());
    return 1;
  }

  if (opt.command == "list") {
    ksm::core::RecordGraph graph;
    if (!client.GetSecrets({}, graph, err)) {
      LogError(err.ToString());
      return 1;
    }
    for (const auto& record : graph.records()) {
      std::cout << record.uid << "\t" << record.Title() << "\n";
    }
    return 0;
  }
  if (opt.command == "get") {
    std::optional<std::vector<std::string>> values;
    if (!client.GetNotation(opt.args[0], values, err)) {
      LogError(err.ToString());
      return 1;
    }
    if (!values) {
      LogError("no value");
      return 3;
    }
    for (const auto& value : *values) {
      std::cout << value << "\n";
    }
    return 0;
  }
  if (!client.SetNotationValue(opt.args[0], opt.args[1], err)) {
    LogError(err.ToString());
    return 1;
  }
  return 0;
}
