#include "tooldock/archive.hpp"
#include "tooldock/commands.hpp"
#include "tooldock/config.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/http.hpp"
#include "tooldock/logger.hpp"
#include "tooldock/path_manager.hpp"
#include "tooldock/platform.hpp"
#include "tooldock/task_runner.hpp"
#include "tooldock/version.hpp"
#include "tooldock/version_manager.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

void showHelp() {
  std::cout
      << "tooldock - tooling version manager for the game launcher\n\n"
      << "Usage: tooldock [flags] <command> [args...]\n\n"
      << "Commands:\n"
      << "  invoke <op> [json]  Run one operation, print the JSON response\n"
      << "  serve               Read JSON requests from stdin, one per line:\n"
      << "                        {\"id\": 1, \"command\": \"...\", \"args\": "
         "{...}}\n"
      << "  commands            List the available operations\n"
      << "  help                Show this help message\n\n"
      << "Flags:\n"
      << "  -v, --verbose          Echo all log output to stderr\n"
      << "  --config-dir <path>    Use <path> instead of the XDG config dir\n"
      << "  --version              Print the version\n";
}

namespace {

bool takeFlag(std::vector<std::string> &args, const std::string &shortName,
              const std::string &longName) {
  auto it = std::find_if(args.begin(), args.end(), [&](const std::string &a) {
    return a == shortName || a == longName;
  });
  if (it == args.end())
    return false;
  args.erase(it);
  return true;
}

std::string takeOption(std::vector<std::string> &args,
                       const std::string &name) {
  auto it = std::find(args.begin(), args.end(), name);
  if (it == args.end())
    return "";
  if (std::next(it) == args.end()) {
    throw tooldock::ConfigurationError("Missing value for " + name);
  }
  std::string value = *std::next(it);
  args.erase(it, std::next(it, 2));
  return value;
}

int runInvoke(tooldock::CommandDispatcher &dispatcher,
              const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "invoke needs an operation name, see 'tooldock commands'\n";
    return 2;
  }

  json params = json::object();
  if (args.size() > 2) {
    params = json::parse(args[2], nullptr, false);
    if (params.is_discarded() || !params.is_object()) {
      std::cerr << "Arguments must be a JSON object\n";
      return 2;
    }
  }

  json response = dispatcher.dispatch(args[1], params).get();
  std::cout << response.dump() << std::endl;
  return response.contains("error") ? 1 : 0;
}

// Requests run concurrently; responses are written in the order the
// requests arrived.
int runServe(tooldock::CommandDispatcher &dispatcher) {
  LOG_INFO("Serving requests on stdin");
  std::vector<std::pair<json, std::future<json>>> inflight;

  auto flushReady = [&](bool wait) {
    while (!inflight.empty()) {
      auto &[id, fut] = inflight.front();
      if (!wait && fut.wait_for(std::chrono::seconds(0)) !=
                       std::future_status::ready) {
        return;
      }
      json response = fut.get();
      response["id"] = id;
      std::cout << response.dump() << std::endl;
      inflight.erase(inflight.begin());
    }
  };

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty())
      continue;

    json request = json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object() ||
        !request.contains("command") || !request["command"].is_string()) {
      json response = {{"id", nullptr},
                       {"error",
                        {{"kind", tooldock::errorKindLabel(
                                      tooldock::ErrorKind::Configuration)},
                         {"message", "Malformed request"}}}};
      flushReady(true);
      std::cout << response.dump() << std::endl;
      continue;
    }

    json id = request.value("id", json(nullptr));
    json params = request.value("args", json::object());
    inflight.emplace_back(
        id, dispatcher.dispatch(request["command"].get<std::string>(), params));
    flushReady(false);
  }

  flushReady(true);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty()) {
      args.push_back(arg);
    }
  }

  if (args.empty() || args[0] == "help" || args[0] == "--help" ||
      args[0] == "-h") {
    showHelp();
    return args.empty() ? 2 : 0;
  }

  if (args[0] == "--version" || args[0] == "-version") {
    std::cout << "tooldock v" << tooldock::TOOLDOCK_VERSION_STRING << "\n";
    return 0;
  }

  bool verbose = takeFlag(args, "-v", "--verbose");

  try {
    std::string configDir = takeOption(args, "--config-dir");

    auto &pathMgr = tooldock::PathManager::instance();
    pathMgr.init(configDir);

    if (!tooldock::Logger::instance().init(pathMgr.currentLog(), verbose)) {
      std::cerr << "tooldock: continuing without a log file\n";
    }
    LOG_INFO("=== tooldock boot, config dir " + pathMgr.configDir().string() +
             " ===");
    LOG_INFO(std::string("Host platform: ") +
             tooldock::hostPlatformLabel(tooldock::hostPlatform()));

    auto &config = tooldock::Config::instance();
    config.load(pathMgr.settingsFile());

    tooldock::HttpFetcher fetcher([](size_t current, size_t total) {
      LOG_DEBUG("Downloaded " + std::to_string(current) + "/" +
                std::to_string(total) + " bytes");
    });
    tooldock::ArchiveExtractor extractor;
    tooldock::DesktopFolderOpener opener;
    tooldock::VersionManager versions(config, fetcher, extractor, opener);
    tooldock::CommandDispatcher dispatcher(config, versions, pathMgr);

    if (args.empty()) {
      showHelp();
      return 2;
    }

    int status = 2;
    if (args[0] == "invoke") {
      status = runInvoke(dispatcher, args);
    } else if (args[0] == "serve") {
      status = runServe(dispatcher);
    } else if (args[0] == "commands") {
      for (const auto &name : dispatcher.commands()) {
        std::cout << name << "\n";
      }
      status = 0;
    } else {
      std::cerr << "Unknown command '" << args[0] << "'\n\n";
      showHelp();
    }

    tooldock::TaskRunner::instance().shutdown();
    tooldock::Logger::instance().shutdown();
    return status;
  } catch (const tooldock::Error &e) {
    LOG_ERROR(std::string("Fatal: ") + e.what());
    std::cerr << "tooldock: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("Fatal: unexpected error: ") + e.what());
    std::cerr << "tooldock: " << e.what() << std::endl;
    return 1;
  }
}
