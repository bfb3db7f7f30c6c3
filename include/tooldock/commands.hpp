#ifndef TOOLDOCK_COMMANDS_HPP
#define TOOLDOCK_COMMANDS_HPP

#include "tooldock/config.hpp"
#include "tooldock/path_manager.hpp"
#include "tooldock/version_manager.hpp"
#include <functional>
#include <future>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tooldock {

// Front-end facing command surface. Each command takes a JSON object of
// camelCase arguments and answers with either
//   { "result": <value> }   or   { "error": { "kind": ..., "message": ... } }
class CommandDispatcher {
public:
  CommandDispatcher(Config &config, VersionManager &versions,
                    PathManager &paths);

  // Runs the command on the calling thread.
  nlohmann::json invoke(const std::string &command,
                        const nlohmann::json &args = nlohmann::json::object());

  // Runs the command as an independent task on the TaskRunner.
  std::future<nlohmann::json>
  dispatch(const std::string &command,
           nlohmann::json args = nlohmann::json::object());

  std::vector<std::string> commands() const;

private:
  using Handler = std::function<nlohmann::json(const nlohmann::json &)>;

  void registerHandlers();

  Config &config_;
  VersionManager &versions_;
  PathManager &paths_;
  std::map<std::string, Handler> handlers_;
};

} // namespace tooldock

#endif // TOOLDOCK_COMMANDS_HPP
