#pragma once
#include "gitstack/config.hpp"
#include "gitstack/forge.hpp"
#include "gitstack/git_cli.hpp"
#include "gitstack/log.hpp"
#include "gitstack/service.hpp"
#include "gitstack/state.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace gitstack::cli {

// Everything a command needs: the repository in the current directory,
// its settings, the branch store and the service over both.
class Session {
  struct Token {
    explicit Token() = default;
  };
  struct Env {
    GitCli repo;
    Settings settings;
    log::logger_t log;
  };

public:
  // Throws UninitializedError when `gitstack init` never ran.
  static std::unique_ptr<Session> open();

  static std::unique_ptr<Session> init(const std::string &trunk, const std::string &remote,
                                       bool reset);

  // Reachable only through open() and init().
  Session(Token, Env env, state::Store store);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  GitCli &repo() { return repo_; }
  state::Store &store() { return store_; }
  Service &service() { return service_; }
  const Settings &settings() const { return settings_; }
  const log::logger_t &log() const { return log_; }

  // From settings, or whether stdin is a terminal.
  [[nodiscard]] bool interactive() const;

private:
  static Env open_env();

  GitCli repo_;
  Settings settings_;
  log::logger_t log_;
  forge::Registry forges_;
  state::Store store_;
  Service service_;
};

// Run a command body against an open session.
// Errors are printed as "<name>: <what>" and turn into exit status 1.
// A rebase interruption records argv as the command to resume.
int run(std::string_view name, int argc, char **argv,
        const std::function<int(Session &)> &body);

} // namespace gitstack::cli
