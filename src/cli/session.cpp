#include "cli/session.hpp"

#include "gitstack/errors.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include <unistd.h>

namespace gitstack::cli {

Session::Env Session::open_env() {
  auto repo = GitCli::open(std::filesystem::current_path());
  auto settings = load_settings(repo.common_dir());

  auto level = log::parse_level(settings.log_level);
  if (!level) {
    std::cerr << "gitstack: unknown log level '" << settings.log_level << "', using info\n";
    level = spdlog::level::info;
  }
  auto logger = log::make_logger("gitstack", *level);

  // Reopen with logging now that the level is known.
  return Env{.repo = GitCli::open(repo.root(), logger), .settings = std::move(settings),
             .log = std::move(logger)};
}

Session::Session(Token, Env env, state::Store store)
    : repo_(std::move(env.repo)), settings_(std::move(env.settings)), log_(std::move(env.log)),
      forges_(forge::Registry::with_builtin()), store_(std::move(store)),
      service_(repo_, store_, forges_, log_) {}

std::unique_ptr<Session> Session::open() {
  auto env = open_env();
  auto backend =
      std::make_shared<state::ObjectBackend>(state::ObjectBackend::root_for(env.repo.common_dir()));
  auto store = state::Store::open(std::move(backend), env.log);
  return std::make_unique<Session>(Token{}, std::move(env), std::move(store));
}

std::unique_ptr<Session> Session::init(const std::string &trunk, const std::string &remote,
                                       bool reset) {
  auto env = open_env();
  // The trunk must be a real branch.
  (void)env.repo.peel_to_commit(trunk);

  auto backend =
      std::make_shared<state::ObjectBackend>(state::ObjectBackend::root_for(env.repo.common_dir()));
  auto store = state::Store::init(state::Store::InitRequest{
      .backend = std::move(backend),
      .trunk = trunk,
      .remote = remote,
      .reset = reset,
      .log = env.log,
  });
  return std::make_unique<Session>(Token{}, std::move(env), std::move(store));
}

bool Session::interactive() const {
  return settings_.interactive.value_or(::isatty(STDIN_FILENO) == 1);
}

int run(std::string_view name, int argc, char **argv,
        const std::function<int(Session &)> &body) {
  std::unique_ptr<Session> session;
  try {
    session = Session::open();
    return body(*session);
  } catch (const RebaseInterruptedError &e) {
    if (session) {
      try {
        session->service().rebase_rescue(
            e, RebaseRescueRequest{.command = std::vector<std::string>(argv, argv + argc)});
      } catch (const std::exception &rescue) {
        std::cerr << name << ": " << rescue.what() << "\n";
      }
    }
    std::cerr << name << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << name << ": " << e.what() << "\n";
    return 1;
  }
}

} // namespace gitstack::cli
