#include "cli/registry.hpp"

int cmd_run(int argc, char **argv);
int cmd_scan(int argc, char **argv);
int cmd_install(int argc, char **argv);
int cmd_config(int argc, char **argv);
int cmd_automerge(int argc, char **argv);

namespace commitgate::cli {

void register_all_commands() {
  register_command("run", ::cmd_run,
                   "Run every check before a commit: commitgate run [--no-color] "
                   "[--message-file <path>]");
  register_command("scan", ::cmd_scan,
                   "Advisory checks on the staged changes only: commitgate scan [--no-color]");
  register_command("install", ::cmd_install,
                   "Install the pre-commit hook: commitgate install [--force]");
  register_command("config", ::cmd_config,
                   "Show the effective configuration, or write defaults: commitgate config "
                   "[--init]");
  register_command("automerge", ::cmd_automerge,
                   "Decide on a dependency-update PR: commitgate automerge <actor> <update-type>");
}

} // namespace commitgate::cli
