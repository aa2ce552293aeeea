// gita: manage many git repositories side by side.
//
//   gita add <path>...           register repositories
//   gita ll                      one status line per repository
//   gita fetch                   run `git fetch` in every repository
//   gita super repo1 commit -am "fix a bug"

#include <gita/gita.h>

#include <argparse/argparse.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#ifndef GITA_VERSION
#define GITA_VERSION "0.0.0"
#endif

namespace {

const char* const kLlDescription =
    "display summary of all repos\n\n"
    "  status symbols:\n"
    "    +: staged changes\n"
    "    *: unstaged changes\n"
    "    _: untracked files/folders\n\n"
    "  branch colors:\n"
    "    white: local has no remote\n"
    "    green: local is the same as remote\n"
    "    red: local has diverged from remote\n"
    "    purple: local is ahead of remote (good for push)\n"
    "    yellow: local is behind remote (good for merge)";

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

int run_command(gita::Registry& registry,
                const std::vector<std::string>& repos,
                const std::vector<std::string>& git_args,
                const std::set<std::string>& denylist) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), git_args.begin(), git_args.end());

    auto cmd = gita::make_command(registry.load(), repos, std::move(argv),
                                  denylist);
    gita::PosixRunner runner;
    gita::Dispatcher dispatcher(runner);
    auto result = dispatcher.run(cmd);
    GITA_LOG_DEBUG(std::to_string(result.invocations) + " git process(es), " +
                   std::to_string(result.failed.size()) + " retried");
    return 0;
}

void print_info() {
    auto in_use = gita::default_probe_names();
    std::cout << "In use: " << join(in_use, ",") << "\n";

    std::vector<std::string> unused;
    for (auto& n : gita::probe_names()) {
        if (std::find(in_use.begin(), in_use.end(), n) == in_use.end())
            unused.push_back(n);
    }
    if (!unused.empty()) std::cout << "Unused: " << join(unused, " ") << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    gita::Logger::instance().set_verbose(gita::config::verbose_from_env());

    gita::CommandTable commands;
    try {
        commands = gita::load_commands(gita::config::user_commands_file());
    } catch (const gita::GitaError& e) {
        std::cerr << "gita: " << e.what() << "\n";
        return 1;
    }

    argparse::ArgumentParser program("gita", GITA_VERSION);
    program.add_description(
        "Gita manages multiple git repos. It has two functionalities\n\n"
        "   1. display the status of multiple repos side by side\n"
        "   2. delegate git commands/aliases from any working directory");
    program.add_argument("--verbose")
        .help("enable debug logging")
        .default_value(false)
        .implicit_value(true);

    // bookkeeping sub-commands
    argparse::ArgumentParser add_cmd("add");
    add_cmd.add_description("add repo(s)");
    add_cmd.add_argument("paths")
        .help("add repo(s)")
        .nargs(argparse::nargs_pattern::at_least_one);

    argparse::ArgumentParser rm_cmd("rm");
    rm_cmd.add_description("remove repo(s)");
    rm_cmd.add_argument("repo")
        .help("remove the chosen repo(s)")
        .nargs(argparse::nargs_pattern::at_least_one);

    argparse::ArgumentParser rename_cmd("rename");
    rename_cmd.add_description("rename a repo");
    rename_cmd.add_argument("repo").help("rename the chosen repo");
    rename_cmd.add_argument("new_name").help("new name");

    argparse::ArgumentParser info_cmd("info");
    info_cmd.add_description("show information items of the ll sub-command");

    argparse::ArgumentParser ll_cmd("ll");
    ll_cmd.add_description(kLlDescription);

    argparse::ArgumentParser ls_cmd("ls");
    ls_cmd.add_description("display names of all repos, or path of a chosen repo");
    ls_cmd.add_argument("repo")
        .help("show path of the chosen repo")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string{});

    // superman mode
    argparse::ArgumentParser super_cmd("super");
    super_cmd.add_description(
        "superman mode: delegate any git command/alias in specified or all repo(s).\n"
        "Examples:\n"
        "    gita super myrepo1 commit -am \"fix a bug\"\n"
        "    gita super repo1 repo2 repo3 checkout new-feature");
    super_cmd.add_argument("man")
        .help("execute arbitrary git command/alias for specified or all repos")
        .remaining();

    program.add_subparser(add_cmd);
    program.add_subparser(rm_cmd);
    program.add_subparser(rename_cmd);
    program.add_subparser(info_cmd);
    program.add_subparser(ll_cmd);
    program.add_subparser(ls_cmd);
    program.add_subparser(super_cmd);

    // sub-commands that fit boilerplate
    std::vector<std::pair<const gita::CommandDef*,
                          std::unique_ptr<argparse::ArgumentParser>>> alias_cmds;
    const std::set<std::string> builtins{"add", "rm", "rename", "info",
                                         "ll", "ls", "super"};
    for (auto& [name, def] : commands) {
        if (builtins.count(name)) {
            GITA_LOG_WARN("alias '" + name + "' shadows a built-in sub-command, ignored");
            continue;
        }
        auto sp = std::make_unique<argparse::ArgumentParser>(name);
        std::string help = def.help;
        help += def.allow_all ? " for all repos or for the chosen repo(s)"
                              : " for the chosen repo(s)";
        sp->add_description(help);
        auto& repo_arg = sp->add_argument("repo").help(help);
        if (def.allow_all) {
            repo_arg.nargs(argparse::nargs_pattern::any)
                .default_value(std::vector<std::string>{});
        } else {
            repo_arg.nargs(argparse::nargs_pattern::at_least_one);
        }
        program.add_subparser(*sp);
        alias_cmds.emplace_back(&def, std::move(sp));
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << "gita: " << err.what() << "\n\n" << program;
        return 1;
    }

    if (program.get<bool>("--verbose"))
        gita::Logger::instance().set_verbose(true);

    gita::Registry registry(gita::PathStore(gita::config::repo_path_file()));
    auto denylist = gita::async_denylist(commands);

    try {
        if (program.is_subcommand_used(add_cmd)) {
            auto report = registry.add(add_cmd.get<std::vector<std::string>>("paths"));
            std::cout << report.summary() << "\n";
            return 0;
        }

        if (program.is_subcommand_used(rm_cmd)) {
            auto n = registry.remove(rm_cmd.get<std::vector<std::string>>("repo"));
            std::cout << "Removed " << n << " repo(s).\n";
            return 0;
        }

        if (program.is_subcommand_used(rename_cmd)) {
            auto from = rename_cmd.get<std::string>("repo");
            auto to   = rename_cmd.get<std::string>("new_name");
            registry.rename(from, to);
            std::cout << "Renamed " << from << " to " << to << ".\n";
            return 0;
        }

        if (program.is_subcommand_used(info_cmd)) {
            print_info();
            return 0;
        }

        if (program.is_subcommand_used(ll_cmd)) {
            gita::StatusAggregator status(::isatty(STDOUT_FILENO) == 1);
            status.describe(registry.load(), [](const std::string& line) {
                std::cout << line << "\n";
            });
            return 0;
        }

        if (program.is_subcommand_used(ls_cmd)) {
            auto repo = ls_cmd.get<std::string>("repo");
            if (!repo.empty()) {
                std::cout << registry.load().at(repo).string() << "\n";
            } else {
                std::cout << join(registry.load().names(), " ") << "\n";
            }
            return 0;
        }

        if (program.is_subcommand_used(super_cmd)) {
            std::vector<std::string> words;
            if (super_cmd.is_used("man"))
                words = super_cmd.get<std::vector<std::string>>("man");
            auto split = gita::split_super_args(registry.load(), words);
            if (split.args.empty()) {
                std::cerr << "gita: super: no git command given\n";
                return 1;
            }
            return run_command(registry, split.repos, split.args, denylist);
        }

        for (auto& [def, sp] : alias_cmds) {
            if (!program.is_subcommand_used(*sp)) continue;
            auto repos = sp->get<std::vector<std::string>>("repo");
            return run_command(registry, repos, def->cmd, denylist);
        }
    } catch (const gita::GitaError& e) {
        std::cerr << "gita: " << e.what() << "\n";
        return 1;
    }

    std::cout << program;
    return 0;
}
