#pragma once

/// @file commands.h
/// Git command aliases: the bundled table merged with the user's cmds.yml.

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gita {

/// One alias, e.g. `st` → `git status`.
struct CommandDef {
    std::string              name;
    std::vector<std::string> cmd;  ///< git arguments; defaults to {name}.
    std::string              help;
    bool allow_all     = false; ///< An empty repository list means "all".
    bool disable_async = false; ///< Never run concurrently (may prompt).
};

using CommandTable = std::map<std::string, CommandDef>;

/// Parse a command file.
///
/// The document is a mapping of alias name to a mapping with optional
/// keys `cmd` (string split on whitespace, or a sequence), `help`,
/// `allow_all` and `disable_async`.  An empty document is an empty table.
/// @param text    YAML source.
/// @param source  Name used in error messages.
/// @throws ConfigError on malformed input.
CommandTable parse_commands(const std::string& text,
                            const std::string& source = "<string>");

/// Parse the file at `path`; a missing file yields an empty table.
/// @throws ConfigError on malformed input.
/// @throws IoError if the file exists but cannot be read.
CommandTable load_command_file(const std::filesystem::path& path);

/// The bundled alias table.
CommandTable default_commands();

/// `defaults` with every entry of `user` added; a user entry replaces the
/// default entry of the same name as a whole.
CommandTable merge_commands(CommandTable defaults, const CommandTable& user);

/// default_commands() merged with the user file at `user_file`.
CommandTable load_commands(const std::filesystem::path& user_file);

/// Verbs that must not run concurrently: the name and the git verb of
/// every alias with `disable_async`.
std::set<std::string> async_denylist(const CommandTable& table);

/// Split `s` on runs of whitespace.
std::vector<std::string> split_words(const std::string& s);

} // namespace gita
