#pragma once

/// @file config.h
/// Locations of gita's configuration files.

#include <filesystem>

namespace gita {
namespace config {

/// `$XDG_CONFIG_HOME`, or `~/.config` when unset or empty.
std::filesystem::path root();

/// `<root>/gita`: the directory holding every gita file.
std::filesystem::path dir();

/// `<root>/gita/repo_path`: the repository store.
std::filesystem::path repo_path_file();

/// `<root>/gita/cmds.yml`: user command aliases.
std::filesystem::path user_commands_file();

/// True when `GITA_VERBOSE` is set to a non-empty value other than "0".
bool verbose_from_env();

} // namespace config
} // namespace gita
