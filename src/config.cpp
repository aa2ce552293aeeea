#include "gita/config.h"

#include <cstdlib>
#include <string>

namespace gita {
namespace config {

namespace {
std::string env(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}
} // anonymous namespace

std::filesystem::path root() {
    auto xdg = env("XDG_CONFIG_HOME");
    if (!xdg.empty()) return xdg;

    auto home = env("HOME");
    if (home.empty()) home = ".";
    return std::filesystem::path(home) / ".config";
}

std::filesystem::path dir() {
    return root() / "gita";
}

std::filesystem::path repo_path_file() {
    return dir() / "repo_path";
}

std::filesystem::path user_commands_file() {
    return dir() / "cmds.yml";
}

bool verbose_from_env() {
    auto v = env("GITA_VERBOSE");
    return !v.empty() && v != "0";
}

} // namespace config
} // namespace gita
