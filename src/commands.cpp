#include "gita/commands.h"
#include "gita/error.h"
#include "gita/log.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace gita {

namespace {

// Bundled alias table.
const char* const kDefaultCommands = R"(
br:
  cmd: branch -vv
  help: show local branches
clean:
  cmd: clean -dfx
  help: remove all untracked files/folders
diff:
  help: show differences
difftool:
  disable_async: true
  help: show differences using a tool
fetch:
  allow_all: true
  help: fetch remote update
log:
  help: show commit history
merge:
  cmd: merge @{u}
  help: merge remote updates
mergetool:
  disable_async: true
  help: merge updates with a tool
patch:
  cmd: format-patch HEAD~
  help: make a patch
pull:
  allow_all: true
  help: pull remote updates
push:
  help: push the local updates
rebase:
  cmd: rebase @{u}
  help: rebase from remote
reflog:
  help: show ref logs
remote:
  cmd: remote -v
  help: show remote settings
reset:
  help: unstage files
show:
  cmd: show --name-status
  help: show detailed commit information
stash:
  help: store uncommitted changes
stat:
  cmd: diff --stat
  help: show edit statistics
st:
  cmd: status
  help: show status
)";

bool read_bool(const YAML::Node& node, const std::string& where) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigError(where + ": expected true or false");
    }
}

CommandDef parse_entry(const std::string& name, const YAML::Node& node,
                       const std::string& source) {
    CommandDef def;
    def.name = name;
    def.cmd  = {name};

    if (node.IsNull()) return def;
    if (!node.IsMap()) {
        throw ConfigError(source + ": entry '" + name + "' must be a mapping");
    }

    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        std::string where = source + ": " + name + "." + key;

        if (key == "cmd") {
            if (value.IsSequence()) {
                def.cmd.clear();
                for (auto& w : value) def.cmd.push_back(w.as<std::string>());
            } else if (value.IsScalar()) {
                def.cmd = split_words(value.as<std::string>());
            } else {
                throw ConfigError(where + ": expected a string or a list");
            }
            if (def.cmd.empty()) throw ConfigError(where + ": empty command");
        } else if (key == "help") {
            def.help = value.as<std::string>();
        } else if (key == "allow_all") {
            def.allow_all = read_bool(value, where);
        } else if (key == "disable_async") {
            def.disable_async = read_bool(value, where);
        } else {
            GITA_LOG_WARN(where + ": unknown key ignored");
        }
    }
    return def;
}

} // anonymous namespace

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

CommandTable parse_commands(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(source + ": " + e.what());
    }

    CommandTable table;
    if (!root || root.IsNull()) return table;
    if (!root.IsMap()) {
        throw ConfigError(source + ": top level must be a mapping");
    }

    try {
        for (auto it = root.begin(); it != root.end(); ++it) {
            auto name = it->first.as<std::string>();
            table[name] = parse_entry(name, it->second, source);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(source + ": " + e.what());
    }
    return table;
}

CommandTable load_command_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return {};

    std::ifstream in(path);
    if (!in) throw IoError("cannot read " + path.string());
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_commands(ss.str(), path.string());
}

CommandTable default_commands() {
    return parse_commands(kDefaultCommands, "<bundled cmds.yml>");
}

CommandTable merge_commands(CommandTable defaults, const CommandTable& user) {
    for (auto& [name, def] : user) defaults[name] = def;
    return defaults;
}

CommandTable load_commands(const std::filesystem::path& user_file) {
    auto user = load_command_file(user_file);
    if (!user.empty()) {
        GITA_LOG_DEBUG("loaded " + std::to_string(user.size()) +
                       " command(s) from " + user_file.string());
    }
    return merge_commands(default_commands(), user);
}

std::set<std::string> async_denylist(const CommandTable& table) {
    std::set<std::string> out;
    for (auto& [name, def] : table) {
        if (!def.disable_async) continue;
        out.insert(name);
        if (!def.cmd.empty()) out.insert(def.cmd.front());
    }
    return out;
}

} // namespace gita
