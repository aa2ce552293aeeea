#include "gita/path_store.h"
#include "gita/error.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace gita {

namespace {

void ensure_parent(const std::filesystem::path& file) {
    auto parent = file.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw IoError("cannot create directory " + parent.string() + ": " +
                      ec.message());
    }
}

bool has_forbidden(const std::string& s) {
    return s.find_first_of(",\n\r") != std::string::npos;
}

} // anonymous namespace

PathStore::PathStore(std::filesystem::path file) : file_(std::move(file)) {}

bool PathStore::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_, ec);
}

StoreRecord PathStore::parse_line(const std::string& line, size_t line_no) {
    StoreRecord rec;
    rec.line_no = line_no;
    rec.text    = line;

    auto comma = line.find(',');
    if (comma == std::string::npos ||
        line.find(',', comma + 1) != std::string::npos) {
        rec.malformed = true;
        return rec;
    }
    rec.path = line.substr(0, comma);
    rec.name = line.substr(comma + 1);
    rec.malformed = rec.path.empty() || rec.name.empty();
    return rec;
}

std::vector<StoreRecord> PathStore::read() const {
    std::vector<StoreRecord> out;
    if (!exists()) return out;

    std::ifstream in(file_);
    if (!in) {
        throw IoError("cannot read " + file_.string() + ": " +
                      std::strerror(errno));
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        // rstrip
        auto end = line.find_last_not_of(" \t\r\n");
        if (end == std::string::npos) continue; // blank line
        line.erase(end + 1);
        out.push_back(parse_line(line, line_no));
    }
    if (in.bad()) {
        throw IoError("error reading " + file_.string());
    }
    return out;
}

std::string PathStore::format_line(const RepoEntry& entry) {
    return entry.path.string() + "," + entry.name + "\n";
}

void PathStore::validate(const RepoEntry& entry) {
    if (entry.name.empty()) {
        throw InvalidNameError("repository name must not be empty");
    }
    if (has_forbidden(entry.name)) {
        throw InvalidNameError("'" + entry.name +
                               "' contains ',' or a line break");
    }
    if (entry.path.empty()) {
        throw InvalidNameError("repository path must not be empty");
    }
    if (has_forbidden(entry.path.string())) {
        throw InvalidNameError("path '" + entry.path.string() +
                               "' contains ',' or a line break");
    }
}

void PathStore::append(const std::vector<RepoEntry>& entries) {
    for (auto& e : entries) validate(e);
    if (entries.empty()) return;

    ensure_parent(file_);
    std::ofstream out(file_, std::ios::app);
    if (!out) {
        throw IoError("cannot open " + file_.string() + ": " +
                      std::strerror(errno));
    }
    for (auto& e : entries) out << format_line(e);
    out.flush();
    if (!out) throw IoError("error writing " + file_.string());
}

void PathStore::rewrite(const RepoMap& repos,
                        const std::vector<StoreRecord>& kept) {
    for (auto& e : repos) validate(e);

    ensure_parent(file_);
    auto tmp = file_;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw IoError("cannot open " + tmp.string() + ": " +
                          std::strerror(errno));
        }
        for (auto& e : repos) out << format_line(e);
        for (auto& r : kept) out << r.text << '\n';
        out.flush();
        if (!out) {
            std::error_code ignore;
            std::filesystem::remove(tmp, ignore);
            throw IoError("error writing " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        throw IoError("cannot replace " + file_.string() + ": " + ec.message());
    }
}

} // namespace gita
