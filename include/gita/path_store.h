#pragma once

/// @file path_store.h
/// The persisted repository list: one `path,name` line per repository.

#include "types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace gita {

/// One non-blank line of the store file.
struct StoreRecord {
    size_t      line_no = 0;     ///< 1-based line number in the file.
    std::string path;            ///< Text before the comma.
    std::string name;            ///< Text after the comma.
    bool        malformed = false; ///< Not exactly `path,name`.
    std::string text;            ///< The line as read, trailing whitespace stripped.
};

/// Durable name → path mapping backed by a flat line-oriented file.
///
/// No locking: concurrent edits by another process are not guarded.
class PathStore {
public:
    explicit PathStore(std::filesystem::path file);

    /// Location of the store file.
    const std::filesystem::path& file() const { return file_; }

    /// True if the store file exists.
    bool exists() const;

    /// Parse every non-blank line.  A missing file yields no records.
    /// Malformed lines are returned with `malformed = true`.
    /// @throws IoError if the file exists but cannot be read.
    std::vector<StoreRecord> read() const;

    /// Append `entries` to the end of the file, creating it (and its
    /// parent directory) if needed.
    /// @throws InvalidNameError if an entry cannot be stored.
    /// @throws IoError on write failures.
    void append(const std::vector<RepoEntry>& entries);

    /// Replace the whole file with `repos`, in iteration order, followed
    /// by the text of every record in `kept` (lines that stay on disk but
    /// are absent from the active view), written back unchanged.
    ///
    /// The new content is written to a temporary file in the same
    /// directory and renamed over the store, so readers never observe a
    /// half-written file.
    /// @throws InvalidNameError if an entry of `repos` cannot be stored.
    /// @throws IoError on write failures.
    void rewrite(const RepoMap& repos,
                 const std::vector<StoreRecord>& kept = {});

    /// Format one store line (with trailing newline).
    static std::string format_line(const RepoEntry& entry);

    /// Reject names and paths the line format cannot represent.
    /// @throws InvalidNameError
    static void validate(const RepoEntry& entry);

    /// Parse a single line.  Returns a record with `malformed` set when
    /// the line does not hold exactly one comma or a field is empty.
    static StoreRecord parse_line(const std::string& line, size_t line_no);

private:
    std::filesystem::path file_;
};

} // namespace gita
