#pragma once

#include <stdexcept>
#include <string>

namespace gita {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all gita exceptions.
class GitaError : public std::runtime_error {
public:
    explicit GitaError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// A repository name was not found in the registry.
class KeyNotFoundError : public GitaError {
public:
    explicit KeyNotFoundError(const std::string& key)
        : GitaError("key not found: " + key), key_(key) {}
    const std::string& key() const { return key_; }
private:
    std::string key_;
};

/// A repository name is already registered (e.g. renaming onto a taken name).
class KeyExistsError : public GitaError {
public:
    explicit KeyExistsError(const std::string& key)
        : GitaError("key already exists: " + key), key_(key) {}
    const std::string& key() const { return key_; }
private:
    std::string key_;
};

/// The OS could not start an external command.
class SpawnError : public GitaError {
public:
    SpawnError(const std::string& program, const std::string& reason)
        : GitaError("cannot run '" + program + "': " + reason),
          program_(program) {}
    const std::string& program() const { return program_; }
private:
    std::string program_;
};

/// A line of the repository store does not split into `path,name`.
class StoreCorruptError : public GitaError {
public:
    StoreCorruptError(const std::string& file, size_t line)
        : GitaError("malformed entry in " + file + " at line " +
                    std::to_string(line)),
          line_(line) {}
    size_t line() const { return line_; }
private:
    size_t line_;
};

/// A name or path cannot be represented in the store file
/// (empty, or contains ',' or a line break).
class InvalidNameError : public GitaError {
public:
    explicit InvalidNameError(const std::string& msg)
        : GitaError("invalid name: " + msg) {}
};

/// A command-alias file could not be parsed.
class ConfigError : public GitaError {
public:
    explicit ConfigError(const std::string& msg)
        : GitaError("config error: " + msg) {}
};

/// A low-level libgit2 operation failed.
class GitError : public GitaError {
public:
    explicit GitError(const std::string& msg)
        : GitaError("git error: " + msg) {}
};

/// A filesystem I/O error occurred.
class IoError : public GitaError {
public:
    explicit IoError(const std::string& msg)
        : GitaError("io error: " + msg) {}
};

} // namespace gita
