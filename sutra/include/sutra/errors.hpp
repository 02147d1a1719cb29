#pragma once
// Errors: the failure taxonomy
//
// Every error carries a stable machine code so a protocol layer can map it
// without matching on message text.

#include <stdexcept>
#include <string>

namespace sutra {

class Error : public std::runtime_error {
public:
    Error(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

// Bad input from the immediate caller. Never retried.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error("validation", message) {}
};

// Reference to an id that does not exist in the live snapshot
class NotFound : public Error {
public:
    explicit NotFound(const std::string& message)
        : Error("not_found", message) {}
};

// Edge endpoint missing at insert time
class DanglingReferenceError : public Error {
public:
    explicit DanglingReferenceError(const std::string& message)
        : Error("dangling_reference", message) {}
};

// Embedding provider failed, timed out, or produced no usable vector
class EmbeddingUnavailable : public Error {
public:
    explicit EmbeddingUnavailable(const std::string& message)
        : Error("embedding_unavailable", message) {}
};

// The provider did not answer within the deadline, or is still stuck on an
// earlier call. Not worth retrying inside the same deadline.
class EmbeddingTimeout : public EmbeddingUnavailable {
public:
    explicit EmbeddingTimeout(const std::string& message)
        : EmbeddingUnavailable(message) {}
};

class BuildInProgressError : public Error {
public:
    explicit BuildInProgressError(const std::string& message)
        : Error("build_in_progress", message) {}
};

// On-disk integrity check failed. The store refuses reads until a full
// rebuild or import commits.
class StorageCorruptionError : public Error {
public:
    explicit StorageCorruptionError(const std::string& message)
        : Error("storage_corruption", message) {}
};

// Systemic I/O failure (unwritable file, SQLite error)
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error("storage", message) {}
};

} // namespace sutra
