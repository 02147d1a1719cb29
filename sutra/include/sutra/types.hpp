#pragma once
// Core types: identifiers, time, vectors, checksums
//
// Entities are addressed by stable string ids. Inside a snapshot every
// entity also has a dense slot, assigned in ascending id order, so that
// slot order and id order agree.

#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace sutra {

// Default embedding dimension (all-MiniLM-L6-v2 compatible)
constexpr size_t DEFAULT_EMBED_DIM = 384;

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

using EntityId = std::string;

// Dense index of an entity inside one snapshot
using Slot = uint32_t;

// Dense embedding. Dimension is fixed per store, not per type.
class Vector {
public:
    std::vector<float> data;

    Vector() = default;
    explicit Vector(size_t dim) : data(dim, 0.0f) {}
    explicit Vector(std::vector<float> v) : data(std::move(v)) {}

    static Vector zeros(size_t dim) { return Vector(dim); }

    const float* as_ptr() const { return data.data(); }
    float* as_ptr() { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    float& operator[](size_t i) { return data[i]; }
    float operator[](size_t i) const { return data[i]; }

    float dot(const Vector& other) const {
        float sum = 0.0f;
        size_t n = std::min(data.size(), other.data.size());
        for (size_t i = 0; i < n; ++i) {
            sum += data[i] * other.data[i];
        }
        return sum;
    }

    float norm() const {
        return std::sqrt(dot(*this));
    }

    void normalize() {
        float n = norm();
        if (n > 0.0f) {
            for (float& x : data) x /= n;
        }
    }

    // Cosine similarity in [-1, 1]; zero vectors score 0
    float cosine(const Vector& other) const {
        float na = norm();
        float nb = other.norm();
        if (na == 0.0f || nb == 0.0f) return 0.0f;
        return dot(other) / (na * nb);
    }

    bool operator==(const Vector& other) const { return data == other.data; }
    bool operator!=(const Vector& other) const { return data != other.data; }
};

// ═══════════════════════════════════════════════════════════════════════════
// CRC32 (content hashing of stores and snapshots)
// ═══════════════════════════════════════════════════════════════════════════

// Chainable form: pass the previous result as `crc` to hash a sequence
inline uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t length) {
    crc = ~crc;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
        }
    }
    return ~crc;
}

inline uint32_t crc32(const uint8_t* data, size_t length) {
    return crc32_update(0, data, length);
}

inline uint32_t crc32(const std::string& s) {
    return crc32(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file replacement: temp file, fsync, rename, fsync of the directory
// ═══════════════════════════════════════════════════════════════════════════

inline std::string errno_text(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

inline void sync_parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    if (dir.empty()) dir = "/";
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) throw StorageError(errno_text("cannot open directory", dir));
    int rc = ::fsync(dfd);
    int saved = errno;
    ::close(dfd);
    if (rc != 0) {
        errno = saved;
        throw StorageError(errno_text("cannot fsync directory", dir));
    }
}

// Replaces `path` with whatever `write_fn(FILE*)` writes, or leaves it
// untouched. `write_fn` returns false on a short write. Throws StorageError.
template <typename Writer>
void write_atomically(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) throw StorageError(errno_text("cannot create", tmp));

    std::string failure;
    if (!write_fn(f)) {
        failure = errno_text("short write to", tmp);
    } else if (::fflush(f) != 0 || ::fsync(::fileno(f)) != 0) {
        failure = errno_text("cannot flush", tmp);
    }
    if (::fclose(f) != 0 && failure.empty()) failure = errno_text("cannot close", tmp);
    if (!failure.empty()) {
        ::remove(tmp.c_str());
        throw StorageError(failure);
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        failure = errno_text("cannot rename onto", path);
        ::remove(tmp.c_str());
        throw StorageError(failure);
    }
    sync_parent_dir(path);
}

} // namespace sutra
