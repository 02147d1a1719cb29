#pragma once

#define SUTRA_VERSION "0.3.0"
#define SUTRA_SCHEMA_VERSION 1
#define SUTRA_SNAPSHOT_FORMAT_VERSION 1

namespace sutra {
namespace version {

inline bool schema_compatible(int stored) {
    // Stores are never migrated in place; a different schema means rebuild
    return stored == SUTRA_SCHEMA_VERSION;
}

inline bool snapshot_compatible(int format) {
    return format >= 1 && format <= SUTRA_SNAPSHOT_FORMAT_VERSION;
}

} // namespace version
} // namespace sutra
