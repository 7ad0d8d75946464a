/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <stdint.h>
#include <time.h>

#include <string>

#include "adbsync/sync_messages.h"

namespace adbsync {

// What the caller gets back from Stat and GetDirectoryListing. Holds no
// reference to protocol state.
struct FileStatistics {
    // The requested path for Stat; the bare entry name for a listing.
    std::string path;
    // POSIX st_mode bits as reported by the device.
    uint32_t mode = 0;
    int32_t size = 0;
    // Seconds since the Unix epoch.
    time_t mtime = 0;

    static FileStatistics FromStat(const std::string& path, const SyncStat& stat);
    static FileStatistics FromDent(const SyncDent& dent);

    bool IsDirectory() const;
    bool IsRegularFile() const;
    bool IsSymlink() const;

    // The v1 stat reply has no error field; a missing file comes back zeroed.
    bool Exists() const { return mode != 0 || size != 0 || mtime != 0; }

    struct tm LocalModificationTime() const;

    const std::string& ToString() const { return path; }
};

bool operator==(const FileStatistics& lhs, const FileStatistics& rhs);

inline bool operator!=(const FileStatistics& lhs, const FileStatistics& rhs) {
    return !(lhs == rhs);
}

}  // namespace adbsync
