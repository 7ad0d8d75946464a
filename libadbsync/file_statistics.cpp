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

#include "adbsync/file_statistics.h"

#include <string.h>
#include <sys/stat.h>

namespace adbsync {

FileStatistics FileStatistics::FromStat(const std::string& path, const SyncStat& stat) {
    FileStatistics result;
    result.path = path;
    result.mode = stat.mode;
    result.size = stat.size;
    result.mtime = stat.mtime;
    return result;
}

FileStatistics FileStatistics::FromDent(const SyncDent& dent) {
    return FromStat(dent.name, dent.stat);
}

bool FileStatistics::IsDirectory() const {
    return S_ISDIR(mode);
}

bool FileStatistics::IsRegularFile() const {
    return S_ISREG(mode);
}

bool FileStatistics::IsSymlink() const {
    return S_ISLNK(mode);
}

struct tm FileStatistics::LocalModificationTime() const {
    struct tm local;
    memset(&local, 0, sizeof(local));
    localtime_r(&mtime, &local);
    return local;
}

bool operator==(const FileStatistics& lhs, const FileStatistics& rhs) {
    return lhs.path == rhs.path && lhs.mode == rhs.mode && lhs.size == rhs.size &&
           lhs.mtime == rhs.mtime;
}

}  // namespace adbsync
