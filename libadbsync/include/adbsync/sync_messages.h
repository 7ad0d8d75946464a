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
#include <variant>

#include <android-base/result.h>

#include "adbsync/sync_codec.h"
#include "adbsync/sync_protocol.h"

namespace adbsync {

// Terminal response to a push: OKAY.
struct SyncStatus {
    SyncCommand command;

    static android::base::Result<SyncStatus> ReadFields(SyncCommand command, SyncCodec& codec);
};

// Response to STAT: mode(4) size(4) mtime(4).
struct SyncStat {
    SyncCommand command;
    uint32_t mode = 0;
    int32_t size = 0;
    time_t mtime = 0;

    static android::base::Result<SyncStat> ReadFields(SyncCommand command, SyncCodec& codec);
};

// One LIST entry: the stat fields followed by namelen(4) and the name bytes.
struct SyncDent {
    SyncCommand command;
    SyncStat stat;
    std::string name;

    static android::base::Result<SyncDent> ReadFields(SyncCommand command, SyncCodec& codec);
};

// DATA header during RECV: size(4). The payload that follows is left on the
// stream for the caller.
struct SyncData {
    SyncCommand command;
    uint32_t size = 0;

    static android::base::Result<SyncData> ReadFields(SyncCommand command, SyncCodec& codec);
};

using SyncMessage = std::variant<SyncStatus, SyncStat, SyncDent, SyncData>;

enum class SyncMessageKind {
    kStatus,
    kStat,
    kDent,
    kData,
};

// Reads one response frame of the expected shape.
//
// The command token is decoded first. Shape fields are consumed only for the
// shape's success token, or for DONE where DONE terminates that shape (LIST
// and RECV); DONE carries the same fixed tail as the frames it terminates.
// FAIL is followed by a length-prefixed message, which is read and returned
// as a remote error. Any other token is a protocol error and nothing more is
// read.
android::base::Result<SyncMessage> ReadSyncMessage(SyncCodec& codec, SyncMessageKind kind);

}  // namespace adbsync
