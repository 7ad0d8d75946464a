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

#include <stddef.h>
#include <stdint.h>

#include <string>

#define ADBSYNC_MKID(a, b, c, d) \
    ((uint32_t)(a) | ((uint32_t)(b) << 8) | ((uint32_t)(c) << 16) | ((uint32_t)(d) << 24))

namespace adbsync {

// Every sync frame starts with one of these four-byte tokens. The numeric
// value is the token read as a little-endian 32-bit integer.
enum class SyncCommand : uint32_t {
    kOkay = ADBSYNC_MKID('O', 'K', 'A', 'Y'),
    kFail = ADBSYNC_MKID('F', 'A', 'I', 'L'),
    kDone = ADBSYNC_MKID('D', 'O', 'N', 'E'),
    kData = ADBSYNC_MKID('D', 'A', 'T', 'A'),
    kSend = ADBSYNC_MKID('S', 'E', 'N', 'D'),
    kRecv = ADBSYNC_MKID('R', 'E', 'C', 'V'),
    kStat = ADBSYNC_MKID('S', 'T', 'A', 'T'),
    kList = ADBSYNC_MKID('L', 'I', 'S', 'T'),
    kDent = ADBSYNC_MKID('D', 'E', 'N', 'T'),
    kQuit = ADBSYNC_MKID('Q', 'U', 'I', 'T'),
};

// Size of a command token on the wire.
constexpr size_t kSyncCommandSize = 4;

// DATA frame header: command token followed by the payload length.
constexpr size_t kSyncDataHeaderSize = kSyncCommandSize + sizeof(uint32_t);

// Longest remote path a request may name.
constexpr size_t kSyncMaxPathLength = 1024;

// SEND appends ",<mode>" to the path; "," plus the widest int is 12 bytes.
constexpr size_t kSyncMaxSendArgumentLength = kSyncMaxPathLength + 12;

// Longest request argument allowed for |command|.
constexpr size_t SyncMaxArgumentLength(SyncCommand command) {
    return command == SyncCommand::kSend ? kSyncMaxSendArgumentLength : kSyncMaxPathLength;
}

// Default chunk buffer size, header included.
constexpr size_t kSyncDataMax = 64 * 1024;

// Upper bound on entry names and failure messages read from the remote.
constexpr size_t kSyncMaxStringLength = 64 * 1024;

// Returns true if |id| is one of the tokens above.
bool IsKnownSyncCommand(uint32_t id);

// Returns the four-character token, or the id in hex if it is not printable.
std::string SyncCommandName(uint32_t id);

inline std::string SyncCommandName(SyncCommand command) {
    return SyncCommandName(static_cast<uint32_t>(command));
}

}  // namespace adbsync
