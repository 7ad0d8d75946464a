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

#include "adbsync/sync_protocol.h"

#include <ctype.h>

#include <string>

#include <android-base/stringprintf.h>

#include "adbsync/sync_error.h"

namespace adbsync {

bool IsKnownSyncCommand(uint32_t id) {
    switch (static_cast<SyncCommand>(id)) {
        case SyncCommand::kOkay:
        case SyncCommand::kFail:
        case SyncCommand::kDone:
        case SyncCommand::kData:
        case SyncCommand::kSend:
        case SyncCommand::kRecv:
        case SyncCommand::kStat:
        case SyncCommand::kList:
        case SyncCommand::kDent:
        case SyncCommand::kQuit:
            return true;
    }
    return false;
}

std::string SyncCommandName(uint32_t id) {
    char name[4];
    for (size_t i = 0; i < sizeof(name); ++i) {
        name[i] = static_cast<char>((id >> (8 * i)) & 0xff);
        if (!isprint(static_cast<unsigned char>(name[i]))) {
            return android::base::StringPrintf("%#010x", id);
        }
    }
    return std::string(name, sizeof(name));
}

SyncErrorKind GetSyncErrorKind(int code) {
    switch (code) {
        case EINVAL:
        case ENAMETOOLONG:
            return SyncErrorKind::kInvalidArgument;
        case EPROTO:
            return SyncErrorKind::kProtocol;
        case EREMOTEIO:
            return SyncErrorKind::kRemote;
        case ECANCELED:
            return SyncErrorKind::kCancelled;
        default:
            return SyncErrorKind::kIo;
    }
}

std::ostream& operator<<(std::ostream& os, SyncErrorKind kind) {
    switch (kind) {
        case SyncErrorKind::kInvalidArgument:
            return os << "invalid argument";
        case SyncErrorKind::kIo:
            return os << "I/O failure";
        case SyncErrorKind::kProtocol:
            return os << "protocol error";
        case SyncErrorKind::kRemote:
            return os << "remote error";
        case SyncErrorKind::kCancelled:
            return os << "cancelled";
    }
    return os << "unknown";
}

}  // namespace adbsync
