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

#define TRACE_TAG SYNC

#include "adbsync/sync_messages.h"

#include <string>
#include <utility>

#include <android-base/logging.h>

#include "adbsync/sync_error.h"
#include "sync_trace.h"

using android::base::Result;

namespace adbsync {

Result<SyncStatus> SyncStatus::ReadFields(SyncCommand command, SyncCodec&) {
    return SyncStatus{command};
}

Result<SyncStat> SyncStat::ReadFields(SyncCommand command, SyncCodec& codec) {
    uint32_t fields[3];
    if (auto result = codec.DecodeFixed(fields, 3); !result) {
        return result.error();
    }

    SyncStat stat;
    stat.command = command;
    stat.mode = fields[0];
    stat.size = static_cast<int32_t>(fields[1]);
    stat.mtime = static_cast<time_t>(static_cast<int32_t>(fields[2]));
    return stat;
}

Result<SyncDent> SyncDent::ReadFields(SyncCommand command, SyncCodec& codec) {
    auto stat = SyncStat::ReadFields(command, codec);
    if (!stat) {
        return stat.error();
    }

    auto name = codec.DecodeString();
    if (!name) {
        return name.error();
    }

    SyncDent dent;
    dent.command = command;
    dent.stat = *stat;
    dent.name = std::move(*name);
    return dent;
}

Result<SyncData> SyncData::ReadFields(SyncCommand command, SyncCodec& codec) {
    SyncData data;
    data.command = command;
    if (auto result = codec.DecodeFixed(&data.size, 1); !result) {
        return result.error();
    }
    return data;
}

static SyncCommand SuccessCommand(SyncMessageKind kind) {
    switch (kind) {
        case SyncMessageKind::kStatus:
            return SyncCommand::kOkay;
        case SyncMessageKind::kStat:
            return SyncCommand::kStat;
        case SyncMessageKind::kDent:
            return SyncCommand::kDent;
        case SyncMessageKind::kData:
            return SyncCommand::kData;
    }
    LOG(FATAL) << "unknown message kind " << static_cast<int>(kind);
    return SyncCommand::kFail;
}

// DONE ends a LIST or RECV stream and is framed like the messages it ends.
static bool IsTerminatedByDone(SyncMessageKind kind) {
    return kind == SyncMessageKind::kDent || kind == SyncMessageKind::kData;
}

template <typename T>
static Result<SyncMessage> ReadShape(SyncCommand command, SyncCodec& codec) {
    auto message = T::ReadFields(command, codec);
    if (!message) {
        return message.error();
    }
    return SyncMessage(std::move(*message));
}

Result<SyncMessage> ReadSyncMessage(SyncCodec& codec, SyncMessageKind kind) {
    auto command = codec.DecodeCommand();
    if (!command) {
        return command.error();
    }

    if (*command == SyncCommand::kFail) {
        auto reason = codec.DecodeString();
        if (!reason) {
            return reason.error();
        }
        D("sync: remote failure: %s", reason->c_str());
        return RemoteError(std::move(*reason));
    }

    if (*command != SuccessCommand(kind) &&
        !(*command == SyncCommand::kDone && IsTerminatedByDone(kind))) {
        return ProtocolError("unexpected response " + SyncCommandName(*command) + " (expected " +
                             SyncCommandName(SuccessCommand(kind)) + ")");
    }

    switch (kind) {
        case SyncMessageKind::kStatus:
            return ReadShape<SyncStatus>(*command, codec);
        case SyncMessageKind::kStat:
            return ReadShape<SyncStat>(*command, codec);
        case SyncMessageKind::kDent:
            return ReadShape<SyncDent>(*command, codec);
        case SyncMessageKind::kData:
            return ReadShape<SyncData>(*command, codec);
    }
    return ProtocolError("unknown message kind");
}

}  // namespace adbsync
