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

#include "adbsync/sync_service.h"

#include <errno.h>
#include <inttypes.h>
#include <stdint.h>
#include <sys/stat.h>
#include <unistd.h>

#include <limits>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>

#include "adbsync/sync_error.h"
#include "adbsync/sync_messages.h"
#include "sync_trace.h"

using android::base::borrowed_fd;
using android::base::ErrnoError;
using android::base::Result;
using android::base::ResultError;
using android::base::StringPrintf;

namespace adbsync {

static ResultError WithContext(const std::string& context, const ResultError& error) {
    return ResultError(context + ": " + error.message(), error.code());
}

static bool IsCancelled(const std::atomic<bool>* cancel) {
    return cancel != nullptr && cancel->load();
}

static void ReportProgress(const ProgressCallback& progress, uint64_t copied, uint64_t total) {
    if (!progress || total == 0) return;

    // A file that grows while we read it would otherwise go past 100%.
    uint64_t percent = copied >= total ? 100 : copied * 100 / total;
    progress(static_cast<int>(percent));
}

// SEND carries the path and the mode in one argument: "/some/path,33188".
static std::string SendArgument(const std::string& remote_path, mode_t permissions) {
    return StringPrintf("%s,%d", remote_path.c_str(), static_cast<int>(permissions));
}

static Result<void> CheckRemotePath(const char* operation, const std::string& remote_path) {
    if (remote_path.empty()) {
        return InvalidArgumentError(StringPrintf("%s: no remote path", operation));
    }
    if (remote_path.size() > kSyncMaxPathLength) {
        return ResultError(StringPrintf("%s: remote path too long: %zu > %zu", operation,
                                        remote_path.size(), kSyncMaxPathLength),
                           ENAMETOOLONG);
    }
    return {};
}

// Fills up to |len| bytes from |fd|, stopping early only at end of file, so
// that every chunk but the last is full.
static Result<size_t> ReadChunk(borrowed_fd fd, char* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = TEMP_FAILURE_RETRY(read(fd.get(), buf + total, len - total));
        if (n == -1) {
            return ErrnoError() << "reading source failed";
        }
        if (n == 0) break;
        total += n;
    }
    return total;
}

SyncService::SyncService(std::unique_ptr<SyncSocket> socket, DeviceData device)
    : socket_(std::move(socket)), codec_(socket_.get()), device_(std::move(device)) {
    CHECK(socket_ != nullptr);
}

SyncService::~SyncService() {
    Close();
}

Result<void> SyncService::SelectDevice() {
    std::string service;
    if (device_.transport_id != 0) {
        service = "host:transport-id:" + std::to_string(device_.transport_id);
    } else if (!device_.serial.empty()) {
        service = "host:transport:" + device_.serial;
    } else {
        service = "host:transport-any";
    }

    VLOG(TRANSPORT) << "Switch transport in progress: " << service;
    for (const std::string& request : {service, std::string("sync:")}) {
        if (!socket_->SendAdbRequest(request)) {
            if (errno == 0) {
                return ResultError("write failure during connection: connection closed",
                                   ECONNRESET);
            }
            return ErrnoError() << "write failure during connection";
        }

        std::string error;
        if (!socket_->ReadAdbResponse(&error)) {
            D("'%s' failed: %s", request.c_str(), error.c_str());
            if (!socket_->IsConnected()) {
                return ResultError(error, ECONNRESET);
            }
            if (android::base::StartsWith(error, "protocol fault")) {
                return ResultError(error, EPROTO);
            }
            return RemoteError(StringPrintf("'%s' refused: %s", request.c_str(), error.c_str()));
        }
    }

    D("sync mode entered");
    return {};
}

Result<void> SyncService::Open() {
    adbsync_trace_init();

    if (closed_) {
        return ResultError("sync session already closed", ENOTCONN);
    }
    if (open_) {
        return {};
    }
    if (broken_) {
        return ResultError("sync session is unusable after an earlier failure", ENOTCONN);
    }
    if (!socket_->IsConnected()) {
        return ResultError("socket is not connected", ENOTCONN);
    }

    if (auto result = SelectDevice(); !result) {
        broken_ = true;
        return WithContext("failed to open sync session", result.error());
    }

    open_ = true;
    return {};
}

bool SyncService::IsOpen() const {
    return open_ && !broken_ && !closed_ && socket_->IsConnected();
}

void SyncService::Close() {
    if (closed_) return;
    closed_ = true;

    if (open_ && !broken_ && socket_->IsConnected()) {
        // The device stops serving this connection once it sees QUIT.
        if (auto result = codec_.EncodeRequest(SyncCommand::kQuit, std::string_view()); !result) {
            D("failed to send QUIT: %s", result.error().message().c_str());
        }
    }
    open_ = false;
    socket_->Close();
}

Result<void> SyncService::CheckUsable() const {
    if (closed_ || !open_) {
        return ResultError("sync session is not open", ENOTCONN);
    }
    if (broken_) {
        return ResultError("sync session is unusable after an earlier failure", ENOTCONN);
    }
    return {};
}

Result<void> SyncService::SetMaxBufferSize(size_t size) {
    if (size <= kSyncDataHeaderSize) {
        return InvalidArgumentError(StringPrintf("buffer size %zu leaves no room for data", size));
    }
    if (size - kSyncDataHeaderSize > std::numeric_limits<uint32_t>::max()) {
        return InvalidArgumentError(StringPrintf("buffer size %zu is too large", size));
    }
    max_buffer_size_ = size;
    return {};
}

char* SyncService::Buffer() {
    if (buffer_.size() != max_buffer_size_) {
        buffer_.resize(max_buffer_size_);
        buffer_.shrink_to_fit();
    }
    return buffer_.data();
}

Result<FileStatistics> SyncService::Stat(const std::string& remote_path) {
    if (auto result = CheckRemotePath("stat", remote_path); !result) {
        return result.error();
    }
    if (auto result = CheckUsable(); !result) {
        return result.error();
    }

    auto result = DoStat(remote_path);
    if (!result) broken_ = true;
    return result;
}

Result<FileStatistics> SyncService::DoStat(const std::string& remote_path) {
    if (auto result = codec_.EncodeRequest(SyncCommand::kStat, remote_path); !result) {
        return WithContext("stat '" + remote_path + "' failed", result.error());
    }

    auto message = ReadSyncMessage(codec_, SyncMessageKind::kStat);
    if (!message) {
        return WithContext("stat '" + remote_path + "' failed", message.error());
    }
    return FileStatistics::FromStat(remote_path, std::get<SyncStat>(*message));
}

Result<std::vector<FileStatistics>> SyncService::GetDirectoryListing(
        const std::string& remote_path) {
    if (auto result = CheckRemotePath("list", remote_path); !result) {
        return result.error();
    }
    if (auto result = CheckUsable(); !result) {
        return result.error();
    }

    std::string context = "list '" + remote_path + "' failed";
    if (auto result = codec_.EncodeRequest(SyncCommand::kList, remote_path); !result) {
        broken_ = true;
        return WithContext(context, result.error());
    }

    std::vector<FileStatistics> entries;
    while (true) {
        auto message = ReadSyncMessage(codec_, SyncMessageKind::kDent);
        if (!message) {
            broken_ = true;
            return WithContext(context, message.error());
        }

        const SyncDent& dent = std::get<SyncDent>(*message);
        if (dent.command == SyncCommand::kDone) break;
        entries.push_back(FileStatistics::FromDent(dent));
    }

    D("list '%s': %zu entries", remote_path.c_str(), entries.size());
    return entries;
}

Result<void> SyncService::Push(borrowed_fd source_fd, const std::string& remote_path,
                               mode_t permissions, time_t mtime, const ProgressCallback& progress,
                               const std::atomic<bool>* cancel) {
    if (source_fd.get() < 0) {
        return InvalidArgumentError("push: no source file descriptor");
    }
    if (auto result = CheckRemotePath("push", remote_path); !result) {
        return result.error();
    }
    if (auto result = CheckUsable(); !result) {
        return result.error();
    }
    if (IsCancelled(cancel)) {
        return CancelledError("push to '" + remote_path + "' cancelled");
    }

    auto result = DoPush(source_fd, remote_path, permissions, mtime, progress, cancel);
    if (!result) broken_ = true;
    return result;
}

Result<void> SyncService::DoPush(borrowed_fd source_fd, const std::string& remote_path,
                                 mode_t permissions, time_t mtime,
                                 const ProgressCallback& progress,
                                 const std::atomic<bool>* cancel) {
    std::string context = "failed to push to '" + remote_path + "'";
    if (auto result = codec_.EncodeRequest(SyncCommand::kSend,
                                           SendArgument(remote_path, permissions));
        !result) {
        return WithContext(context, result.error());
    }

    // Only a regular file can tell us up front how much there is to send.
    uint64_t total_size = 0;
    struct stat st;
    if (fstat(source_fd.get(), &st) == 0 && S_ISREG(st.st_mode)) {
        total_size = st.st_size;
    }

    // The payload is read in just after the space for the DATA header, so
    // header and payload go out in a single write.
    char* frame = Buffer();
    char* payload = frame + kSyncDataHeaderSize;
    const size_t max_data_size = max_buffer_size_ - kSyncDataHeaderSize;

    uint64_t bytes_copied = 0;
    while (true) {
        if (IsCancelled(cancel)) {
            return CancelledError("push to '" + remote_path + "' cancelled");
        }

        auto bytes_read = ReadChunk(source_fd, payload, max_data_size);
        if (!bytes_read) {
            return WithContext(context, bytes_read.error());
        }
        if (*bytes_read == 0) break;

        if (auto result = codec_.EncodeDataFrame(frame, *bytes_read); !result) {
            return WithContext(context, result.error());
        }

        bytes_copied += *bytes_read;
        ReportProgress(progress, bytes_copied, total_size);
    }

    D("push '%s': %" PRIu64 " bytes sent", remote_path.c_str(), bytes_copied);

    if (auto result = codec_.EncodeRequest(SyncCommand::kDone, static_cast<uint32_t>(mtime));
        !result) {
        return WithContext(context, result.error());
    }

    auto status = ReadSyncMessage(codec_, SyncMessageKind::kStatus);
    if (!status) {
        return WithContext(context, status.error());
    }
    return {};
}

Result<void> SyncService::Pull(const std::string& remote_path, borrowed_fd destination_fd,
                               const ProgressCallback& progress, const std::atomic<bool>* cancel) {
    if (auto result = CheckRemotePath("pull", remote_path); !result) {
        return result.error();
    }
    if (destination_fd.get() < 0) {
        return InvalidArgumentError("pull: no destination file descriptor");
    }
    if (auto result = CheckUsable(); !result) {
        return result.error();
    }
    if (IsCancelled(cancel)) {
        return CancelledError("pull of '" + remote_path + "' cancelled");
    }

    auto result = DoPull(remote_path, destination_fd, progress, cancel);
    if (!result) broken_ = true;
    return result;
}

Result<void> SyncService::DoPull(const std::string& remote_path, borrowed_fd destination_fd,
                                 const ProgressCallback& progress,
                                 const std::atomic<bool>* cancel) {
    // The size is only used for progress; the transfer itself runs to DONE.
    auto stat = DoStat(remote_path);
    if (!stat) {
        return stat.error();
    }
    uint64_t total_size = stat->size > 0 ? stat->size : 0;

    std::string context = "failed to pull '" + remote_path + "'";
    if (auto result = codec_.EncodeRequest(SyncCommand::kRecv, remote_path); !result) {
        return WithContext(context, result.error());
    }

    char* buffer = Buffer();
    uint64_t bytes_copied = 0;
    while (true) {
        auto message = ReadSyncMessage(codec_, SyncMessageKind::kData);
        if (!message) {
            return WithContext(context, message.error());
        }
        if (IsCancelled(cancel)) {
            return CancelledError("pull of '" + remote_path + "' cancelled");
        }

        const SyncData& data = std::get<SyncData>(*message);
        if (data.command == SyncCommand::kDone) break;

        if (data.size > max_buffer_size_) {
            LOG(ERROR) << "msg.data.size too large: " << data.size << " (max " << max_buffer_size_
                       << ")";
            return WithContext(context, ProtocolError(StringPrintf(
                                                "data chunk of %u bytes exceeds maximum %zu",
                                                data.size, max_buffer_size_)));
        }

        if (auto result = codec_.DecodeBytes(buffer, data.size); !result) {
            return WithContext(context, result.error());
        }

        if (!android::base::WriteFully(destination_fd, buffer, data.size)) {
            return ErrnoError() << "cannot write pulled data to destination";
        }

        bytes_copied += data.size;
        ReportProgress(progress, bytes_copied, total_size);
    }

    D("pull '%s': %" PRIu64 " bytes received", remote_path.c_str(), bytes_copied);
    return {};
}

}  // namespace adbsync
