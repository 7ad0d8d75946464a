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

#include "fake_device.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>

#include <algorithm>
#include <utility>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>

#include "fake_sync_socket.h"

using android::base::ReadFully;
using android::base::StringPrintf;
using android::base::unique_fd;
using android::base::WriteFully;

namespace adbsync {

static bool WriteString(int fd, const std::string& s) {
    return WriteFully(fd, s.data(), s.size());
}

static std::string Id(SyncCommand command) {
    return Le32(static_cast<uint32_t>(command));
}

// Reads id(4) and size(4), the header every client frame starts with.
static bool ReadHeader(int fd, uint32_t* id, uint32_t* size) {
    std::string header(kSyncDataHeaderSize, '\0');
    if (!ReadFully(fd, &header[0], header.size())) {
        return false;
    }
    *id = ReadLe32(header, 0);
    *size = ReadLe32(header, kSyncCommandSize);
    return true;
}

FakeDevice::~FakeDevice() {
    Stop();
}

void FakeDevice::AddFile(const std::string& path, const std::string& data, uint32_t mode,
                         uint32_t mtime) {
    files_[path] = FakeFile{data, mode, mtime};
}

void FakeDevice::AddDirectory(const std::string& path, uint32_t mtime) {
    files_[path] = FakeFile{"", S_IFDIR | 0755, mtime};
}

std::unique_ptr<SyncSocket> FakeDevice::Start() {
    int fds[2];
    PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) << "socketpair failed";

    unique_fd device_end(fds[0]);
    thread_ = std::thread(&FakeDevice::Serve, this, std::move(device_end));
    return std::make_unique<FdSyncSocket>(unique_fd(fds[1]));
}

void FakeDevice::Stop() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void FakeDevice::Serve(unique_fd fd) {
    if (!HandleHostRequests(fd.get())) {
        return;
    }
    while (HandleSyncCommand(fd.get())) {
    }
}

bool FakeDevice::HandleHostRequests(int fd) {
    while (true) {
        char length[5] = {};
        if (!ReadFully(fd, length, 4)) {
            return false;
        }
        size_t request_length = strtoul(length, nullptr, 16);
        std::string request(request_length, '\0');
        if (request_length != 0 && !ReadFully(fd, &request[0], request_length)) {
            return false;
        }
        host_requests_.push_back(request);

        if (android::base::StartsWith(request, "host:transport") && !transport_failure_.empty()) {
            WriteString(fd, StringPrintf("FAIL%04zx", transport_failure_.size()) +
                                    transport_failure_);
            return false;
        }
        if (!WriteString(fd, "OKAY")) {
            return false;
        }
        if (request == "sync:") {
            return true;
        }
    }
}

bool FakeDevice::SendSyncFail(int fd, const std::string& reason) {
    return WriteString(fd, Id(SyncCommand::kFail) + Le32(reason.size()) + reason);
}

bool FakeDevice::HandleSyncCommand(int fd) {
    uint32_t id;
    uint32_t path_length;
    if (!ReadHeader(fd, &id, &path_length)) {
        return false;
    }
    if (path_length > SyncMaxArgumentLength(static_cast<SyncCommand>(id))) {
        SendSyncFail(fd, "path too long");
        return false;
    }
    std::string name(path_length, '\0');
    if (path_length != 0 && !ReadFully(fd, &name[0], path_length)) {
        SendSyncFail(fd, "filename read failure");
        return false;
    }
    sync_requests_.push_back(SyncCommandName(id) + " " + name);

    switch (static_cast<SyncCommand>(id)) {
        case SyncCommand::kStat:
            return DoStat(fd, name);
        case SyncCommand::kList:
            return DoList(fd, name);
        case SyncCommand::kSend:
            return DoSend(fd, name);
        case SyncCommand::kRecv:
            return DoRecv(fd, name);
        case SyncCommand::kQuit:
            quit_received_ = true;
            return false;
        default:
            SendSyncFail(fd, "unknown command " + SyncCommandName(id));
            return false;
    }
}

bool FakeDevice::DoStat(int fd, const std::string& path) {
    // Like adbd, a missing file is reported as all zeroes.
    FakeFile file;
    auto it = files_.find(path);
    if (it != files_.end()) {
        file = it->second;
    }
    return WriteString(fd, Id(SyncCommand::kStat) + Le32(file.mode) + Le32(file.data.size()) +
                                   Le32(file.mtime));
}

bool FakeDevice::DoList(int fd, const std::string& path) {
    std::string prefix = android::base::EndsWith(path, "/") ? path : path + "/";

    std::string reply;
    for (const auto& [name, file] : files_) {
        if (!android::base::StartsWith(name, prefix)) continue;
        std::string entry = name.substr(prefix.size());
        if (entry.empty() || entry.find('/') != std::string::npos) continue;

        reply += Id(SyncCommand::kDent) + Le32(file.mode) + Le32(file.data.size()) +
                 Le32(file.mtime) + Le32(entry.size()) + entry;
    }
    reply += Id(SyncCommand::kDone) + Le32(0) + Le32(0) + Le32(0) + Le32(0);
    return WriteString(fd, reply);
}

bool FakeDevice::DoSend(int fd, const std::string& path_and_mode) {
    // "/some/path,420"
    size_t comma = path_and_mode.find_last_of(',');
    if (comma == std::string::npos) {
        SendSyncFail(fd, "missing , in SEND");
        return false;
    }
    std::string path = path_and_mode.substr(0, comma);
    if (path.size() > kSyncMaxPathLength) {
        SendSyncFail(fd, "path too long");
        return false;
    }
    uint32_t mode = strtoul(path_and_mode.substr(comma + 1).c_str(), nullptr, 0);

    std::string data;
    uint32_t mtime = 0;
    data_frames_ = 0;
    while (true) {
        uint32_t id;
        uint32_t size;
        if (!ReadHeader(fd, &id, &size)) {
            return false;
        }

        if (id == static_cast<uint32_t>(SyncCommand::kDone)) {
            mtime = size;
            break;
        }
        if (id != static_cast<uint32_t>(SyncCommand::kData)) {
            SendSyncFail(fd, "invalid data message: expected DATA");
            return false;
        }
        if (size > kSyncDataMax) {
            SendSyncFail(fd, "oversize data message");
            return false;
        }

        std::string chunk(size, '\0');
        if (size != 0 && !ReadFully(fd, &chunk[0], size)) {
            return false;
        }
        data += chunk;
        ++data_frames_;
    }

    auto failure = push_failures_.find(path);
    if (failure != push_failures_.end()) {
        return SendSyncFail(fd, failure->second);
    }

    files_[path] = FakeFile{std::move(data), S_IFREG | (mode & 0777), mtime};
    return WriteString(fd, Id(SyncCommand::kOkay));
}

bool FakeDevice::DoRecv(int fd, const std::string& path) {
    auto it = files_.find(path);
    if (it == files_.end()) {
        return SendSyncFail(fd, StringPrintf("open failed: %s", strerror(ENOENT)));
    }
    if (S_ISDIR(it->second.mode)) {
        return SendSyncFail(fd, StringPrintf("read failed: %s", strerror(EISDIR)));
    }

    const std::string& data = it->second.data;
    for (size_t offset = 0; offset < data.size(); offset += recv_chunk_size_) {
        size_t n = std::min(recv_chunk_size_, data.size() - offset);
        if (!WriteString(fd, Id(SyncCommand::kData) + Le32(n) + data.substr(offset, n))) {
            return false;
        }
    }
    return WriteString(fd, Id(SyncCommand::kDone) + Le32(0));
}

}  // namespace adbsync
