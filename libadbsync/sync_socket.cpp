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

#define TRACE_TAG IO

#include "adbsync/sync_socket.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>
#include <thread>

#include <android-base/stringprintf.h>

#include "sync_trace.h"

namespace adbsync {

// Longest request the adb server accepts.
static constexpr size_t kMaxHostRequest = 0xffff;

static std::string perror_str(const char* msg) {
    return android::base::StringPrintf("%s: %s", msg, strerror(errno));
}

bool SyncSocket::SendAdbRequest(std::string_view request) {
    if (request.size() > kMaxHostRequest) {
        errno = EMSGSIZE;
        return false;
    }

    // The cost of sending two strings outweighs the cost of formatting.
    std::string buf = android::base::StringPrintf("%04zx", request.size());
    buf.append(request);
    return WriteExactly(buf.data(), buf.size());
}

bool SyncSocket::ReadAdbResponse(std::string* error) {
    char buf[5];
    if (!ReadExactly(buf, 4)) {
        *error = perror_str("protocol fault (couldn't read status)");
        return false;
    }

    if (!memcmp(buf, "OKAY", 4)) {
        return true;
    }

    if (memcmp(buf, "FAIL", 4)) {
        *error = android::base::StringPrintf("protocol fault (status %02x %02x %02x %02x?!)",
                                             buf[0], buf[1], buf[2], buf[3]);
        return false;
    }

    if (!ReadExactly(buf, 4)) {
        *error = perror_str("protocol fault (couldn't read status length)");
        return false;
    }
    buf[4] = 0;

    char* end;
    unsigned long len = strtoul(buf, &end, 16);
    if (*end != '\0') {
        *error = android::base::StringPrintf("protocol fault (bad status length '%s')", buf);
        return false;
    }

    std::string message(len, '\0');
    if (!ReadExactly(&message[0], len)) {
        *error = perror_str("protocol fault (couldn't read status message)");
        return false;
    }
    *error = std::move(message);
    return false;
}

FdSyncSocket::FdSyncSocket(android::base::unique_fd fd) : fd_(std::move(fd)) {}

FdSyncSocket::~FdSyncSocket() {
    Close();
}

bool FdSyncSocket::ReadExactly(void* buf, size_t len) {
    char* p = reinterpret_cast<char*>(buf);

    size_t len0 = len;

    D("readx: fd=%d wanted=%zu", fd_.get(), len);
    while (len > 0) {
        ssize_t r = TEMP_FAILURE_RETRY(read(fd_.get(), p, len));
        if (r > 0) {
            len -= r;
            p += r;
        } else if (r == -1) {
            D("readx: fd=%d error %d: %s", fd_.get(), errno, strerror(errno));
            return false;
        } else {
            D("readx: fd=%d disconnected", fd_.get());
            peer_closed_ = true;
            errno = 0;
            return false;
        }
    }

    VLOG(IO) << "readx: fd=" << fd_.get() << " wanted=" << len0 << " got=" << (len0 - len) << " "
             << adbsync_dump_hex(buf, len0);

    return true;
}

bool FdSyncSocket::WriteExactly(const void* buf, size_t len) {
    const char* p = reinterpret_cast<const char*>(buf);

    VLOG(IO) << "writex: fd=" << fd_.get() << " len=" << len << " "
             << adbsync_dump_hex(buf, len);

    while (len > 0) {
        ssize_t r = TEMP_FAILURE_RETRY(write(fd_.get(), p, len));
        if (r == -1) {
            D("writex: fd=%d error %d: %s", fd_.get(), errno, strerror(errno));
            if (errno == EAGAIN) {
                std::this_thread::yield();
                continue;
            } else if (errno == EPIPE) {
                D("writex: fd=%d disconnected", fd_.get());
                peer_closed_ = true;
                errno = 0;
                return false;
            } else {
                return false;
            }
        } else {
            len -= r;
            p += r;
        }
    }
    return true;
}

bool FdSyncSocket::IsConnected() const {
    return fd_.get() != -1 && !peer_closed_;
}

void FdSyncSocket::Close() {
    if (fd_.get() != -1) {
        D("closing fd %d", fd_.get());
        fd_.reset();
    }
}

}  // namespace adbsync
