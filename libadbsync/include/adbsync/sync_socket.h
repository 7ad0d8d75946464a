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

#include <string>
#include <string_view>

#include <android-base/macros.h>
#include <android-base/unique_fd.h>

namespace adbsync {

// A connected, ordered, reliable byte stream to the adb server or device.
// Establishing the connection is the caller's business; a SyncSocket only
// moves bytes over it.
class SyncSocket {
  public:
    SyncSocket() = default;
    virtual ~SyncSocket() = default;

    // Reads exactly len bytes into buf.
    //
    // Returns false if there is an error or if EOF was reached before len
    // bytes were read. If EOF was found, errno will be set to 0.
    virtual bool ReadExactly(void* buf, size_t len) = 0;

    // Writes exactly len bytes from buf.
    //
    // Returns false if there is an error or if the peer closed the stream
    // before the write completed, in which case errno will be set to 0.
    virtual bool WriteExactly(const void* buf, size_t len) = 0;

    virtual bool IsConnected() const = 0;

    // Releases the underlying stream. Safe to call more than once.
    virtual void Close() = 0;

    // Writes a host protocol request: four hex digits of length, then the
    // request text.
    virtual bool SendAdbRequest(std::string_view request);

    // Reads a host protocol status. Returns true on OKAY. On FAIL, returns
    // false with the server's message in |error|; on anything else, returns
    // false with a "protocol fault" description in |error|.
    virtual bool ReadAdbResponse(std::string* error);

  private:
    DISALLOW_COPY_AND_ASSIGN(SyncSocket);
};

// SyncSocket over an already connected file descriptor, usually a TCP socket
// to the adb server.
class FdSyncSocket : public SyncSocket {
  public:
    explicit FdSyncSocket(android::base::unique_fd fd);
    ~FdSyncSocket() override;

    bool ReadExactly(void* buf, size_t len) override;
    bool WriteExactly(const void* buf, size_t len) override;
    bool IsConnected() const override;
    void Close() override;

    int fd() const { return fd_.get(); }

  private:
    android::base::unique_fd fd_;
    bool peer_closed_ = false;
};

}  // namespace adbsync
