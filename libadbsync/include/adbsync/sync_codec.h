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
#include <string_view>

#include <android-base/result.h>

#include "adbsync/sync_protocol.h"
#include "adbsync/sync_socket.h"

namespace adbsync {

enum class ByteOrder {
    kLittleEndian,
    kBigEndian,
};

ByteOrder HostByteOrder();

// Loads a 32-bit field from its four wire (little-endian) bytes the way a
// host of the given byte order does: reinterpret the bytes natively, after
// reversing them if the host is big-endian.
uint32_t DecodeUint32(const uint8_t* wire, ByteOrder host);

// Inverse of DecodeUint32.
void EncodeUint32(uint32_t value, uint8_t* wire, ByteOrder host);

// Frames sync requests onto a SyncSocket and decodes the fixed-size parts of
// responses. All multi-byte integers on the wire are little-endian.
//
// A failed read or write is reported with the errno the socket left behind,
// or ECONNRESET if the remote closed the stream.
class SyncCodec {
  public:
    explicit SyncCodec(SyncSocket* socket, ByteOrder host = HostByteOrder())
        : socket_(socket), host_(host) {}

    // Writes |command| followed by the length of |argument| and its bytes, in
    // one write. Fails with ENAMETOOLONG before writing anything if |argument|
    // exceeds SyncMaxArgumentLength(command).
    android::base::Result<void> EncodeRequest(SyncCommand command, std::string_view argument);

    // Writes |command| followed by a single 32-bit |argument|, as used by the
    // DONE frame that ends a push.
    android::base::Result<void> EncodeRequest(SyncCommand command, uint32_t argument);

    // Writes the DATA header into the kSyncDataHeaderSize bytes that precede
    // |payload_length| bytes of payload at |frame|, then sends the whole frame.
    android::base::Result<void> EncodeDataFrame(char* frame, size_t payload_length);

    // Reads a command token. Unknown tokens are protocol errors.
    android::base::Result<SyncCommand> DecodeCommand();

    // Reads |count| consecutive 32-bit fields into |fields|, in host order.
    android::base::Result<void> DecodeFixed(uint32_t* fields, size_t count);

    // Reads a 32-bit length followed by that many bytes, taken verbatim.
    android::base::Result<std::string> DecodeString();

    // Reads exactly |length| raw bytes into |buf|.
    android::base::Result<void> DecodeBytes(void* buf, size_t length);

    // Reads |length| bytes of string data whose length was already decoded.
    android::base::Result<std::string> DecodeStringBody(uint32_t length);

    ByteOrder host_byte_order() const { return host_; }

  private:
    android::base::Result<void> Write(const void* buf, size_t length);

    SyncSocket* socket_;
    ByteOrder host_;
};

}  // namespace adbsync
