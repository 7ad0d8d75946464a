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
#include <sys/types.h>
#include <time.h>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <android-base/macros.h>
#include <android-base/result.h>
#include <android-base/unique_fd.h>

#include "adbsync/file_statistics.h"
#include "adbsync/sync_codec.h"
#include "adbsync/sync_socket.h"

namespace adbsync {

// Which device the session talks to. A non-zero transport_id wins over the
// serial; with neither, the adb server picks the only attached device.
struct DeviceData {
    std::string serial;
    uint64_t transport_id = 0;
};

// Receives the cumulative percentage (0-100) of the current transfer. Called
// on the transferring thread; must not throw and should return promptly.
using ProgressCallback = std::function<void(int percent)>;

// One sync conversation with one device over one socket.
//
//   SyncService service(std::move(socket), device);
//   if (auto result = service.Open(); !result) {
//       LOG(ERROR) << "sync failed: " << result.error();
//   }
//   auto entries = service.GetDirectoryListing("/sdcard");
//
// Operations run one at a time and block until the exchange completes. A
// SyncService is not thread-safe. Any failure after I/O has started leaves the
// stream in an unknown framing state, so the session refuses further work and
// must be closed.
class SyncService {
  public:
    SyncService(std::unique_ptr<SyncSocket> socket, DeviceData device);
    ~SyncService();

    // Selects the device and switches the connection into sync mode.
    android::base::Result<void> Open();

    bool IsOpen() const;

    // Sends QUIT if the session is still usable, then releases the socket.
    void Close();

    android::base::Result<FileStatistics> Stat(const std::string& remote_path);

    // Entries come back in the order the device enumerated them.
    android::base::Result<std::vector<FileStatistics>> GetDirectoryListing(
            const std::string& remote_path);

    // Copies everything readable from |source_fd| to |remote_path| on the
    // device, creating it with |permissions| and stamping it with |mtime|.
    // Progress is reported only when |source_fd| is a regular file of known
    // non-zero size. |cancel| may be null.
    android::base::Result<void> Push(android::base::borrowed_fd source_fd,
                                     const std::string& remote_path, mode_t permissions,
                                     time_t mtime, const ProgressCallback& progress,
                                     const std::atomic<bool>* cancel);

    // Copies |remote_path| from the device into |destination_fd|. |cancel|
    // may be null.
    android::base::Result<void> Pull(const std::string& remote_path,
                                     android::base::borrowed_fd destination_fd,
                                     const ProgressCallback& progress,
                                     const std::atomic<bool>* cancel);

    const DeviceData& Device() const { return device_; }

    size_t MaxBufferSize() const { return max_buffer_size_; }

    // Sets the chunk buffer size, header included. Fails with EINVAL unless
    // there is room for at least one payload byte after the DATA header.
    android::base::Result<void> SetMaxBufferSize(size_t size);

  private:
    android::base::Result<void> SelectDevice();
    android::base::Result<void> CheckUsable() const;
    android::base::Result<FileStatistics> DoStat(const std::string& remote_path);
    android::base::Result<void> DoPush(android::base::borrowed_fd source_fd,
                                       const std::string& remote_path, mode_t permissions,
                                       time_t mtime, const ProgressCallback& progress,
                                       const std::atomic<bool>* cancel);
    android::base::Result<void> DoPull(const std::string& remote_path,
                                       android::base::borrowed_fd destination_fd,
                                       const ProgressCallback& progress,
                                       const std::atomic<bool>* cancel);
    char* Buffer();

    std::unique_ptr<SyncSocket> socket_;
    SyncCodec codec_;
    DeviceData device_;

    size_t max_buffer_size_ = kSyncDataMax;
    std::vector<char> buffer_;

    bool open_ = false;
    bool broken_ = false;
    bool closed_ = false;

    DISALLOW_COPY_AND_ASSIGN(SyncService);
};

}  // namespace adbsync
