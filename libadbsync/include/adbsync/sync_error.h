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

#include <errno.h>

#include <ostream>
#include <string>
#include <utility>

#include <android-base/result.h>

// Sync operations report failures as android::base::Result errors. The
// ResultError code is errno-style and encodes the failure category:
//
//   EINVAL, ENAMETOOLONG   bad argument, detected before any I/O
//   EPROTO                 unexpected or malformed frame from the remote
//   EREMOTEIO              the remote answered FAIL; the message is its text
//   ECANCELED              the caller's cancellation flag was set
//   anything else          the byte stream failed (ECONNRESET on EOF)

namespace adbsync {

enum class SyncErrorKind {
    kInvalidArgument,
    kIo,
    kProtocol,
    kRemote,
    kCancelled,
};

SyncErrorKind GetSyncErrorKind(int code);

inline SyncErrorKind GetSyncErrorKind(const android::base::ResultError& error) {
    return GetSyncErrorKind(error.code());
}

std::ostream& operator<<(std::ostream& os, SyncErrorKind kind);

inline android::base::ResultError InvalidArgumentError(std::string message) {
    return android::base::ResultError(std::move(message), EINVAL);
}

inline android::base::ResultError ProtocolError(std::string message) {
    return android::base::ResultError("protocol fault: " + message, EPROTO);
}

inline android::base::ResultError RemoteError(std::string message) {
    return android::base::ResultError(std::move(message), EREMOTEIO);
}

inline android::base::ResultError CancelledError(std::string message) {
    return android::base::ResultError(std::move(message), ECANCELED);
}

}  // namespace adbsync
