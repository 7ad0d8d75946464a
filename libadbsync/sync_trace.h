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

#include <android-base/logging.h>
#include <android-base/macros.h>
#include <android-base/stringprintf.h>

/* IMPORTANT: if you change the following list, don't
 * forget to update the corresponding 'tags' table in
 * setup_trace_mask() in sync_trace.cpp.
 */
enum AdbSyncTrace {
    IO = 0,
    SYNC,
    TRANSPORT,
};

#define ADBSYNC_VLOG_IS_ON(TAG) \
    ((adbsync_trace_mask & (1 << (TAG))) != 0)

// android-base/logging.h has its own VLOG; tracing here is keyed by tag.
#undef VLOG
#define VLOG(TAG)                          \
    if (LIKELY(!ADBSYNC_VLOG_IS_ON(TAG))) \
        ;                                  \
    else                                   \
        LOG(INFO)

// You must define TRACE_TAG before using this macro.
#define D(...) \
    VLOG(TRACE_TAG) << android::base::StringPrintf(__VA_ARGS__)

extern int adbsync_trace_mask;

// Reads ADBSYNC_TRACE once per process.
void adbsync_trace_init();
void adbsync_trace_enable(AdbSyncTrace trace_tag);

// Hex and printable rendering of the first 16 bytes of |data|.
std::string adbsync_dump_hex(const void* data, size_t byte_count);
