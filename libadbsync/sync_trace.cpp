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

#include "sync_trace.h"

#include <ctype.h>
#include <stdint.h>
#include <stdlib.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <android-base/logging.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>

int adbsync_trace_mask;

static std::string get_trace_setting() {
    const char* setting = getenv("ADBSYNC_TRACE");
    if (setting == nullptr) {
        setting = "";
    }

    return std::string(setting);
}

// Split the space or comma separated list of tags from the trace setting and
// build the trace mask from it. Note that '1' and 'all' are special cases to
// enable all tracing.
static void setup_trace_mask() {
    const std::string trace_setting = get_trace_setting();
    if (trace_setting.empty()) {
        return;
    }

    std::unordered_map<std::string, int> trace_flags = {
        {"1", -1},
        {"all", -1},
        {"io", IO},
        {"sync", SYNC},
        {"transport", TRANSPORT}};

    std::vector<std::string> elements = android::base::Split(trace_setting, " ,");
    for (const auto& elem : elements) {
        if (elem.empty()) continue;

        const auto& flag = trace_flags.find(elem);
        if (flag == trace_flags.end()) {
            LOG(ERROR) << "Unknown trace flag: " << elem;
            continue;
        }

        if (flag->second == -1) {
            adbsync_trace_mask = ~0;
            return;
        } else {
            adbsync_trace_mask |= 1 << flag->second;
        }
    }
}

void adbsync_trace_init() {
    static std::once_flag once;
    std::call_once(once, setup_trace_mask);
}

void adbsync_trace_enable(AdbSyncTrace trace_tag) {
    adbsync_trace_mask |= (1 << trace_tag);
}

std::string adbsync_dump_hex(const void* data, size_t byte_count) {
    byte_count = std::min(byte_count, size_t(16));

    const uint8_t* p = reinterpret_cast<const uint8_t*>(data);

    std::string line;
    for (size_t i = 0; i < byte_count; ++i) {
        android::base::StringAppendF(&line, "%02x", p[i]);
    }
    line.push_back(' ');

    for (size_t i = 0; i < byte_count; ++i) {
        int ch = p[i];
        line.push_back(isprint(ch) ? ch : '.');
    }

    return line;
}
