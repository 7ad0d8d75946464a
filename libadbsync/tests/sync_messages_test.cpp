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

#include "adbsync/sync_messages.h"

#include <gtest/gtest.h>

#include <errno.h>

#include <variant>

#include "adbsync/sync_error.h"
#include "fake_sync_socket.h"

namespace adbsync {

class SyncMessagesTest : public ::testing::Test {
  protected:
    android::base::Result<SyncMessage> Read(SyncMessageKind kind) {
        return ReadSyncMessage(codec_, kind);
    }

    void ScriptStatFields(uint32_t mode, uint32_t size, uint32_t mtime) {
        socket_.ScriptUint32(mode);
        socket_.ScriptUint32(size);
        socket_.ScriptUint32(mtime);
    }

    FakeSyncSocket socket_;
    SyncCodec codec_{&socket_};
};

TEST_F(SyncMessagesTest, Status_okay) {
    socket_.ScriptCommand(SyncCommand::kOkay);

    auto message = Read(SyncMessageKind::kStatus);
    ASSERT_TRUE(message) << message.error();
    ASSERT_TRUE(std::holds_alternative<SyncStatus>(*message));
    EXPECT_EQ(SyncCommand::kOkay, std::get<SyncStatus>(*message).command);
    EXPECT_EQ(0u, socket_.unread());
}

TEST_F(SyncMessagesTest, Status_fail) {
    socket_.ScriptCommand(SyncCommand::kFail);
    socket_.ScriptString("couldn't create file: Read-only file system");

    auto message = Read(SyncMessageKind::kStatus);
    ASSERT_FALSE(message);
    EXPECT_EQ(EREMOTEIO, message.error().code());
    EXPECT_EQ("couldn't create file: Read-only file system", message.error().message());
    EXPECT_EQ(0u, socket_.unread());
}

TEST_F(SyncMessagesTest, Stat) {
    socket_.ScriptCommand(SyncCommand::kStat);
    ScriptStatFields(0100644, 42, 1700000000);

    auto message = Read(SyncMessageKind::kStat);
    ASSERT_TRUE(message) << message.error();
    const SyncStat& stat = std::get<SyncStat>(*message);
    EXPECT_EQ(SyncCommand::kStat, stat.command);
    EXPECT_EQ(0100644u, stat.mode);
    EXPECT_EQ(42, stat.size);
    EXPECT_EQ(1700000000, stat.mtime);
}

TEST_F(SyncMessagesTest, Stat_size_is_signed) {
    socket_.ScriptCommand(SyncCommand::kStat);
    ScriptStatFields(0100644, 0xffffffff, 0);

    auto message = Read(SyncMessageKind::kStat);
    ASSERT_TRUE(message) << message.error();
    EXPECT_EQ(-1, std::get<SyncStat>(*message).size);
}

TEST_F(SyncMessagesTest, Stat_done_is_unexpected) {
    // DONE only terminates streams; a STAT reply can't be DONE.
    socket_.ScriptCommand(SyncCommand::kDone);
    ScriptStatFields(0, 0, 0);

    auto message = Read(SyncMessageKind::kStat);
    ASSERT_FALSE(message);
    EXPECT_EQ(EPROTO, message.error().code());
    EXPECT_EQ(12u, socket_.unread());
}

TEST_F(SyncMessagesTest, Dent) {
    socket_.ScriptCommand(SyncCommand::kDent);
    ScriptStatFields(040755, 4096, 1234);
    socket_.ScriptString("Download");

    auto message = Read(SyncMessageKind::kDent);
    ASSERT_TRUE(message) << message.error();
    const SyncDent& dent = std::get<SyncDent>(*message);
    EXPECT_EQ(SyncCommand::kDent, dent.command);
    EXPECT_EQ(040755u, dent.stat.mode);
    EXPECT_EQ(4096, dent.stat.size);
    EXPECT_EQ(1234, dent.stat.mtime);
    EXPECT_EQ("Download", dent.name);
    EXPECT_EQ(0u, socket_.unread());
}

TEST_F(SyncMessagesTest, Dent_done_consumes_tail) {
    socket_.ScriptCommand(SyncCommand::kDone);
    ScriptStatFields(0, 0, 0);
    socket_.ScriptString("");
    socket_.Script("next");

    auto message = Read(SyncMessageKind::kDent);
    ASSERT_TRUE(message) << message.error();
    EXPECT_EQ(SyncCommand::kDone, std::get<SyncDent>(*message).command);
    EXPECT_EQ(4u, socket_.unread());
}

TEST_F(SyncMessagesTest, Dent_data_is_protocol_error) {
    socket_.ScriptCommand(SyncCommand::kData);
    socket_.ScriptUint32(3);
    socket_.Script("abc");

    auto message = Read(SyncMessageKind::kDent);
    ASSERT_FALSE(message);
    EXPECT_EQ(SyncErrorKind::kProtocol, GetSyncErrorKind(message.error()));
    EXPECT_NE(std::string::npos, message.error().message().find("DATA"));
    // No shape fields are read for an unexpected token.
    EXPECT_EQ(7u, socket_.unread());
}

TEST_F(SyncMessagesTest, Data) {
    socket_.ScriptCommand(SyncCommand::kData);
    socket_.ScriptUint32(5);
    socket_.Script("hello");

    auto message = Read(SyncMessageKind::kData);
    ASSERT_TRUE(message) << message.error();
    EXPECT_EQ(SyncCommand::kData, std::get<SyncData>(*message).command);
    EXPECT_EQ(5u, std::get<SyncData>(*message).size);
    // The payload is left for the caller.
    EXPECT_EQ(5u, socket_.unread());
}

TEST_F(SyncMessagesTest, Data_done) {
    socket_.ScriptCommand(SyncCommand::kDone);
    socket_.ScriptUint32(0);

    auto message = Read(SyncMessageKind::kData);
    ASSERT_TRUE(message) << message.error();
    EXPECT_EQ(SyncCommand::kDone, std::get<SyncData>(*message).command);
    EXPECT_EQ(0u, socket_.unread());
}

TEST_F(SyncMessagesTest, Data_fail) {
    socket_.ScriptCommand(SyncCommand::kFail);
    socket_.ScriptString("open failed: No such file or directory");

    auto message = Read(SyncMessageKind::kData);
    ASSERT_FALSE(message);
    EXPECT_EQ(SyncErrorKind::kRemote, GetSyncErrorKind(message.error()));
    EXPECT_EQ("open failed: No such file or directory", message.error().message());
}

TEST_F(SyncMessagesTest, Truncated_frame) {
    socket_.ScriptCommand(SyncCommand::kStat);
    socket_.ScriptUint32(0100644);

    auto message = Read(SyncMessageKind::kStat);
    ASSERT_FALSE(message);
    EXPECT_EQ(SyncErrorKind::kIo, GetSyncErrorKind(message.error()));
}

}  // namespace adbsync
