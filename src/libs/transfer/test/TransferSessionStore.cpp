/*
 * Copyright (C) 2026 MTS contributors
 *
 * This file is part of MTS.
 *
 * MTS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MTS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MTS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Common.hpp"

namespace mts::transfer::tests
{
    TEST_F(TransferFixture, sessionStore)
    {
        TransferSession session{
            .token = core::UUID::generate(),
            .direction = db::TransferDirection::Upload,
            .endpoint = "http://remote.test/files/",
            .remoteSessionId = "http://remote.test/files/42",
            .offset = 0,
            .totalLength = 1'000,
            .checksum = computeChecksum("payload"),
            .expiresAt = Wt::WDateTime::fromTime_t(2'000'000'000),
            .localPath = "/tmp/out.enc",
        };

        EXPECT_FALSE(_store->load(session.token));
        _store->save(session);

        {
            const std::optional<TransferSession> loaded{ _store->load(session.token) };
            ASSERT_TRUE(loaded);
            EXPECT_EQ(loaded->token, session.token);
            EXPECT_EQ(loaded->direction, db::TransferDirection::Upload);
            EXPECT_EQ(loaded->endpoint, session.endpoint);
            EXPECT_EQ(loaded->remoteSessionId, session.remoteSessionId);
            EXPECT_EQ(loaded->offset, 0);
            EXPECT_EQ(loaded->totalLength, 1'000);
            EXPECT_EQ(loaded->checksum, session.checksum);
            EXPECT_EQ(loaded->expiresAt, session.expiresAt);
            EXPECT_EQ(loaded->localPath, session.localPath);
            EXPECT_FALSE(loaded->finalized);
            EXPECT_FALSE(loaded->verified);
        }

        session.offset = 1'000;
        session.finalized = true;
        session.verified = true;
        _store->save(session);

        {
            const std::optional<TransferSession> loaded{ _store->load(session.token) };
            ASSERT_TRUE(loaded);
            EXPECT_EQ(loaded->offset, 1'000);
            EXPECT_TRUE(loaded->isComplete());
            EXPECT_TRUE(loaded->finalized);
            EXPECT_TRUE(loaded->verified);
        }

        _store->remove(session.token);
        EXPECT_FALSE(_store->load(session.token));
        // removing twice is harmless
        _store->remove(session.token);
    }

    TEST_F(TransferFixture, sessionStoreNoExpiry)
    {
        const TransferSession session{
            .token = core::UUID::generate(),
            .direction = db::TransferDirection::Download,
            .endpoint = "http://remote.test/media/source.mkv",
            .remoteSessionId = "http://remote.test/media/source.mkv",
            .offset = 0,
            .totalLength = 0,
            .checksum = "",
            .expiresAt = {},
            .localPath = "/tmp/source.mkv",
        };
        _store->save(session);

        const std::optional<TransferSession> loaded{ _store->load(session.token) };
        ASSERT_TRUE(loaded);
        EXPECT_FALSE(loaded->expiresAt.isValid());
        EXPECT_FALSE(loaded->isExpired(Wt::WDateTime::currentDateTime()));
        EXPECT_TRUE(loaded->checksum.empty());
    }
} // namespace mts::transfer::tests
