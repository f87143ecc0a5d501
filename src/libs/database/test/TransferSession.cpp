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

#include "database/objects/Job.hpp"
#include "database/objects/TransferSession.hpp"

namespace mts::db::tests
{
    using ScopedTransferSession = ScopedEntity<db::TransferSession>;

    TEST_F(DatabaseFixture, TransferSession)
    {
        const core::UUID token{ core::UUID::generate() };
        ScopedTransferSession transferSession{ session, token, TransferDirection::Upload, "http://publish/files/", "/tmp/out.enc" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(TransferSession::getCount(session), 1);

            const TransferSession::pointer found{ TransferSession::find(session, token) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), transferSession.getId());
            EXPECT_EQ(found->getToken(), token);
            EXPECT_EQ(found->getDirection(), TransferDirection::Upload);
            EXPECT_EQ(found->getEndpoint(), "http://publish/files/");
            EXPECT_EQ(found->getLocalPath(), "/tmp/out.enc");
            EXPECT_TRUE(found->getRemoteSessionId().empty());
            EXPECT_EQ(found->getOffset(), 0);
            EXPECT_FALSE(found->getExpiresAt().isValid());
            EXPECT_FALSE(found->isFinalized());
        }
    }

    TEST_F(DatabaseFixture, TransferSession_progress)
    {
        ScopedTransferSession transferSession{ session, core::UUID::generate(), TransferDirection::Download, "http://source/media", "/tmp/media" };

        const Wt::WDateTime expiry{ Wt::WDateTime::fromTime_t(2'000'000'000) };
        {
            auto transaction{ session.createWriteTransaction() };

            TransferSession::pointer s{ transferSession.get() };
            s.modify()->setRemoteSessionId("http://source/media");
            s.modify()->setTotalLength(100 * 1024 * 1024);
            s.modify()->setChecksum("beef");
            s.modify()->setExpiresAt(expiry);
            s.modify()->setOffset(40 * 1024 * 1024);
        }

        {
            auto transaction{ session.createWriteTransaction() };

            TransferSession::pointer s{ transferSession.get() };
            EXPECT_EQ(s->getRemoteSessionId(), "http://source/media");
            EXPECT_EQ(s->getTotalLength(), 100 * 1024 * 1024);
            EXPECT_EQ(s->getOffset(), 40 * 1024 * 1024);
            EXPECT_EQ(s->getChecksum(), "beef");
            EXPECT_EQ(s->getExpiresAt(), expiry);

            s.modify()->setFinalized(true);
        }

        {
            auto transaction{ session.createReadTransaction() };

            const TransferSession::pointer s{ transferSession.get() };
            EXPECT_TRUE(s->isFinalized());
            EXPECT_TRUE(s->isVerified());
        }
    }

    TEST_F(DatabaseFixture, TransferSession_removeOrphansBefore)
    {
        const core::UUID sourceToken{ core::UUID::generate() };
        const core::UUID publishToken{ core::UUID::generate() };
        const core::UUID orphanToken{ core::UUID::generate() };
        ScopedTransferSession sourceSession{ session, sourceToken, TransferDirection::Download, "http://source/media", "/tmp/media" };
        ScopedTransferSession publishSession{ session, publishToken, TransferDirection::Upload, "http://publish/files/", "/tmp/out.enc" };
        ScopedTransferSession orphanSession{ session, orphanToken, TransferDirection::Upload, "http://publish/files/", "/tmp/other.enc" };

        ScopedEntity<Job> job{ session, core::UUID::generate() };
        {
            auto transaction{ session.createWriteTransaction() };
            job.get().modify()->setSourceSessionToken(sourceToken.getAsString());
            job.get().modify()->setPublishSessionToken(publishToken.getAsString());
        }

        {
            auto transaction{ session.createWriteTransaction() };
            EXPECT_EQ(TransferSession::removeOrphansBefore(session, Wt::WDateTime::currentDateTime().addDays(-1)), 0);
            EXPECT_EQ(TransferSession::getCount(session), 3);
        }

        {
            auto transaction{ session.createWriteTransaction() };
            EXPECT_EQ(TransferSession::removeOrphansBefore(session, Wt::WDateTime::currentDateTime().addSecs(10)), 1);
            EXPECT_EQ(TransferSession::getCount(session), 2);
            EXPECT_FALSE(TransferSession::find(session, orphanToken));
            EXPECT_TRUE(TransferSession::find(session, sourceToken));
            EXPECT_TRUE(TransferSession::find(session, publishToken));
        }
    }
} // namespace mts::db::tests
