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

#include "core/Random.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/TransferSession.hpp"

namespace mts::db::tests
{
    namespace
    {
        std::filesystem::path makeTmpDbPath()
        {
            return std::filesystem::temp_directory_path() / ("mts-test-" + std::to_string(core::random::getRandom<unsigned>(0, 0xFFFFFFFF)) + ".db");
        }
    } // namespace

    TmpDatabase::TmpDatabase()
        : _tmpFile{ makeTmpDbPath() }
        , _fileDeleter{ _tmpFile }
        , _db{ createDb(_tmpFile, 4) }
    {
    }

    DatabaseFixture::~DatabaseFixture()
    {
        testDatabaseEmpty();
    }

    void DatabaseFixture::SetUpTestSuite()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
        {
            db::Session s{ _tmpDb->getDb() };
            s.prepareTablesIfNeeded();
            s.createIndexesIfNeeded();
        }
    }

    void DatabaseFixture::TearDownTestSuite()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::testDatabaseEmpty()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(Job::getCount(session), 0);
        EXPECT_EQ(TransferSession::getCount(session), 0);
    }

    TEST_F(DatabaseFixture, prepareTablesTwice)
    {
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }
} // namespace mts::db::tests
