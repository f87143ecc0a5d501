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

#include "database/Session.hpp"

#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/TransferSession.hpp"

#include "Db.hpp"
#include "Utils.hpp"

namespace mts::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Job>("job");
        _session.mapClass<TransferSession>("transfer_session");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getWriteMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::prepareTablesIfNeeded()
    {
        MTS_LOG(DB, INFO, "Preparing tables...");

        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            MTS_LOG(DB, INFO, "Tables created");
        }
        catch (const Wt::Dbo::Exception& e)
        {
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                MTS_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
            MTS_LOG(DB, DEBUG, "Tables already exist");
        }
    }

    void Session::createIndexesIfNeeded()
    {
        MTS_LOG(DB, INFO, "Creating indexes...");

        auto transaction{ createWriteTransaction() };
        utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS job_uuid_idx ON job(uuid)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS job_state_created_at_idx ON job(state, created_at)");
        utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS job_state_updated_at_idx ON job(state, updated_at)");

        utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS transfer_session_token_idx ON transfer_session(token)");
    }
} // namespace mts::db
