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

#include "Db.hpp"

#include <atomic>

#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Session.hpp"

namespace mts::db
{
    namespace
    {
        class Connection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            Connection(const std::filesystem::path& dbPath)
                : Wt::Dbo::backend::Sqlite3{ dbPath.string() }
            {
                prepare();
            }

            Connection(const Connection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                prepare();
            }
            ~Connection() override = default;

        private:
            Connection& operator=(const Connection&) = delete;
            Connection(Connection&&) = delete;
            Connection&& operator=(Connection&&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<Connection>(*this);
            }

            void prepare()
            {
                // WAL lets job threads read while another one persists progress
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                executeSql("PRAGMA foreign_keys=ON");
            }
        };
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    namespace
    {
        std::uint64_t generateInstanceId()
        {
            static std::atomic<std::uint64_t> nextInstanceId{};
            return nextInstanceId++;
        }
    } // namespace

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
        : _instanceId{ generateInstanceId() }
    {
        std::string checkType{ "quick" };
        MTS_LOG(DB, INFO, "Creating connection pool on file " << dbPath);

        auto connection{ std::make_unique<Connection>(dbPath) };
        if (core::IConfig * config{ core::Service<core::IConfig>::get() }) // not set in unit tests
        {
            connection->setProperty("show-queries", config->getBool("db-show-queries", false) ? "true" : "false");
            checkType = config->getString("db-integrity-check", "quick");
        }

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), connectionCount) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });
        _connectionPool = std::move(connectionPool);

        executeSql("PRAGMA temp_store=MEMORY");

        if (checkType == "quick")
            performIntegrityCheck(IntegrityCheckType::Quick);
        else if (checkType == "full")
            performIntegrityCheck(IntegrityCheckType::Full);
        else if (checkType != "none")
            throw Exception{ "Invalid 'db-integrity-check' value: '" + checkType + "'. Expected 'quick', 'full' or 'none'." };
    }

    void Db::executeSql(const std::string& sql)
    {
        ScopedConnection connection{ *_connectionPool };
        connection->executeSql(sql);
    }

    Session& Db::getTLSSession()
    {
        // sessions are owned by their database, a thread may outlive several databases (tests)
        struct TLSSession
        {
            std::uint64_t dbInstanceId{};
            Session* session{};
        };
        static thread_local TLSSession tlsSession;

        if (!tlsSession.session || tlsSession.dbInstanceId != _instanceId)
        {
            auto newSession{ std::make_unique<Session>(*this) };
            tlsSession = TLSSession{ _instanceId, newSession.get() };

            std::scoped_lock lock{ _tlsSessionsMutex };
            _tlsSessions.push_back(std::move(newSession));
        }

        return *tlsSession.session;
    }

    void Db::performIntegrityCheck(IntegrityCheckType checkType)
    {
        ScopedConnection connection{ *_connectionPool };

        const std::string_view checkName{ checkType == IntegrityCheckType::Full ? "integrity" : "quick" };
        MTS_LOG(DB, INFO, "Performing " << checkName << " database check...");

        auto statement{ connection->prepareStatement(checkType == IntegrityCheckType::Full ? "PRAGMA integrity_check" : "PRAGMA quick_check") };
        statement->execute();

        bool passed{};
        std::string result;
        result.reserve(64);
        while (statement->nextRow())
        {
            result.clear();
            statement->getResult(0, &result, static_cast<int>(result.capacity()));

            if (result == "ok")
            {
                passed = true;
                break;
            }

            MTS_LOG(DB, ERROR, "Database check error: " << result);
        }

        if (!passed)
            throw Exception{ "Database check failed! Please restore from a backup or recreate the database." };

        MTS_LOG(DB, INFO, "Database " << checkName << " check passed!");
    }

    Db::ScopedConnection::ScopedConnection(Wt::Dbo::SqlConnectionPool& pool)
        : _connectionPool{ pool }
        , _connection{ _connectionPool.getConnection() }
    {
    }

    Db::ScopedConnection::~ScopedConnection()
    {
        _connectionPool.returnConnection(std::move(_connection));
    }
} // namespace mts::db
