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

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace mts::db
{
    class IDb;
}

namespace mts::orchestrator
{
    struct Config;

    // Periodically trims the work directories and purges the old terminated jobs and orphaned transfer sessions
    class GarbageCollector
    {
    public:
        using FilesInUseGetter = std::function<std::set<std::filesystem::path>()>;

        GarbageCollector(boost::asio::io_context& ioContext, const Config& config, db::IDb& db, FilesInUseGetter filesInUseGetter);
        ~GarbageCollector() = default;
        GarbageCollector(const GarbageCollector&) = delete;
        GarbageCollector& operator=(const GarbageCollector&) = delete;

        void start();
        void collect();

        // Removes the most recent files first until the directory size fits in the threshold
        // Returns the number of removed files
        static std::size_t trimDirectory(const std::filesystem::path& directory, std::uint64_t sizeThreshold, const std::set<std::filesystem::path>& filesInUse);

    private:
        void scheduleNextCollect();

        struct PurgeResult
        {
            std::size_t jobCount{};
            std::size_t transferSessionCount{};
        };
        // Old terminated jobs and the transfer sessions no job refers to
        PurgeResult purgeDatabase();

        boost::asio::io_context& _ioContext;
        boost::asio::steady_timer _timer;
        const Config& _config;
        db::IDb& _db;
        FilesInUseGetter _filesInUseGetter;
    };
} // namespace mts::orchestrator
