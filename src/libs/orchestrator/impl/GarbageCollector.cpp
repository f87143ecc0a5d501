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

#include "GarbageCollector.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <vector>

#include <boost/asio/post.hpp>
#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "database/objects/TransferSession.hpp"
#include "orchestrator/Config.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[Garbage collector] - " << message)

namespace mts::orchestrator
{
    namespace
    {
        struct FileEntry
        {
            std::filesystem::path path;
            std::uint64_t size;
            std::filesystem::file_time_type lastWriteTime;
        };

        std::vector<FileEntry> listFiles(const std::filesystem::path& directory)
        {
            std::vector<FileEntry> files;

            std::error_code ec;
            std::filesystem::directory_iterator itEntry{ directory, ec };
            if (ec)
            {
                LOG(ERROR, "Cannot list " << directory << ": " << ec.message());
                return files;
            }

            for (; itEntry != std::filesystem::directory_iterator{}; itEntry.increment(ec))
            {
                if (ec)
                {
                    LOG(ERROR, "Cannot list " << directory << ": " << ec.message());
                    break;
                }

                if (!itEntry->is_regular_file(ec))
                    continue;

                const std::uint64_t size{ itEntry->file_size(ec) };
                if (ec)
                    continue;
                const std::filesystem::file_time_type lastWriteTime{ itEntry->last_write_time(ec) };
                if (ec)
                    continue;

                files.push_back(FileEntry{ itEntry->path(), size, lastWriteTime });
            }

            return files;
        }
    } // namespace

    GarbageCollector::GarbageCollector(boost::asio::io_context& ioContext, const Config& config, db::IDb& db, FilesInUseGetter filesInUseGetter)
        : _ioContext{ ioContext }
        , _timer{ ioContext }
        , _config{ config }
        , _db{ db }
        , _filesInUseGetter{ std::move(filesInUseGetter) }
    {
    }

    void GarbageCollector::start()
    {
        LOG(INFO, "Collecting every " << _config.gcInterval.count() << " seconds");
        boost::asio::post(_ioContext, [this] { scheduleNextCollect(); });
    }

    void GarbageCollector::collect()
    {
        LOG(DEBUG, "Collecting...");

        const std::set<std::filesystem::path> filesInUse{ _filesInUseGetter() };

        const std::size_t removedSourceCount{ trimDirectory(_config.getSourceDirectory(), _config.gcSourceDirectorySizeThreshold, filesInUse) };
        const std::size_t removedOutputCount{ trimDirectory(_config.getOutputDirectory(), _config.gcOutputDirectorySizeThreshold, filesInUse) };
        const PurgeResult purgeResult{ purgeDatabase() };

        LOG(INFO, "Removed " << removedSourceCount << " source files, " << removedOutputCount << " output files, " << purgeResult.jobCount << " jobs and " << purgeResult.transferSessionCount << " transfer sessions");
    }

    std::size_t GarbageCollector::trimDirectory(const std::filesystem::path& directory, std::uint64_t sizeThreshold, const std::set<std::filesystem::path>& filesInUse)
    {
        std::vector<FileEntry> files{ listFiles(directory) };
        std::sort(std::begin(files), std::end(files), [](const FileEntry& lhs, const FileEntry& rhs) { return lhs.lastWriteTime < rhs.lastWriteTime; });

        std::uint64_t totalSize{};
        for (const FileEntry& file : files)
            totalSize += file.size;

        std::size_t removedCount{};
        while (totalSize > sizeThreshold && !files.empty())
        {
            const FileEntry file{ std::move(files.back()) };
            files.pop_back();

            if (filesInUse.contains(file.path))
                continue;

            std::error_code ec;
            std::filesystem::remove(file.path, ec);
            if (ec)
            {
                LOG(ERROR, "Cannot remove " << file.path << ": " << ec.message());
                continue;
            }

            LOG(DEBUG, "Removed " << file.path << " (" << file.size << " bytes)");
            totalSize -= file.size;
            removedCount += 1;
        }

        return removedCount;
    }

    void GarbageCollector::scheduleNextCollect()
    {
        _timer.expires_after(_config.gcInterval);
        _timer.async_wait([this](boost::system::error_code ec) {
            if (ec)
                return;

            try
            {
                collect();
            }
            catch (const std::exception& e)
            {
                LOG(ERROR, "Collect failed: " << e.what());
            }

            scheduleNextCollect();
        });
    }

    GarbageCollector::PurgeResult GarbageCollector::purgeDatabase()
    {
        if (_config.jobRetention.count() == 0)
            return {};

        const Wt::WDateTime limit{ Wt::WDateTime::fromTimePoint(std::chrono::system_clock::now() - _config.jobRetention) };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        PurgeResult res;
        res.jobCount = db::Job::removeTerminatedBefore(session, limit);
        // a crash may happen between the creation of a session and its registration in the job
        res.transferSessionCount = db::TransferSession::removeOrphansBefore(session, limit);

        return res;
    }
} // namespace mts::orchestrator
