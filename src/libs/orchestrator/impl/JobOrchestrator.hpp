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

#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "core/IOContextRunner.hpp"
#include "orchestrator/IJobOrchestrator.hpp"

#include "GarbageCollector.hpp"
#include "IJobStage.hpp"
#include "StatusNotifier.hpp"

namespace mts::orchestrator
{
    class JobOrchestrator final : public IJobOrchestrator
    {
    public:
        JobOrchestrator(const Config& config, const Dependencies& dependencies);
        ~JobOrchestrator() override;
        JobOrchestrator(const JobOrchestrator&) = delete;
        JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    private:
        core::UUID submitJob(const JobDescriptor& descriptor) override;
        std::optional<StatusSubscription> streamStatus(const core::UUID& jobId, StatusCallback callback) override;
        bool cancelJob(const core::UUID& jobId) override;
        std::optional<JobStatus> getStatus(const core::UUID& jobId) override;
        std::size_t recoverJobs() override;
        bool waitForIdle(std::stop_token stopToken) override;

        // Runtime state of a queued or running job
        struct ActiveJob
        {
            std::stop_source stopSource;
            bool claimed{};         // by a job thread, or by a cancellation that happened before
            bool cancelRequested{}; // stop requests are also issued on shutdown
        };

        bool scheduleJob(const core::UUID& jobId);
        void processJob(const core::UUID& jobId);
        void runJob(const core::UUID& jobId, const ActiveJob& activeJob);
        IJobStage& getStage(db::JobState state);
        db::JobState getNextState(db::JobState state) const;

        JobStatus transition(const core::UUID& jobId, db::JobState state);
        JobStatus fail(const core::UUID& jobId, db::JobState stage, const StageFailed& failure);
        JobStatus cancel(const core::UUID& jobId);
        void releaseJobResources(const core::UUID& jobId);
        void onJobEnded(const core::UUID& jobId);
        bool isCancelRequested(const core::UUID& jobId);

        std::set<std::filesystem::path> getFilesInUse();

        const Config _config;
        const Dependencies _dependencies;
        StatusNotifier _notifier;
        std::vector<std::unique_ptr<IJobStage>> _stages;

        std::mutex _mutex;
        std::condition_variable_any _idleCondition;
        std::unordered_map<core::UUID, std::shared_ptr<ActiveJob>> _activeJobs;

        boost::asio::io_context _gcIoContext;
        GarbageCollector _garbageCollector;
        boost::asio::io_context _jobIoContext;
        core::IOContextRunner _gcIoContextRunner;
        core::IOContextRunner _jobIoContextRunner;
    };
} // namespace mts::orchestrator
