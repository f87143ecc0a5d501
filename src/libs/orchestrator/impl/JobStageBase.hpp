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

#include <functional>
#include <string_view>

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "orchestrator/Config.hpp"
#include "orchestrator/Exception.hpp"
#include "orchestrator/IJobOrchestrator.hpp"
#include "transfer/Types.hpp"

#include "IJobStage.hpp"
#include "StatusNotifier.hpp"

namespace mts::orchestrator
{
    class JobStageBase : public IJobStage
    {
    public:
        struct InitParams
        {
            const Config& config;
            const Dependencies& dependencies;
            StatusNotifier& notifier;
        };

        JobStageBase(const InitParams& initParams)
            : _config{ initParams.config }
            , _dependencies{ initParams.dependencies }
            , _notifier{ initParams.notifier }
        {
        }

    protected:
        // Read only access to the persisted job
        template<typename Func>
        auto visitJob(const JobContext& context, Func&& func)
        {
            db::Session& session{ _dependencies.db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            const db::Job::pointer job{ db::Job::find(session, context.jobId) };
            if (!job)
                throw Exception{ "Job " + std::string{ context.jobId.getAsString() } + " not found" };

            return func(*job);
        }

        // For changes that are not part of the job status
        void modifyJob(const JobContext& context, const std::function<void(db::Job& job)>& modifier);

        // Progress is monotonic within a stage, only significant changes are notified
        void reportProgress(JobContext& context, float progress);
        void reportRetry(JobContext& context);

        // Returns false if the job got cancelled while waiting
        bool waitBeforeRetry(const JobContext& context, std::size_t retryIndex);

        // Runs a whole transfer, retrying the transient failures up to the stage retry bound
        using TransferAttemptFunc = std::function<transfer::TransferOutcome()>;
        StageOutcome runTransferAttempts(JobContext& context, std::string_view operation, const TransferAttemptFunc& attempt);

        const Config& _config;
        const Dependencies& _dependencies;
        StatusNotifier& _notifier;
    };
} // namespace mts::orchestrator
