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

#include "JobStageBase.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <string>

#include "core/ILogger.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[job " << context.jobId << "] [" << getName() << "] - " << message)

namespace mts::orchestrator
{
    namespace
    {
        constexpr float minProgressStep{ 0.01f };
    }

    void JobStageBase::modifyJob(const JobContext& context, const std::function<void(db::Job& job)>& modifier)
    {
        db::Session& session{ _dependencies.db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        const db::Job::pointer job{ db::Job::find(session, context.jobId) };
        if (!job)
            throw Exception{ "Job " + std::string{ context.jobId.getAsString() } + " not found" };

        modifier(*job.modify());
    }

    void JobStageBase::reportProgress(JobContext& context, float progress)
    {
        progress = std::clamp(progress, 0.f, 1.f);
        if (progress <= context.progress)
            return;

        if (progress < 1.f && progress - context.progress < minProgressStep)
            return;

        context.progress = progress;
        _notifier.update(context.jobId, [&](db::Job& job) { job.setProgress(progress); });
    }

    void JobStageBase::reportRetry(JobContext& context)
    {
        context.retryCount += 1;
        _notifier.update(context.jobId, [&](db::Job& job) { job.setRetryCount(context.retryCount); });
    }

    bool JobStageBase::waitBeforeRetry(const JobContext& context, std::size_t retryIndex)
    {
        const std::chrono::milliseconds delay{ _config.transfer.retryPolicy.computeJitteredDelay(retryIndex) };
        LOG(DEBUG, "Waiting " << delay.count() << " ms before retrying");

        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock{ mutex };
        cv.wait_for(lock, context.stopToken, delay, [] { return false; });

        return !context.stopToken.stop_requested();
    }

    StageOutcome JobStageBase::runTransferAttempts(JobContext& context, std::string_view operation, const TransferAttemptFunc& attempt)
    {
        std::size_t failedAttempts{};
        while (true)
        {
            if (context.stopToken.stop_requested())
                return StageCancelled{};

            transfer::TransferOutcome outcome{ attempt() };
            if (std::holds_alternative<transfer::TransferCompleted>(outcome))
                return StageCompleted{};
            if (std::holds_alternative<transfer::TransferCancelled>(outcome))
                return StageCancelled{};

            const transfer::TransferError& error{ std::get<transfer::TransferError>(outcome) };
            std::string detail{ std::string{ operation } + " failed: " + std::string{ transfer::toString(error.type) } + ": " + error.detail };

            if (!transfer::isTransient(error.type))
                return StageFailed{ error.getErrorKind(), std::move(detail) };

            if (failedAttempts++ >= _config.stageMaxRetries)
            {
                detail += " (" + std::to_string(failedAttempts) + " attempts)";
                return StageFailed{ error.getErrorKind(), std::move(detail) };
            }

            LOG(WARNING, detail << ", retrying");
            reportRetry(context);
            if (!waitBeforeRetry(context, failedAttempts - 1))
                return StageCancelled{};
        }
    }
} // namespace mts::orchestrator
