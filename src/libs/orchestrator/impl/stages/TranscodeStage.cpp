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

#include "TranscodeStage.hpp"

#include <system_error>

#include "codec/ICodecRunner.hpp"
#include "core/ILogger.hpp"
#include "encoder/IEncoderSlotPool.hpp"

#include "JobFiles.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[job " << context.jobId << "] [Transcode] - " << message)

namespace mts::orchestrator
{
    namespace
    {
        struct TranscodeParameters
        {
            codec::TargetProfile profile;
            std::optional<std::filesystem::path> outputPath;
        };

        std::string createFailureDetail(const codec::ExitOutcome& outcome)
        {
            std::string detail{ "Transcode failed: " };
            detail += codec::toString(outcome.reason);
            if (outcome.exitCode)
                detail += ", exit code " + std::to_string(*outcome.exitCode);
            if (outcome.signal)
                detail += ", signal " + std::to_string(*outcome.signal);
            if (!outcome.detail.empty())
                detail += ": " + outcome.detail;

            return detail;
        }
    } // namespace

    TranscodeStage::TranscodeStage(const InitParams& initParams)
        : JobStageBase{ initParams }
    {
    }

    StageOutcome TranscodeStage::process(JobContext& context)
    {
        const TranscodeParameters parameters{ visitJob(context, [this](const db::Job& job) {
            return TranscodeParameters{ toTargetProfile(job), getOutputPath(_config, job) };
        }) };

        if (!parameters.outputPath)
            return StageFailed{ db::ErrorKind::FatalInput, "Unsupported container '" + parameters.profile.container + "'" };

        const std::filesystem::path& outputPath{ *parameters.outputPath };
        if (std::filesystem::exists(outputPath))
        {
            LOG(INFO, "Using cached output " << outputPath);
            reportProgress(context, 1.f);
            return StageCompleted{};
        }

        const std::filesystem::path sourcePath{ getSourcePath(_config, context.jobId) };
        if (!std::filesystem::exists(sourcePath))
            return StageFailed{ db::ErrorKind::FatalInput, "Source file " + sourcePath.string() + " is missing" };

        const std::filesystem::path partialOutputPath{ getPartialOutputPath(outputPath, context.jobId) };

        std::size_t recoverableFailures{};
        bool timedOut{};
        while (true)
        {
            if (context.stopToken.stop_requested())
                return StageCancelled{};

            encoder::AcquireResult acquireResult{ _dependencies.encoderSlotPool.acquire(context.jobId, _config.encoderSlotAcquireTimeout, context.stopToken) };
            if (std::holds_alternative<encoder::Cancelled>(acquireResult))
                return StageCancelled{};
            if (std::holds_alternative<encoder::Busy>(acquireResult))
            {
                // waits as long as it takes
                LOG(DEBUG, "No encoder slot available, waiting again");
                reportRetry(context);
                continue;
            }

            codec::ExitOutcome outcome;
            {
                const encoder::Slot slot{ std::move(std::get<encoder::Slot>(acquireResult)) };
                LOG(DEBUG, "Transcoding using encoder slot " << slot.getId());

                outcome = _dependencies.codecRunner.run(sourcePath, partialOutputPath, parameters.profile, slot, [&](float progress) { reportProgress(context, progress); }, context.stopToken);
            }

            if (outcome.isSuccess())
            {
                std::error_code ec;
                std::filesystem::rename(partialOutputPath, outputPath, ec);
                if (ec)
                    return StageFailed{ db::ErrorKind::FatalInput, "Cannot rename " + partialOutputPath.string() + ": " + ec.message() };

                LOG(INFO, "Transcoded into " << outputPath);
                reportProgress(context, 1.f);
                return StageCompleted{};
            }

            {
                std::error_code ec;
                std::filesystem::remove(partialOutputPath, ec);
            }

            if (outcome.reason == codec::ExitReason::Cancelled)
                return StageCancelled{};

            std::string detail{ createFailureDetail(outcome) };
            if (outcome.kind == codec::ExitKind::Fatal)
                return StageFailed{ db::ErrorKind::FatalInput, std::move(detail) };

            if (outcome.reason == codec::ExitReason::TimedOut)
            {
                // the input is likely to be the cause
                if (timedOut)
                    return StageFailed{ db::ErrorKind::FatalInput, detail + " (twice)" };
                timedOut = true;
            }

            if (recoverableFailures++ >= _config.codecMaxRecoverableRetries)
            {
                const db::ErrorKind kind{ outcome.reason == codec::ExitReason::ResourceExhausted ? db::ErrorKind::ResourceExhausted : db::ErrorKind::Transient };
                return StageFailed{ kind, detail + " (" + std::to_string(recoverableFailures) + " attempts)" };
            }

            LOG(WARNING, detail << ", retrying");
            reportRetry(context);
            if (!waitBeforeRetry(context, recoverableFailures - 1))
                return StageCancelled{};
        }
    }
} // namespace mts::orchestrator
