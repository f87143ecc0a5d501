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

#include "orchestrator/Config.hpp"

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"

namespace mts::orchestrator
{
    namespace
    {
        constexpr unsigned long maxJobRetentionDays{ 100 * 365 };

        std::size_t readStrictlyPositive(core::IConfig& config, std::string_view setting, std::size_t def)
        {
            const unsigned long value{ config.getULong(setting, def) };
            if (value == 0)
                throw core::MtsException{ "Setting '" + std::string{ setting } + "' must be greater than 0" };

            return value;
        }
    } // namespace

    Config readConfig(core::IConfig& config)
    {
        using namespace std::chrono;

        Config res;

        res.workingDirectory = config.getPath("working-dir", res.workingDirectory);
        if (res.workingDirectory.empty())
            throw core::MtsException{ "Setting 'working-dir' must not be empty" };

        res.maxConcurrentJobs = readStrictlyPositive(config, "max-concurrent-jobs", res.maxConcurrentJobs);
        res.encoderSlotCount = readStrictlyPositive(config, "encoder-slots", res.encoderSlotCount);
        res.encoderSlotAcquireTimeout = seconds{ readStrictlyPositive(config, "encoder-slot-acquire-timeout-seconds", res.encoderSlotAcquireTimeout.count()) };

        {
            const std::size_t chunkSize{ config.getULong("transfer-chunk-size", res.transfer.chunkSize) };
            res.transfer.chunkSize = transfer::clampChunkSize(chunkSize);
            if (res.transfer.chunkSize != chunkSize)
                MTS_LOG(ORCHESTRATOR, WARNING, "Setting 'transfer-chunk-size' clamped from " << chunkSize << " to " << res.transfer.chunkSize);
        }
        res.transfer.retryPolicy.maxAttempts = readStrictlyPositive(config, "transfer-max-attempts", res.transfer.retryPolicy.maxAttempts);
        res.transfer.retryPolicy.baseDelay = milliseconds{ config.getULong("transfer-backoff-base-ms", res.transfer.retryPolicy.baseDelay.count()) };
        res.transfer.retryPolicy.maxDelay = milliseconds{ config.getULong("transfer-backoff-max-ms", res.transfer.retryPolicy.maxDelay.count()) };
        if (res.transfer.retryPolicy.maxDelay < res.transfer.retryPolicy.baseDelay)
            throw core::MtsException{ "Setting 'transfer-backoff-max-ms' must not be lower than 'transfer-backoff-base-ms'" };
        res.httpTimeout = seconds{ readStrictlyPositive(config, "http-timeout-seconds", res.httpTimeout.count()) };

        res.stageMaxRetries = config.getULong("stage-max-retries", res.stageMaxRetries);
        res.codecMaxRecoverableRetries = config.getULong("codec-max-recoverable-retries", res.codecMaxRecoverableRetries);

        res.ffmpeg.ffmpegFile = config.getPath("ffmpeg-file", res.ffmpeg.ffmpegFile);
        res.ffmpeg.ffprobeFile = config.getPath("ffprobe-file", res.ffmpeg.ffprobeFile);
        res.ffmpeg.timeoutBase = seconds{ readStrictlyPositive(config, "codec-timeout-base-seconds", duration_cast<seconds>(res.ffmpeg.timeoutBase).count()) };
        res.ffmpeg.timeoutPerMB = seconds{ config.getULong("codec-timeout-seconds-per-mb", duration_cast<seconds>(res.ffmpeg.timeoutPerMB).count()) };
        res.ffmpeg.durationQueryTimeout = seconds{ readStrictlyPositive(config, "codec-duration-query-timeout-seconds", duration_cast<seconds>(res.ffmpeg.durationQueryTimeout).count()) };

        res.encryptionSecretFile = config.getPath("encryption-secret-file", res.workingDirectory / "secret");

        res.gcInterval = seconds{ config.getULong("gc-interval-seconds", res.gcInterval.count()) };
        res.gcSourceDirectorySizeThreshold = config.getULong("gc-source-dir-size-threshold", res.gcSourceDirectorySizeThreshold);
        res.gcOutputDirectorySizeThreshold = config.getULong("gc-output-dir-size-threshold", res.gcOutputDirectorySizeThreshold);
        {
            const unsigned long jobRetentionDays{ config.getULong("job-retention-days", res.jobRetention.count() / 24) };
            if (jobRetentionDays > maxJobRetentionDays)
                throw core::MtsException{ "Setting 'job-retention-days' must not be greater than " + std::to_string(maxJobRetentionDays) };
            res.jobRetention = hours{ 24 * jobRetentionDays };
        }

        return res;
    }
} // namespace mts::orchestrator
