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

#include "FfmpegCodecRunner.hpp"

#include <array>
#include <atomic>
#include <vector>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "encoder/IEncoderSlotPool.hpp"

#include "codec/Exception.hpp"
#include "codec/FfmpegArgs.hpp"
#include "codec/ProgressParser.hpp"

namespace mts::codec
{
#define LOG(severity, message) MTS_LOG(CODEC, severity, "[" << debugId << "] - " << message)

    namespace
    {
        std::atomic<std::size_t> globalId{};

        constexpr std::chrono::milliseconds readTimeout{ 100 };

        void removeOutput(const std::filesystem::path& output)
        {
            std::error_code ec;
            std::filesystem::remove(output, ec);
        }

        ExitOutcome createOutcome(ExitKind kind, ExitReason reason, std::string detail)
        {
            ExitOutcome outcome;
            outcome.kind = kind;
            outcome.reason = reason;
            outcome.detail = std::move(detail);
            return outcome;
        }
    } // namespace

    std::unique_ptr<ICodecRunner> createFfmpegCodecRunner(core::IChildProcessManager& childProcessManager, const FfmpegConfig& config)
    {
        return std::make_unique<FfmpegCodecRunner>(childProcessManager, config);
    }

    FfmpegCodecRunner::FfmpegCodecRunner(core::IChildProcessManager& childProcessManager, const FfmpegConfig& config)
        : _childProcessManager{ childProcessManager }
        , _config{ config }
    {
        if (!std::filesystem::exists(_config.ffmpegFile))
            throw Exception{ "File '" + _config.ffmpegFile.string() + "' does not exist!" };
        if (!std::filesystem::exists(_config.ffprobeFile))
            MTS_LOG(CODEC, WARNING, "File '" << _config.ffprobeFile.string() << "' does not exist, transcode progress will not be reported");
    }

    ExitOutcome FfmpegCodecRunner::run(const std::filesystem::path& input, const std::filesystem::path& output, const TargetProfile& profile, const encoder::Slot& slot, ProgressCallback progressCallback, std::stop_token stopToken)
    {
        const std::size_t debugId{ globalId++ };

        if (!slot.isHeld())
            throw Exception{ "Cannot transcode without a held encoder slot" };

        std::error_code ec;
        if (!std::filesystem::is_regular_file(input, ec))
            return createOutcome(ExitKind::Fatal, ExitReason::InvalidInput, "Input file '" + input.string() + "' does not exist");

        core::IChildProcess::Args args;
        try
        {
            args = buildFfmpegArgs(_config.ffmpegFile, input, output, profile, slot.getId());
        }
        catch (const UnsupportedProfileException& e)
        {
            LOG(ERROR, e.what());
            return createOutcome(ExitKind::Fatal, ExitReason::UnsupportedParameters, e.what());
        }

        const std::chrono::milliseconds timeout{ computeTimeout(input) };
        LOG(INFO, "Transcoding " << input << " to " << output << " using profile '" << profile.label << "' on slot " << slot.getId() << ", timeout = " << std::chrono::duration_cast<std::chrono::seconds>(timeout).count() << "s");

        ProgressParser parser{ queryDuration(input) };

        LOG(DEBUG, "Dumping args (" << args.size() << ")");
        for (const std::string& arg : args)
            LOG(DEBUG, "Arg = '" << arg << "'");

        std::unique_ptr<core::IChildProcess> process;
        try
        {
            process = _childProcessManager.spawnChildProcess(_config.ffmpegFile, args, core::IChildProcessManager::SpawnOptions{ .captureStderr = true });
        }
        catch (const core::ChildProcessException& e)
        {
            LOG(ERROR, "Cannot execute '" << _config.ffmpegFile.string() << "': " << e.what());
            return createOutcome(ExitKind::Fatal, ExitReason::ToolchainError, e.what());
        }

        const auto deadline{ std::chrono::steady_clock::now() + timeout };
        std::optional<ExitReason> killReason;
        std::array<std::byte, 4096> buffer;

        while (true)
        {
            if (stopToken.stop_requested())
                killReason = ExitReason::Cancelled;
            else if (std::chrono::steady_clock::now() >= deadline)
                killReason = ExitReason::TimedOut;

            if (killReason)
            {
                LOG(INFO, "Killing transcoder: " << toString(*killReason));
                process->kill();
                break;
            }

            std::size_t bytesRead{};
            const core::IChildProcess::ReadResult readResult{ process->readSome(buffer, readTimeout, bytesRead) };
            if (readResult == core::IChildProcess::ReadResult::Timeout)
                continue;

            if (bytesRead > 0 && parser.feed(std::string_view{ reinterpret_cast<const char*>(buffer.data()), bytesRead }) && progressCallback)
                progressCallback(parser.getProgress());

            if (readResult == core::IChildProcess::ReadResult::EndOfFile || readResult == core::IChildProcess::ReadResult::Error)
                break;
        }
        parser.flush();

        const core::IChildProcess::ExitStatus status{ process->wait() };
        const std::vector<std::string> diagnostics{ std::cbegin(parser.getDiagnostics()), std::cend(parser.getDiagnostics()) };

        ExitOutcome outcome;
        if (killReason)
        {
            outcome = createOutcome(ExitKind::Recoverable, *killReason, "");
            outcome.signal = status.signal;
        }
        else
        {
            outcome = classifyExit(status, diagnostics);
            if (outcome.isSuccess() && !std::filesystem::exists(output, ec))
                outcome = createOutcome(ExitKind::Fatal, ExitReason::ToolchainError, "No output produced");
        }

        if (outcome.isSuccess())
        {
            LOG(INFO, "Transcode of " << input << " done");
            if (progressCallback && parser.getProgress() < 1)
                progressCallback(1);
        }
        else
        {
            LOG(ERROR, "Transcode of " << input << " failed: " << toString(outcome.kind) << " (" << toString(outcome.reason) << ")");
            for (const std::string& line : diagnostics)
                LOG(DEBUG, "ffmpeg: " << line);

            removeOutput(output);
        }

        return outcome;
    }

    std::optional<std::chrono::microseconds> FfmpegCodecRunner::queryDuration(const std::filesystem::path& input)
    {
        const std::size_t debugId{ globalId++ };

        std::unique_ptr<core::IChildProcess> process;
        try
        {
            process = _childProcessManager.spawnChildProcess(_config.ffprobeFile, buildFfprobeArgs(_config.ffprobeFile, input), core::IChildProcessManager::SpawnOptions{});
        }
        catch (const core::ChildProcessException& e)
        {
            LOG(WARNING, "Cannot query duration of " << input << ": " << e.what());
            return std::nullopt;
        }

        std::string ffprobeOutput;
        const auto deadline{ std::chrono::steady_clock::now() + _config.durationQueryTimeout };
        std::array<std::byte, 256> buffer;
        while (true)
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                LOG(WARNING, "Cannot query duration of " << input << ": timeout");
                process->kill();
                break;
            }

            std::size_t bytesRead{};
            const core::IChildProcess::ReadResult readResult{ process->readSome(buffer, readTimeout, bytesRead) };
            ffprobeOutput.append(reinterpret_cast<const char*>(buffer.data()), bytesRead);

            if (readResult == core::IChildProcess::ReadResult::EndOfFile || readResult == core::IChildProcess::ReadResult::Error)
                break;
        }

        const core::IChildProcess::ExitStatus status{ process->wait() };
        if (!status.exitCode || *status.exitCode != 0)
        {
            LOG(WARNING, "Cannot query duration of " << input << ", ffprobe failed");
            return std::nullopt;
        }

        const std::optional<double> seconds{ core::stringUtils::readAs<double>(core::stringUtils::stringTrim(ffprobeOutput)) };
        if (!seconds || *seconds <= 0)
        {
            LOG(WARNING, "Cannot query duration of " << input << ": unexpected output '" << core::stringUtils::stringTrim(ffprobeOutput) << "'");
            return std::nullopt;
        }

        LOG(DEBUG, "Duration of " << input << " is " << *seconds << "s");
        return std::chrono::microseconds{ static_cast<long long>(*seconds * 1'000'000) };
    }

    std::chrono::milliseconds FfmpegCodecRunner::computeTimeout(const std::filesystem::path& input) const
    {
        std::error_code ec;
        const std::uintmax_t fileSize{ std::filesystem::file_size(input, ec) };
        const std::uintmax_t sizeMB{ ec ? 0 : (fileSize + 1024 * 1024 - 1) / (1024 * 1024) };

        return _config.timeoutBase + _config.timeoutPerMB * static_cast<long long>(sizeMB);
    }
} // namespace mts::codec
