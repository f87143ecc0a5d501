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

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>

#include "codec/ExitOutcome.hpp"
#include "codec/TargetProfile.hpp"

namespace mts::core
{
    class IChildProcessManager;
}

namespace mts::encoder
{
    class Slot;
}

namespace mts::codec
{
    using ProgressCallback = std::function<void(float progress)>; // in [0, 1]

    class ICodecRunner
    {
    public:
        virtual ~ICodecRunner() = default;

        // The slot must be held for the whole run, the partial output is removed on failure
        virtual ExitOutcome run(const std::filesystem::path& input, const std::filesystem::path& output, const TargetProfile& profile, const encoder::Slot& slot, ProgressCallback progressCallback, std::stop_token stopToken) = 0;
    };

    struct FfmpegConfig
    {
        std::filesystem::path ffmpegFile{ "/usr/bin/ffmpeg" };
        std::filesystem::path ffprobeFile{ "/usr/bin/ffprobe" };
        std::chrono::milliseconds timeoutBase{ std::chrono::minutes{ 10 } };
        std::chrono::milliseconds timeoutPerMB{ std::chrono::seconds{ 6 } };
        std::chrono::milliseconds durationQueryTimeout{ std::chrono::seconds{ 30 } };
    };

    std::unique_ptr<ICodecRunner> createFfmpegCodecRunner(core::IChildProcessManager& childProcessManager, const FfmpegConfig& config);
} // namespace mts::codec
