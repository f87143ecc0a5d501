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

#include <optional>

#include "codec/ICodecRunner.hpp"

namespace mts::codec
{
    class FfmpegCodecRunner final : public ICodecRunner
    {
    public:
        FfmpegCodecRunner(core::IChildProcessManager& childProcessManager, const FfmpegConfig& config);
        ~FfmpegCodecRunner() override = default;
        FfmpegCodecRunner(const FfmpegCodecRunner&) = delete;
        FfmpegCodecRunner& operator=(const FfmpegCodecRunner&) = delete;

    private:
        ExitOutcome run(const std::filesystem::path& input, const std::filesystem::path& output, const TargetProfile& profile, const encoder::Slot& slot, ProgressCallback progressCallback, std::stop_token stopToken) override;

        std::optional<std::chrono::microseconds> queryDuration(const std::filesystem::path& input);
        std::chrono::milliseconds computeTimeout(const std::filesystem::path& input) const;

        core::IChildProcessManager& _childProcessManager;
        const FfmpegConfig _config;
    };
} // namespace mts::codec
