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

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/IChildProcess.hpp"
#include "codec/TargetProfile.hpp"

namespace mts::codec
{
    std::optional<std::string_view> getVideoEncoder(std::string_view videoCodec, bool hardwareAcceleration);
    std::optional<std::string_view> getMuxer(std::string_view container);
    std::optional<std::string_view> getFileExtension(std::string_view container);

    // Throws codec::Exception on unsupported profile
    core::IChildProcess::Args buildFfmpegArgs(const std::filesystem::path& ffmpegFile, const std::filesystem::path& input, const std::filesystem::path& output, const TargetProfile& profile, std::size_t deviceIndex);
    core::IChildProcess::Args buildFfprobeArgs(const std::filesystem::path& ffprobeFile, const std::filesystem::path& input);
} // namespace mts::codec
