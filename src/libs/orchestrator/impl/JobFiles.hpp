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

#include "codec/TargetProfile.hpp"
#include "core/UUID.hpp"

namespace mts::db
{
    class Job;
}

namespace mts::orchestrator
{
    struct Config;

    codec::TargetProfile toTargetProfile(const db::Job& job);

    std::filesystem::path getSourcePath(const Config& config, const core::UUID& jobId);
    // Sealed sources are fetched there, then opened into the source path
    std::filesystem::path getSealedSourcePath(const Config& config, const core::UUID& jobId);
    // Cached transcoded outputs are shared by all the jobs having the same source and profile
    // Not set if the container is not supported
    std::optional<std::filesystem::path> getOutputPath(const Config& config, const db::Job& job);
    std::filesystem::path getPartialOutputPath(const std::filesystem::path& outputPath, const core::UUID& jobId);
    std::filesystem::path getSealedPath(const Config& config, const core::UUID& jobId);

    // Falls back on copy if the rename cannot be done across file systems, throws std::filesystem::filesystem_error
    void moveFile(const std::filesystem::path& from, const std::filesystem::path& to);
} // namespace mts::orchestrator
