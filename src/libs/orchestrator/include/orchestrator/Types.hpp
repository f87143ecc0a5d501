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

#include <cstddef>
#include <optional>
#include <string>

#include "codec/TargetProfile.hpp"
#include "core/UUID.hpp"
#include "database/Types.hpp"

namespace mts::orchestrator
{
    struct JobDescriptor
    {
        std::string sourceEndpoint;
        std::optional<core::UUID> sourceSessionToken; // resumes an already started download
        std::string sourceChecksum;                   // hex SHA-256, optional
        std::optional<core::UUID> sourceSealedBy;     // source is the sealed output of that job, opened once fetched
        std::string publishEndpoint;
        codec::TargetProfile profile;
    };

    struct JobResult
    {
        std::string outputLocation;
        std::string contentHash; // hex SHA-256 of the transcoded output
        std::size_t encryptedSize{};
    };

    // Error details stay in the logs and in the database
    struct JobStatus
    {
        core::UUID jobId;
        db::JobState state{ db::JobState::Queued };
        float progress{}; // of the current stage, in [0, 1]
        std::size_t retryCount{};
        std::optional<db::ErrorKind> errorKind;
        std::optional<db::JobState> errorStage;
        std::optional<JobResult> result; // once completed
    };
} // namespace mts::orchestrator
