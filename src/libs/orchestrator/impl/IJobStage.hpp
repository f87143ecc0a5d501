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
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

#include "core/UUID.hpp"
#include "database/Types.hpp"

namespace mts::orchestrator
{
    struct StageCompleted
    {
    };

    struct StageFailed
    {
        db::ErrorKind kind;
        std::string detail;
    };

    struct StageCancelled
    {
    };

    using StageOutcome = std::variant<StageCompleted, StageFailed, StageCancelled>;

    struct JobContext
    {
        core::UUID jobId;
        std::stop_token stopToken;
        float progress{};
        std::size_t retryCount{};
    };

    class IJobStage
    {
    public:
        virtual ~IJobStage() = default;

        virtual db::JobState getState() const = 0;
        virtual std::string_view getName() const = 0;

        // Stages must be resumable: a stage interrupted by a restart is processed again
        virtual StageOutcome process(JobContext& context) = 0;
    };
} // namespace mts::orchestrator
