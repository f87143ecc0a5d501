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

#include "transfer/IResumableTransferClient.hpp"

#include "JobStageBase.hpp"

namespace mts::orchestrator
{
    // Downloads the source into the work directory, opening it first if it was sealed
    class FetchStage : public JobStageBase
    {
    public:
        FetchStage(const InitParams& initParams);
        ~FetchStage() override = default;
        FetchStage(const FetchStage&) = delete;
        FetchStage& operator=(const FetchStage&) = delete;

    private:
        db::JobState getState() const override { return db::JobState::Fetching; }
        std::string_view getName() const override { return "Fetch"; }
        StageOutcome process(JobContext& context) override;

        transfer::SessionResult openOrResumeSession(JobContext& context, const std::filesystem::path& downloadPath);
        StageOutcome onDownloadCompleted(JobContext& context, const transfer::TransferSession& session, const std::filesystem::path& downloadPath, const std::optional<core::UUID>& sealedBy);
        StageOutcome openSealedSource(JobContext& context, const std::filesystem::path& sealedSourcePath, const core::UUID& sealedBy, std::string& contentHash);
    };
} // namespace mts::orchestrator
