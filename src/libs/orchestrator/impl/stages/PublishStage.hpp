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
#include <string>

#include "transfer/IResumableTransferClient.hpp"

#include "JobStageBase.hpp"

namespace mts::orchestrator
{
    // Uploads the sealed output to the publish endpoint
    class PublishStage : public JobStageBase
    {
    public:
        PublishStage(const InitParams& initParams);
        ~PublishStage() override = default;
        PublishStage(const PublishStage&) = delete;
        PublishStage& operator=(const PublishStage&) = delete;

    private:
        db::JobState getState() const override { return db::JobState::Publishing; }
        std::string_view getName() const override { return "Publish"; }
        StageOutcome process(JobContext& context) override;

        transfer::SessionResult openOrResumeSession(JobContext& context, const std::filesystem::path& sealedPath, const std::string& sealedChecksum);
    };
} // namespace mts::orchestrator
