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

#include "JobFiles.hpp"

#include <system_error>

#include "codec/FfmpegArgs.hpp"
#include "database/objects/Job.hpp"
#include "orchestrator/Config.hpp"

namespace mts::orchestrator
{
    codec::TargetProfile toTargetProfile(const db::Job& job)
    {
        codec::TargetProfile profile;
        profile.label = job.getProfileLabel();
        profile.videoCodec = job.getCodec();
        profile.container = job.getContainer();
        profile.width = job.getWidth();
        profile.height = job.getHeight();
        profile.videoBitrate = job.getVideoBitrate();
        profile.audioCodec = job.getAudioCodec();
        profile.audioBitrate = job.getAudioBitrate();
        profile.hardwareAcceleration = job.isHardwareAccelerated();

        return profile;
    }

    std::filesystem::path getSourcePath(const Config& config, const core::UUID& jobId)
    {
        return config.getSourceDirectory() / std::string{ jobId.getAsString() };
    }

    std::filesystem::path getSealedSourcePath(const Config& config, const core::UUID& jobId)
    {
        return config.getSourceDirectory() / (std::string{ jobId.getAsString() } + ".mts");
    }

    std::optional<std::filesystem::path> getOutputPath(const Config& config, const db::Job& job)
    {
        const std::optional<std::string_view> extension{ codec::getFileExtension(job.getContainer()) };
        if (!extension)
            return std::nullopt;

        // without any label, outputs cannot be shared
        std::string fileName{ job.getSourceChecksum().empty() ? std::string{ job.getUUID().getAsString() } : job.getSourceChecksum() };
        fileName += "_";
        fileName += job.getProfileLabel().empty() ? std::string{ job.getUUID().getAsString() } : job.getProfileLabel();
        fileName += ".";
        fileName += *extension;

        return config.getOutputDirectory() / fileName;
    }

    std::filesystem::path getPartialOutputPath(const std::filesystem::path& outputPath, const core::UUID& jobId)
    {
        std::filesystem::path res{ outputPath };
        res += ".";
        res += std::string{ jobId.getAsString() };
        res += ".part";

        return res;
    }

    std::filesystem::path getSealedPath(const Config& config, const core::UUID& jobId)
    {
        return config.getSealedDirectory() / (std::string{ jobId.getAsString() } + ".mts");
    }

    void moveFile(const std::filesystem::path& from, const std::filesystem::path& to)
    {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (!ec)
            return;

        if (ec != std::errc::cross_device_link)
            throw std::filesystem::filesystem_error{ "Cannot rename file", from, to, ec };

        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::remove(from);
    }
} // namespace mts::orchestrator
