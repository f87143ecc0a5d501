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

#include "codec/FfmpegArgs.hpp"

#include "core/String.hpp"
#include "codec/Exception.hpp"

namespace mts::codec
{
    namespace
    {
        struct VideoCodecInfo
        {
            std::string_view name;
            std::string_view softwareEncoder;
            std::string_view hardwareEncoder; // empty if none
        };

        constexpr VideoCodecInfo videoCodecs[]{
            { "h264", "libx264", "h264_nvenc" },
            { "hevc", "libx265", "hevc_nvenc" },
            { "h265", "libx265", "hevc_nvenc" },
            { "av1", "libsvtav1", "av1_nvenc" },
            { "vp9", "libvpx-vp9", "" },
        };

        struct ContainerInfo
        {
            std::string_view name;
            std::string_view muxer;
            std::string_view extension;
        };

        constexpr ContainerInfo containers[]{
            { "mp4", "mp4", "mp4" },
            { "mkv", "matroska", "mkv" },
            { "matroska", "matroska", "mkv" },
            { "webm", "webm", "webm" },
            { "mov", "mov", "mov" },
            { "ts", "mpegts", "ts" },
        };

        const ContainerInfo* findContainer(std::string_view container)
        {
            for (const ContainerInfo& info : containers)
            {
                if (core::stringUtils::stringCaseInsensitiveEqual(info.name, container))
                    return &info;
            }
            return nullptr;
        }

        std::string createScaleFilter(const TargetProfile& profile)
        {
            // -2 keeps the aspect ratio with an even dimension
            const std::string width{ profile.width ? std::to_string(profile.width) : "-2" };
            const std::string height{ profile.height ? std::to_string(profile.height) : "-2" };

            return std::string{ profile.hardwareAcceleration ? "scale_cuda=" : "scale=" } + width + ":" + height;
        }
    } // namespace

    std::optional<std::string_view> getVideoEncoder(std::string_view videoCodec, bool hardwareAcceleration)
    {
        for (const VideoCodecInfo& info : videoCodecs)
        {
            if (!core::stringUtils::stringCaseInsensitiveEqual(info.name, videoCodec))
                continue;

            if (hardwareAcceleration)
                return info.hardwareEncoder.empty() ? std::nullopt : std::make_optional(info.hardwareEncoder);

            return info.softwareEncoder;
        }

        return std::nullopt;
    }

    std::optional<std::string_view> getMuxer(std::string_view container)
    {
        const ContainerInfo* info{ findContainer(container) };
        return info ? std::make_optional(info->muxer) : std::nullopt;
    }

    std::optional<std::string_view> getFileExtension(std::string_view container)
    {
        const ContainerInfo* info{ findContainer(container) };
        return info ? std::make_optional(info->extension) : std::nullopt;
    }

    core::IChildProcess::Args buildFfmpegArgs(const std::filesystem::path& ffmpegFile, const std::filesystem::path& input, const std::filesystem::path& output, const TargetProfile& profile, std::size_t deviceIndex)
    {
        const std::optional<std::string_view> videoEncoder{ getVideoEncoder(profile.videoCodec, profile.hardwareAcceleration) };
        if (!videoEncoder)
            throw UnsupportedProfileException{ "Unsupported video codec '" + profile.videoCodec + "'" + (profile.hardwareAcceleration ? " with hardware acceleration" : "") };

        const std::optional<std::string_view> muxer{ getMuxer(profile.container) };
        if (!muxer)
            throw UnsupportedProfileException{ "Unsupported container '" + profile.container + "'" };

        core::IChildProcess::Args args;
        args.emplace_back(ffmpegFile.string());

        // Make sure:
        // - we do not rely on input, in order not to block the forked process
        // - only errors end up mixed with the progress output
        args.emplace_back("-nostdin");
        args.emplace_back("-hide_banner");
        args.emplace_back("-nostats");
        args.emplace_back("-loglevel");
        args.emplace_back("error");
        args.emplace_back("-y");

        if (profile.hardwareAcceleration)
        {
            args.emplace_back("-hwaccel");
            args.emplace_back("cuda");
            args.emplace_back("-hwaccel_output_format");
            args.emplace_back("cuda");
            args.emplace_back("-hwaccel_device");
            args.emplace_back(std::to_string(deviceIndex));
        }

        args.emplace_back("-i");
        args.emplace_back(input.string());

        // first video stream, first audio stream if any
        args.emplace_back("-map");
        args.emplace_back("0:v:0");
        if (profile.audioCodec != "none")
        {
            args.emplace_back("-map");
            args.emplace_back("0:a:0?");
        }
        args.emplace_back("-map_metadata");
        args.emplace_back("-1");

        // Video
        args.emplace_back("-c:v");
        args.emplace_back(std::string{ *videoEncoder });
        if (profile.hardwareAcceleration)
        {
            args.emplace_back("-gpu");
            args.emplace_back(std::to_string(deviceIndex));
        }

        if (profile.width || profile.height)
        {
            args.emplace_back("-vf");
            args.emplace_back(createScaleFilter(profile));
        }

        if (profile.videoBitrate)
        {
            args.emplace_back("-b:v");
            args.emplace_back(std::to_string(profile.videoBitrate));
        }

        // Audio
        if (profile.audioCodec == "none")
        {
            args.emplace_back("-an");
        }
        else
        {
            args.emplace_back("-c:a");
            args.emplace_back(profile.audioCodec.empty() ? "copy" : profile.audioCodec);
            if (!profile.audioCodec.empty() && profile.audioBitrate)
            {
                args.emplace_back("-b:a");
                args.emplace_back(std::to_string(profile.audioBitrate));
            }
        }

        // Container
        if (*muxer == "mp4" || *muxer == "mov")
        {
            args.emplace_back("-movflags");
            args.emplace_back("+faststart");
        }
        args.emplace_back("-f");
        args.emplace_back(std::string{ *muxer });

        args.emplace_back("-progress");
        args.emplace_back("pipe:1");

        args.emplace_back(output.string());

        return args;
    }

    core::IChildProcess::Args buildFfprobeArgs(const std::filesystem::path& ffprobeFile, const std::filesystem::path& input)
    {
        return core::IChildProcess::Args{
            ffprobeFile.string(),
            "-v",
            "error",
            "-show_entries",
            "format=duration",
            "-of",
            "default=noprint_wrappers=1:nokey=1",
            input.string(),
        };
    }
} // namespace mts::codec
