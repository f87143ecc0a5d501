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
#include <string>

namespace mts::codec
{
    struct TargetProfile
    {
        std::string label;      // names the cached output
        std::string videoCodec; // h264, hevc, av1, vp9
        std::string container;  // mp4, mkv, webm, mov, ts
        unsigned width{};       // 0 keeps the source aspect ratio
        unsigned height{};
        std::size_t videoBitrate{}; // bits per second, 0 lets the encoder decide
        std::string audioCodec;     // empty copies the source audio, "none" drops it
        std::size_t audioBitrate{};
        bool hardwareAcceleration{}; // CUDA decoding and NVENC encoding
    };
} // namespace mts::codec
