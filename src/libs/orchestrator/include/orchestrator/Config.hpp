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

#include <chrono>
#include <cstdint>
#include <filesystem>

#include "codec/ICodecRunner.hpp"
#include "transfer/Types.hpp"

namespace mts::core
{
    class IConfig;
}

namespace mts::orchestrator
{
    // Built once at startup, never modified afterwards
    struct Config
    {
        std::filesystem::path workingDirectory{ "/var/mts" };

        std::size_t maxConcurrentJobs{ 4 };
        std::size_t encoderSlotCount{ 2 };
        std::chrono::seconds encoderSlotAcquireTimeout{ 60 };

        transfer::TransferClientConfig transfer;
        std::chrono::seconds httpTimeout{ 60 };

        std::size_t stageMaxRetries{ 3 };            // whole stage retries on transient transfer failures
        std::size_t codecMaxRecoverableRetries{ 2 }; // runner crashes and resource exhaustion
        codec::FfmpegConfig ffmpeg;

        std::filesystem::path encryptionSecretFile;

        std::chrono::seconds gcInterval{ 3600 }; // 0 disables the garbage collector
        std::uint64_t gcSourceDirectorySizeThreshold{ 10ULL * 1024 * 1024 * 1024 };
        std::uint64_t gcOutputDirectorySizeThreshold{ 10ULL * 1024 * 1024 * 1024 };
        std::chrono::hours jobRetention{ 30 * 24 }; // 0 keeps terminated jobs forever

        std::filesystem::path getDbPath() const { return workingDirectory / "mts.db"; }
        std::filesystem::path getSourceDirectory() const { return workingDirectory / "sources"; }
        std::filesystem::path getOutputDirectory() const { return workingDirectory / "outputs"; }
        std::filesystem::path getSealedDirectory() const { return workingDirectory / "sealed"; }
    };

    // Throws core::MtsException on invalid values
    Config readConfig(core::IConfig& config);
} // namespace mts::orchestrator
