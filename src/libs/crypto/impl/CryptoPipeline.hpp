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

#include <array>
#include <cstdint>
#include <optional>

#include "crypto/ICryptoPipeline.hpp"
#include "crypto/Types.hpp"

namespace mts::crypto
{
    class CryptoPipeline final : public ICryptoPipeline
    {
    public:
        CryptoPipeline(std::vector<std::byte> secret, std::size_t chunkSize);
        ~CryptoPipeline() override = default;
        CryptoPipeline(const CryptoPipeline&) = delete;
        CryptoPipeline& operator=(const CryptoPipeline&) = delete;

    private:
        SealedBuffer seal(std::span<const std::byte> plaintext, const core::UUID& jobId) override;
        OpenBufferResult open(std::span<const std::byte> sealed, const core::UUID& jobId) override;
        SealResult sealFile(const std::filesystem::path& input, const std::filesystem::path& output, const core::UUID& jobId) override;
        OpenResult openFile(const std::filesystem::path& input, const std::optional<std::filesystem::path>& output, const core::UUID& jobId) override;

        struct Header
        {
            std::uint8_t chunkSizeLog2{};
            std::array<std::byte, 16> salt{};
        };
        Header createHeader() const;
        static std::array<std::byte, sealHeaderSize> serializeHeader(const Header& header);
        static std::optional<Header> parseHeader(std::span<const std::byte> buffer);

        Key deriveJobKey(const Header& header, const core::UUID& jobId) const;

        const std::vector<std::byte> _secret;
        const std::uint8_t _chunkSizeLog2;
    };
} // namespace mts::crypto
