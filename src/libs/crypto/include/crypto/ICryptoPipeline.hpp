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
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/UUID.hpp"

namespace mts::crypto
{
    // Sealed layout:
    //   header: "MTS1", log2(chunk size), 3 reserved bytes, 16 bytes salt
    //   chunks: ChaCha20-Poly1305 ciphertext followed by its 16 bytes tag
    // The per job key is HKDF-SHA256(secret, salt, job id)
    // Each chunk is bound to its index and to whether it is the last one
    static constexpr std::size_t sealHeaderSize{ 24 };
    static constexpr std::size_t sealTagSize{ 16 };
    static constexpr std::size_t defaultSealChunkSize{ 256 * 1024 };

    struct SealedBuffer
    {
        std::vector<std::byte> ciphertext;
        std::string contentHash; // hex SHA-256 of the plaintext
    };

    struct SealResult
    {
        std::string contentHash;    // hex SHA-256 of the plaintext
        std::string ciphertextHash; // hex SHA-256 of the whole sealed file
        std::size_t encryptedSize{};
    };

    enum class OpenError
    {
        InvalidHeader,
        Truncated,
        IntegrityFailure, // authentication tag mismatch: corruption, tampering or wrong key
    };
    std::string_view toString(OpenError error);

    struct OpenSuccess
    {
        std::string contentHash; // hex SHA-256 of the recovered plaintext
        std::size_t plaintextSize{};
    };
    using OpenResult = std::variant<OpenSuccess, OpenError>;
    using OpenBufferResult = std::variant<std::vector<std::byte>, OpenError>;

    class ICryptoPipeline
    {
    public:
        virtual ~ICryptoPipeline() = default;

        virtual SealedBuffer seal(std::span<const std::byte> plaintext, const core::UUID& jobId) = 0;
        virtual OpenBufferResult open(std::span<const std::byte> sealed, const core::UUID& jobId) = 0;

        // File variants stream chunk by chunk, I/O errors are reported using CryptoException
        virtual SealResult sealFile(const std::filesystem::path& input, const std::filesystem::path& output, const core::UUID& jobId) = 0;
        // If output is not set, the content is only authenticated and hashed
        virtual OpenResult openFile(const std::filesystem::path& input, const std::optional<std::filesystem::path>& output, const core::UUID& jobId) = 0;
    };

    std::unique_ptr<ICryptoPipeline> createCryptoPipeline(std::vector<std::byte> secret, std::size_t chunkSize = defaultSealChunkSize);
} // namespace mts::crypto
