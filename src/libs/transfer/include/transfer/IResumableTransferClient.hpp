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
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

#include "core/UUID.hpp"
#include "transfer/TransferSession.hpp"
#include "transfer/Types.hpp"

namespace mts::transfer
{
    namespace http
    {
        class IHttpTransport;
    }
    class ITransferSessionStore;

    using SessionResult = std::variant<TransferSession, TransferCancelled, TransferError>;
    using OffsetResult = std::variant<std::size_t, TransferError>;
    using ChunkResult = std::variant<std::vector<std::byte>, TransferError>;
    using FinalizeResult = std::variant<bool, TransferError>;

    using ProgressCallback = std::function<void(std::size_t offset, std::size_t totalLength)>;

    struct OpenParameters
    {
        std::string endpoint;
        db::TransferDirection direction{ db::TransferDirection::Download };
        std::optional<std::size_t> payloadLength; // required for uploads, discovered for downloads
        std::string checksum;                     // hex SHA-256, required for uploads
        std::filesystem::path localPath;          // read for uploads, written for downloads
    };

    // Resumable chunked transfers: tus 1.0.0 for uploads, HTTP ranges for downloads
    // Every acknowledged chunk is persisted in the session store
    class IResumableTransferClient
    {
    public:
        virtual ~IResumableTransferClient() = default;

        // Transient failures are retried with backoff, cancellation is checked before each attempt
        virtual SessionResult open(const OpenParameters& parameters, std::stop_token stopToken) = 0;
        // Reloads a persisted session and reconciles its offset with the remote
        virtual SessionResult resume(const core::UUID& token, std::stop_token stopToken) = 0;

        // Single attempts, not retried
        virtual OffsetResult uploadChunk(TransferSession& session, std::span<const std::byte> bytes) = 0;
        virtual ChunkResult downloadChunk(TransferSession& session, std::size_t maxBytes) = 0;

        // Mandatory checksum verification, no-op returning the cached result once done
        virtual FinalizeResult finalize(TransferSession& session) = 0;

        // Whole transfer loops: chunks, retries with backoff and resume, then finalize
        // Cancellation is checked at chunk boundaries and during backoff waits
        virtual TransferOutcome upload(TransferSession& session, std::stop_token stopToken, ProgressCallback progressCallback) = 0;
        virtual TransferOutcome download(TransferSession& session, std::stop_token stopToken, ProgressCallback progressCallback) = 0;

        // Forgets the session once it is no longer needed
        virtual void discard(const TransferSession& session) = 0;
    };

    std::unique_ptr<IResumableTransferClient> createResumableTransferClient(http::IHttpTransport& transport, ITransferSessionStore& store, const TransferClientConfig& config);
} // namespace mts::transfer
