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

#include <functional>
#include <optional>

#include "transfer/IHttpTransport.hpp"
#include "transfer/IResumableTransferClient.hpp"
#include "transfer/ITransferSessionStore.hpp"

namespace mts::transfer
{
    class ResumableTransferClient final : public IResumableTransferClient
    {
    public:
        ResumableTransferClient(http::IHttpTransport& transport, ITransferSessionStore& store, const TransferClientConfig& config);
        ~ResumableTransferClient() override = default;
        ResumableTransferClient(const ResumableTransferClient&) = delete;
        ResumableTransferClient& operator=(const ResumableTransferClient&) = delete;

    private:
        SessionResult open(const OpenParameters& parameters, std::stop_token stopToken) override;
        SessionResult resume(const core::UUID& token, std::stop_token stopToken) override;
        OffsetResult uploadChunk(TransferSession& session, std::span<const std::byte> bytes) override;
        ChunkResult downloadChunk(TransferSession& session, std::size_t maxBytes) override;
        FinalizeResult finalize(TransferSession& session) override;
        TransferOutcome upload(TransferSession& session, std::stop_token stopToken, ProgressCallback progressCallback) override;
        TransferOutcome download(TransferSession& session, std::stop_token stopToken, ProgressCallback progressCallback) override;
        void discard(const TransferSession& session) override;

        SessionResult openUpload(const OpenParameters& parameters);
        SessionResult openDownload(const OpenParameters& parameters);

        // Brings the session offset in line with what the remote (upload) or the local file (download) holds
        std::optional<TransferError> reconcile(TransferSession& session);
        std::optional<TransferError> reconcileUpload(TransferSession& session);
        std::optional<TransferError> reconcileDownload(TransferSession& session);

        FinalizeResult verifyUpload(const TransferSession& session);
        FinalizeResult verifyDownload(const TransferSession& session);

        using ChunkFunc = std::function<std::optional<TransferError>(TransferSession& session)>;
        TransferOutcome runTransferLoop(TransferSession& session, std::stop_token stopToken, const ProgressCallback& progressCallback, const ChunkFunc& transferNextChunk);

        // Empty if cancelled before or between attempts
        template<typename Func>
        auto retryTransient(std::stop_token stopToken, Func&& func) -> std::optional<decltype(func())>;
        bool waitBeforeRetry(std::size_t retryIndex, std::stop_token stopToken);

        std::variant<http::Response, TransferError> sendRequest(const http::Request& request);
        void persist(const TransferSession& session);

        http::IHttpTransport& _transport;
        ITransferSessionStore& _store;
        const TransferClientConfig _config;
    };
} // namespace mts::transfer
