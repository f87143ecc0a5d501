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
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "database/Types.hpp"

namespace mts::transfer
{
    static constexpr std::size_t minChunkSize{ 64 * 1024 };
    static constexpr std::size_t maxChunkSize{ 64 * 1024 * 1024 };
    static constexpr std::size_t defaultChunkSize{ 8 * 1024 * 1024 };

    enum class TransferErrorType
    {
        ConnectionFailure,
        Timeout,
        ServerError,    // 5xx
        Throttled,      // 408, 429
        OffsetConflict, // 409
        ClientError,    // other 4xx
        SessionExpired,
        SessionNotFound,
        ProtocolError,  // unexpected answer from the remote
        ChecksumMismatch,
        LocalIoError,         // cannot create or write a local file
        LocalFileUnavailable, // local file to send or verify is missing or unreadable
    };

    std::string_view toString(TransferErrorType type);
    bool isTransient(TransferErrorType type);

    struct TransferError
    {
        TransferErrorType type;
        std::string detail;

        db::ErrorKind getErrorKind() const;
    };

    // Outcome of a whole upload/download loop
    struct TransferCompleted
    {
    };
    struct TransferCancelled
    {
    };
    using TransferOutcome = std::variant<TransferCompleted, TransferCancelled, TransferError>;

    struct RetryPolicy
    {
        std::size_t maxAttempts{ 5 }; // per chunk, including the first one
        std::chrono::milliseconds baseDelay{ 500 };
        std::chrono::milliseconds maxDelay{ 30'000 };

        // base * 2^retryIndex, capped
        std::chrono::milliseconds computeDelay(std::size_t retryIndex) const;
        // computeDelay plus up to a quarter of it, so that concurrent jobs do not retry in lockstep
        std::chrono::milliseconds computeJitteredDelay(std::size_t retryIndex) const;
    };

    struct TransferClientConfig
    {
        std::size_t chunkSize{ defaultChunkSize };
        RetryPolicy retryPolicy;
    };

    std::size_t clampChunkSize(std::size_t chunkSize);
} // namespace mts::transfer
