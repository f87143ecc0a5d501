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

#include "transfer/Types.hpp"

#include <algorithm>

#include "core/Random.hpp"

namespace mts::transfer
{
    std::string_view toString(TransferErrorType type)
    {
        switch (type)
        {
        case TransferErrorType::ConnectionFailure:
            return "connection failure";
        case TransferErrorType::Timeout:
            return "timeout";
        case TransferErrorType::ServerError:
            return "server error";
        case TransferErrorType::Throttled:
            return "throttled";
        case TransferErrorType::OffsetConflict:
            return "offset conflict";
        case TransferErrorType::ClientError:
            return "client error";
        case TransferErrorType::SessionExpired:
            return "session expired";
        case TransferErrorType::SessionNotFound:
            return "session not found";
        case TransferErrorType::ProtocolError:
            return "protocol error";
        case TransferErrorType::ChecksumMismatch:
            return "checksum mismatch";
        case TransferErrorType::LocalIoError:
            return "local I/O error";
        case TransferErrorType::LocalFileUnavailable:
            return "local file unavailable";
        }

        return "";
    }

    bool isTransient(TransferErrorType type)
    {
        switch (type)
        {
        case TransferErrorType::ConnectionFailure:
        case TransferErrorType::Timeout:
        case TransferErrorType::ServerError:
        case TransferErrorType::Throttled:
        case TransferErrorType::OffsetConflict:
        case TransferErrorType::LocalIoError:
            return true;

        case TransferErrorType::ClientError:
        case TransferErrorType::SessionExpired:
        case TransferErrorType::SessionNotFound:
        case TransferErrorType::ProtocolError:
        case TransferErrorType::ChecksumMismatch:
        case TransferErrorType::LocalFileUnavailable:
            break;
        }

        return false;
    }

    db::ErrorKind TransferError::getErrorKind() const
    {
        if (isTransient(type))
            return db::ErrorKind::Transient;

        if (type == TransferErrorType::LocalFileUnavailable)
            return db::ErrorKind::FatalInput;

        return db::ErrorKind::UnrecoverableRemote;
    }

    std::chrono::milliseconds RetryPolicy::computeDelay(std::size_t retryIndex) const
    {
        std::chrono::milliseconds delay{ baseDelay };
        for (std::size_t i{}; i < retryIndex && delay < maxDelay; ++i)
            delay *= 2;

        return std::min(delay, maxDelay);
    }

    std::chrono::milliseconds RetryPolicy::computeJitteredDelay(std::size_t retryIndex) const
    {
        const std::chrono::milliseconds delay{ computeDelay(retryIndex) };
        if (delay.count() < 4)
            return delay;

        return delay + std::chrono::milliseconds{ core::random::getRandom<std::chrono::milliseconds::rep>(0, delay.count() / 4) };
    }

    std::size_t clampChunkSize(std::size_t chunkSize)
    {
        return std::clamp(chunkSize, minChunkSize, maxChunkSize);
    }
} // namespace mts::transfer
