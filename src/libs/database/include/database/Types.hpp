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

#include <string_view>

#include "core/Exception.hpp"

namespace mts::db
{
    class Exception : public core::MtsException
    {
    public:
        using MtsException::MtsException;
    };

    // Caution: do not change enum values, they are stored in the database

    enum class JobState
    {
        Queued = 0,
        Fetching = 1,
        Transcoding = 2,
        Encrypting = 3,
        Publishing = 4,
        Completed = 5,
        Failed = 6,
        Cancelled = 7,
    };

    bool isTerminal(JobState state);
    std::string_view toString(JobState state);

    enum class ErrorKind
    {
        Transient = 0,           // network reset, timeout, resource busy: retried with backoff
        UnrecoverableRemote = 1, // 4xx-class response, expired session, checksum mismatch
        ResourceExhausted = 2,   // no encoder slot within timeout: stage retried
        FatalInput = 3,          // malformed media, unsupported profile, integrity failure
    };

    std::string_view toString(ErrorKind kind);

    enum class TransferDirection
    {
        Upload = 0,
        Download = 1,
    };

    std::string_view toString(TransferDirection direction);
} // namespace mts::db
