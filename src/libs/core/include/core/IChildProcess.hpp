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
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace mts::core
{
    class ChildProcessException : public MtsException
    {
    public:
        using MtsException::MtsException;
    };

    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        enum class ReadResult
        {
            Success,
            Timeout,
            EndOfFile,
            Error,
        };

        // Blocks at most 'timeout' waiting for output
        virtual ReadResult readSome(std::span<std::byte> buffer, std::chrono::milliseconds timeout, std::size_t& bytesRead) = 0;

        struct ExitStatus
        {
            std::optional<int> exitCode; // set if the process exited normally
            std::optional<int> signal;   // set if the process was terminated by a signal
        };

        virtual void kill() = 0;
        virtual ExitStatus wait() = 0; // blocks until the process has terminated
    };
} // namespace mts::core
