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

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "core/IChildProcess.hpp"

namespace mts::codec
{
    enum class ExitKind
    {
        Success,
        Recoverable, // worth another attempt
        Fatal,
    };
    std::string_view toString(ExitKind kind);

    enum class ExitReason
    {
        None,
        Cancelled,
        TimedOut,
        Crashed, // terminated by a signal
        ResourceExhausted,
        InvalidInput,
        UnsupportedParameters,
        ToolchainError, // any other failure reported by the toolchain
    };
    std::string_view toString(ExitReason reason);

    struct ExitOutcome
    {
        ExitKind kind{ ExitKind::Success };
        ExitReason reason{ ExitReason::None };
        std::optional<int> exitCode;
        std::optional<int> signal;
        std::string detail; // last diagnostic lines

        bool isSuccess() const { return kind == ExitKind::Success; }
    };

    // Classifies a terminated toolchain process from its exit status and its last diagnostic lines
    ExitOutcome classifyExit(const core::IChildProcess::ExitStatus& status, std::span<const std::string> diagnostics);
} // namespace mts::codec
