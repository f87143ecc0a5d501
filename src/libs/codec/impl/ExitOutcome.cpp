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

#include "codec/ExitOutcome.hpp"

#include <algorithm>
#include <array>

#include "core/String.hpp"

namespace mts::codec
{
    namespace
    {
        // matched case insensitively against the diagnostic lines
        constexpr std::array resourceExhaustionMarkers{
            std::string_view{ "cannot allocate memory" },
            std::string_view{ "out of memory" },
            std::string_view{ "no space left on device" },
            std::string_view{ "resource temporarily unavailable" },
            std::string_view{ "no capable devices found" },
            std::string_view{ "openencodesessionex failed" },
            std::string_view{ "cuda_error_out_of_memory" },
            std::string_view{ "too many open files" },
        };

        constexpr std::array invalidInputMarkers{
            std::string_view{ "invalid data found when processing input" },
            std::string_view{ "moov atom not found" },
            std::string_view{ "no such file or directory" },
            std::string_view{ "does not contain any stream" },
            std::string_view{ "output file #0 does not contain any stream" },
            std::string_view{ "error while decoding stream" },
        };

        constexpr std::array unsupportedParameterMarkers{
            std::string_view{ "unknown encoder" },
            std::string_view{ "encoder not found" },
            std::string_view{ "unrecognized option" },
            std::string_view{ "option not found" },
            std::string_view{ "invalid argument" },
            std::string_view{ "not supported" },
            std::string_view{ "does not support" },
            std::string_view{ "incorrect parameters" },
        };

        template<std::size_t N>
        bool containsMarker(std::span<const std::string> diagnostics, const std::array<std::string_view, N>& markers)
        {
            return std::any_of(std::cbegin(diagnostics), std::cend(diagnostics), [&](const std::string& line) {
                const std::string lowerLine{ core::stringUtils::stringToLower(line) };
                return std::any_of(std::cbegin(markers), std::cend(markers), [&](std::string_view marker) { return lowerLine.find(marker) != std::string::npos; });
            });
        }

        std::string joinDiagnostics(std::span<const std::string> diagnostics)
        {
            std::string res;
            for (const std::string& line : diagnostics)
            {
                if (!res.empty())
                    res += '\n';
                res += line;
            }
            return res;
        }
    } // namespace

    std::string_view toString(ExitKind kind)
    {
        switch (kind)
        {
        case ExitKind::Success:
            return "success";
        case ExitKind::Recoverable:
            return "recoverable";
        case ExitKind::Fatal:
            return "fatal";
        }
        return "";
    }

    std::string_view toString(ExitReason reason)
    {
        switch (reason)
        {
        case ExitReason::None:
            return "none";
        case ExitReason::Cancelled:
            return "cancelled";
        case ExitReason::TimedOut:
            return "timed out";
        case ExitReason::Crashed:
            return "crashed";
        case ExitReason::ResourceExhausted:
            return "resource exhausted";
        case ExitReason::InvalidInput:
            return "invalid input";
        case ExitReason::UnsupportedParameters:
            return "unsupported parameters";
        case ExitReason::ToolchainError:
            return "toolchain error";
        }
        return "";
    }

    ExitOutcome classifyExit(const core::IChildProcess::ExitStatus& status, std::span<const std::string> diagnostics)
    {
        ExitOutcome outcome;
        outcome.exitCode = status.exitCode;
        outcome.signal = status.signal;
        outcome.detail = joinDiagnostics(diagnostics);

        if (status.exitCode && *status.exitCode == 0)
            return outcome;

        if (status.signal)
        {
            outcome.kind = ExitKind::Recoverable;
            outcome.reason = ExitReason::Crashed;
        }
        else if (containsMarker(diagnostics, resourceExhaustionMarkers))
        {
            outcome.kind = ExitKind::Recoverable;
            outcome.reason = ExitReason::ResourceExhausted;
        }
        else if (containsMarker(diagnostics, invalidInputMarkers))
        {
            outcome.kind = ExitKind::Fatal;
            outcome.reason = ExitReason::InvalidInput;
        }
        else if (containsMarker(diagnostics, unsupportedParameterMarkers))
        {
            outcome.kind = ExitKind::Fatal;
            outcome.reason = ExitReason::UnsupportedParameters;
        }
        else
        {
            outcome.kind = ExitKind::Fatal;
            outcome.reason = ExitReason::ToolchainError;
        }

        return outcome;
    }
} // namespace mts::codec
