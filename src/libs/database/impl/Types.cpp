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

#include "database/Types.hpp"

namespace mts::db
{
    bool isTerminal(JobState state)
    {
        switch (state)
        {
        case JobState::Completed:
        case JobState::Failed:
        case JobState::Cancelled:
            return true;

        case JobState::Queued:
        case JobState::Fetching:
        case JobState::Transcoding:
        case JobState::Encrypting:
        case JobState::Publishing:
            break;
        }

        return false;
    }

    std::string_view toString(JobState state)
    {
        switch (state)
        {
        case JobState::Queued:
            return "Queued";
        case JobState::Fetching:
            return "Fetching";
        case JobState::Transcoding:
            return "Transcoding";
        case JobState::Encrypting:
            return "Encrypting";
        case JobState::Publishing:
            return "Publishing";
        case JobState::Completed:
            return "Completed";
        case JobState::Failed:
            return "Failed";
        case JobState::Cancelled:
            return "Cancelled";
        }

        return "";
    }

    std::string_view toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Transient:
            return "Transient";
        case ErrorKind::UnrecoverableRemote:
            return "Unrecoverable-Remote";
        case ErrorKind::ResourceExhausted:
            return "Resource-Exhausted";
        case ErrorKind::FatalInput:
            return "Fatal-Input";
        }

        return "";
    }

    std::string_view toString(TransferDirection direction)
    {
        switch (direction)
        {
        case TransferDirection::Upload:
            return "upload";
        case TransferDirection::Download:
            return "download";
        }

        return "";
    }
} // namespace mts::db
