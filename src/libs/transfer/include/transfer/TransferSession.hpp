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
#include <string>

#include <Wt/WDateTime.h>

#include "core/UUID.hpp"
#include "database/Types.hpp"

namespace mts::transfer
{
    struct TransferSession
    {
        core::UUID token;
        db::TransferDirection direction;
        std::string endpoint;        // creation url (upload) or resource url (download)
        std::string remoteSessionId; // url used to resume
        std::size_t offset{};        // last byte position confirmed by the remote (upload) or durably written (download)
        std::size_t totalLength{};
        std::string checksum;   // hex SHA-256, may be empty for downloads whose remote does not advertise any
        Wt::WDateTime expiresAt; // invalid if the remote did not declare any expiry
        std::filesystem::path localPath;
        bool finalized{};
        bool verified{};

        bool isComplete() const { return offset == totalLength; }
        bool isExpired(const Wt::WDateTime& now) const { return expiresAt.isValid() && now >= expiresAt; }
    };
} // namespace mts::transfer
