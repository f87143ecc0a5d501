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

#include <memory>
#include <optional>

#include "core/UUID.hpp"
#include "transfer/TransferSession.hpp"

namespace mts::db
{
    class IDb;
}

namespace mts::transfer
{
    // Durable storage of transfer sessions, so that an interrupted transfer survives a process restart
    class ITransferSessionStore
    {
    public:
        virtual ~ITransferSessionStore() = default;

        virtual void save(const TransferSession& session) = 0; // insert or update
        virtual std::optional<TransferSession> load(const core::UUID& token) = 0;
        virtual void remove(const core::UUID& token) = 0;
    };

    std::unique_ptr<ITransferSessionStore> createTransferSessionStore(db::IDb& db);
} // namespace mts::transfer
