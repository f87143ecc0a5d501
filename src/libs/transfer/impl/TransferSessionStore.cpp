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

#include "TransferSessionStore.hpp"

#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/TransferSession.hpp"

namespace mts::transfer
{
    std::unique_ptr<ITransferSessionStore> createTransferSessionStore(db::IDb& db)
    {
        return std::make_unique<TransferSessionStore>(db);
    }

    TransferSessionStore::TransferSessionStore(db::IDb& db)
        : _db{ db }
    {
    }

    void TransferSessionStore::save(const TransferSession& session)
    {
        db::Session& dbSession{ _db.getTLSSession() };
        auto transaction{ dbSession.createWriteTransaction() };

        db::TransferSession::pointer record{ db::TransferSession::find(dbSession, session.token) };
        if (!record)
            record = dbSession.create<db::TransferSession>(session.token, session.direction, session.endpoint, session.localPath.string());

        record.modify()->setRemoteSessionId(session.remoteSessionId);
        record.modify()->setOffset(session.offset);
        record.modify()->setTotalLength(session.totalLength);
        record.modify()->setChecksum(session.checksum);
        record.modify()->setExpiresAt(session.expiresAt);
        if (session.finalized)
            record.modify()->setFinalized(session.verified);
        record.modify()->touch();
    }

    std::optional<TransferSession> TransferSessionStore::load(const core::UUID& token)
    {
        db::Session& dbSession{ _db.getTLSSession() };
        auto transaction{ dbSession.createReadTransaction() };

        const db::TransferSession::pointer record{ db::TransferSession::find(dbSession, token) };
        if (!record)
            return std::nullopt;

        return TransferSession{
            .token = token,
            .direction = record->getDirection(),
            .endpoint = record->getEndpoint(),
            .remoteSessionId = record->getRemoteSessionId(),
            .offset = record->getOffset(),
            .totalLength = record->getTotalLength(),
            .checksum = record->getChecksum(),
            .expiresAt = record->getExpiresAt(),
            .localPath = record->getLocalPath(),
            .finalized = record->isFinalized(),
            .verified = record->isVerified(),
        };
    }

    void TransferSessionStore::remove(const core::UUID& token)
    {
        db::Session& dbSession{ _db.getTLSSession() };
        auto transaction{ dbSession.createWriteTransaction() };

        db::TransferSession::pointer record{ db::TransferSession::find(dbSession, token) };
        if (record)
            record.remove();
    }
} // namespace mts::transfer
