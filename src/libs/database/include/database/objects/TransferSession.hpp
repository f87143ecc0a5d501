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

#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "core/UUID.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/TransferSessionId.hpp"

namespace mts::db
{
    class Session;

    // Durable state of one resumable transfer, looked up by its local token
    class TransferSession final : public Object<TransferSession, TransferSessionId>
    {
    public:
        TransferSession() = default;

        // Utility
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, TransferSessionId id);
        static pointer find(Session& session, const core::UUID& token);
        // Sessions no job refers to and left untouched since dateTime
        static std::size_t removeOrphansBefore(Session& session, const Wt::WDateTime& dateTime);

        // Accessors
        core::UUID getToken() const;
        TransferDirection getDirection() const { return _direction; }
        const std::string& getEndpoint() const { return _endpoint; }
        const std::string& getRemoteSessionId() const { return _remoteSessionId; }
        std::size_t getOffset() const { return static_cast<std::size_t>(_offset); }
        std::size_t getTotalLength() const { return static_cast<std::size_t>(_totalLength); }
        const std::string& getChecksum() const { return _checksum; }
        const Wt::WDateTime& getExpiresAt() const { return _expiresAt; } // invalid if no expiry
        const std::string& getLocalPath() const { return _localPath; }
        bool isFinalized() const { return _finalized; }
        bool isVerified() const { return _verified; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }

        // Setters
        void setRemoteSessionId(std::string_view sessionId) { _remoteSessionId = sessionId; }
        void setOffset(std::size_t offset) { _offset = static_cast<long long>(offset); }
        void setTotalLength(std::size_t totalLength) { _totalLength = static_cast<long long>(totalLength); }
        void setChecksum(std::string_view checksum) { _checksum = checksum; }
        void setExpiresAt(const Wt::WDateTime& expiresAt) { _expiresAt = expiresAt; }
        void setFinalized(bool verified);
        void touch();

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _token, "token");
            Wt::Dbo::field(a, _direction, "direction");
            Wt::Dbo::field(a, _endpoint, "endpoint");
            Wt::Dbo::field(a, _remoteSessionId, "remote_session_id");
            Wt::Dbo::field(a, _offset, "transfer_offset");
            Wt::Dbo::field(a, _totalLength, "total_length");
            Wt::Dbo::field(a, _checksum, "checksum");
            Wt::Dbo::field(a, _expiresAt, "expires_at");
            Wt::Dbo::field(a, _localPath, "local_path");
            Wt::Dbo::field(a, _finalized, "finalized");
            Wt::Dbo::field(a, _verified, "verified");
            Wt::Dbo::field(a, _updatedAt, "updated_at");
        }

    private:
        friend class Session;
        TransferSession(const core::UUID& token, TransferDirection direction, std::string_view endpoint, std::string_view localPath);
        static pointer create(Session& session, const core::UUID& token, TransferDirection direction, std::string_view endpoint, std::string_view localPath);

        std::string _token;
        TransferDirection _direction{ TransferDirection::Upload };
        std::string _endpoint;
        std::string _remoteSessionId;
        long long _offset{};
        long long _totalLength{};
        std::string _checksum;
        Wt::WDateTime _expiresAt;
        std::string _localPath;
        bool _finalized{};
        bool _verified{};
        Wt::WDateTime _updatedAt;
    };
} // namespace mts::db
