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

#include "database/objects/TransferSession.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"

DBO_INSTANTIATE_TEMPLATES(mts::db::TransferSession)

namespace mts::db
{
    TransferSession::TransferSession(const core::UUID& token, TransferDirection direction, std::string_view endpoint, std::string_view localPath)
        : _token{ token.getAsString() }
        , _direction{ direction }
        , _endpoint{ endpoint }
        , _localPath{ localPath }
        , _updatedAt{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
    {
    }

    TransferSession::pointer TransferSession::create(Session& session, const core::UUID& token, TransferDirection direction, std::string_view endpoint, std::string_view localPath)
    {
        return session.getDboSession()->add(std::unique_ptr<TransferSession>{ new TransferSession{ token, direction, endpoint, localPath } });
    }

    std::size_t TransferSession::getCount(Session& session)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM transfer_session"));
    }

    TransferSession::pointer TransferSession::find(Session& session, TransferSessionId id)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<TransferSession>>("SELECT t_s FROM transfer_session t_s").where("t_s.id = ?").bind(id.getValue()));
    }

    TransferSession::pointer TransferSession::find(Session& session, const core::UUID& token)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<TransferSession>>("SELECT t_s FROM transfer_session t_s").where("t_s.token = ?").bind(std::string{ token.getAsString() }));
    }

    std::size_t TransferSession::removeOrphansBefore(Session& session, const Wt::WDateTime& dateTime)
    {
        const Wt::WDateTime normalizedDateTime{ utils::normalizeDateTime(dateTime) };
        constexpr std::string_view orphanCondition{ "updated_at < ? AND token NOT IN (SELECT source_session_token FROM job) AND token NOT IN (SELECT publish_session_token FROM job)" };

        auto query{ session.getDboSession()->query<int>("SELECT COUNT(*) FROM transfer_session") };
        query.where(std::string{ orphanCondition }).bind(normalizedDateTime);
        const int count{ utils::fetchQuerySingleResult(query) };

        if (count > 0)
            utils::executeCommand(*session.getDboSession(), "DELETE FROM transfer_session WHERE " + std::string{ orphanCondition }, normalizedDateTime);

        return static_cast<std::size_t>(count);
    }

    core::UUID TransferSession::getToken() const
    {
        const std::optional<core::UUID> token{ core::UUID::fromString(_token) };
        if (!token)
            throw Exception{ "Corrupted transfer session token '" + _token + "'" };

        return *token;
    }

    void TransferSession::setFinalized(bool verified)
    {
        _finalized = true;
        _verified = verified;
    }

    void TransferSession::touch()
    {
        _updatedAt = utils::normalizeDateTime(Wt::WDateTime::currentDateTime());
    }
} // namespace mts::db
