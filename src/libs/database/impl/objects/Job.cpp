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

#include "database/objects/Job.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"

DBO_INSTANTIATE_TEMPLATES(mts::db::Job)

namespace mts::db
{
    Job::Job(const core::UUID& uuid)
        : _uuid{ uuid.getAsString() }
        , _createdAt{ utils::normalizeDateTime(Wt::WDateTime::currentDateTime()) }
        , _updatedAt{ _createdAt }
    {
    }

    Job::pointer Job::create(Session& session, const core::UUID& uuid)
    {
        return session.getDboSession()->add(std::unique_ptr<Job>{ new Job{ uuid } });
    }

    std::size_t Job::getCount(Session& session)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM job"));
    }

    Job::pointer Job::find(Session& session, JobId id)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Job>>("SELECT j FROM job j").where("j.id = ?").bind(id.getValue()));
    }

    Job::pointer Job::find(Session& session, const core::UUID& uuid)
    {
        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Job>>("SELECT j FROM job j").where("j.uuid = ?").bind(std::string{ uuid.getAsString() }));
    }

    void Job::findNonTerminal(Session& session, std::function<void(const pointer&)> visitor)
    {
        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Job>>("SELECT j FROM job j") };
        query.where("j.state NOT IN (?, ?, ?)").bind(JobState::Completed).bind(JobState::Failed).bind(JobState::Cancelled);
        query.orderBy("j.created_at, j.id");

        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Job>& job) {
            visitor(job);
        });
    }

    std::size_t Job::removeTerminatedBefore(Session& session, const Wt::WDateTime& dateTime)
    {
        const Wt::WDateTime normalizedDateTime{ utils::normalizeDateTime(dateTime) };

        auto query{ session.getDboSession()->query<int>("SELECT COUNT(*) FROM job") };
        query.where("state IN (?, ?, ?)").bind(JobState::Completed).bind(JobState::Failed).bind(JobState::Cancelled);
        query.where("updated_at < ?").bind(normalizedDateTime);
        const int count{ utils::fetchQuerySingleResult(query) };

        if (count > 0)
            utils::executeCommand(*session.getDboSession(), "DELETE FROM job WHERE state IN (?, ?, ?) AND updated_at < ?", JobState::Completed, JobState::Failed, JobState::Cancelled, normalizedDateTime);

        return static_cast<std::size_t>(count);
    }

    core::UUID Job::getUUID() const
    {
        const std::optional<core::UUID> uuid{ core::UUID::fromString(_uuid) };
        if (!uuid)
            throw Exception{ "Corrupted job uuid '" + _uuid + "'" };

        return *uuid;
    }

    void Job::setState(JobState state)
    {
        if (_state != state)
        {
            // progress and retry count are per stage
            _progress = 0;
            _retryCount = 0;
        }
        _state = state;
        touch();
    }

    void Job::setSource(std::string_view endpoint, std::string_view checksum)
    {
        _sourceEndpoint = endpoint;
        _sourceChecksum = checksum;
    }

    void Job::setResolution(unsigned width, unsigned height)
    {
        _width = static_cast<int>(width);
        _height = static_cast<int>(height);
    }

    void Job::setError(ErrorKind kind, JobState stage, std::string_view detail)
    {
        _errorKind = kind;
        _errorStage = stage;
        _errorDetail = detail;
    }

    void Job::setResult(std::string_view outputLocation, std::string_view contentHash, std::size_t encryptedSize)
    {
        _outputLocation = outputLocation;
        _contentHash = contentHash;
        _encryptedSize = static_cast<long long>(encryptedSize);
    }

    void Job::touch()
    {
        _updatedAt = utils::normalizeDateTime(Wt::WDateTime::currentDateTime());
    }
} // namespace mts::db
