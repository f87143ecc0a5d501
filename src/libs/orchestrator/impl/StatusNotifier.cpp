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

#include "StatusNotifier.hpp"

#include <utility>
#include <vector>

#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "orchestrator/Exception.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[Status] - " << message)

namespace mts::orchestrator
{
    StatusSubscription::StatusSubscription(UnsubscribeFunc unsubscribe)
        : _unsubscribe{ std::move(unsubscribe) }
    {
    }

    StatusSubscription::~StatusSubscription()
    {
        reset();
    }

    StatusSubscription::StatusSubscription(StatusSubscription&& other) noexcept
        : _unsubscribe{ std::exchange(other._unsubscribe, nullptr) }
    {
    }

    StatusSubscription& StatusSubscription::operator=(StatusSubscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            _unsubscribe = std::exchange(other._unsubscribe, nullptr);
        }

        return *this;
    }

    void StatusSubscription::reset()
    {
        if (!_unsubscribe)
            return;

        UnsubscribeFunc unsubscribe{ std::exchange(_unsubscribe, nullptr) };
        unsubscribe();
    }

    JobStatus toJobStatus(const db::Job& job)
    {
        JobStatus status{ .jobId = job.getUUID() };
        status.state = job.getState();
        status.progress = static_cast<float>(job.getProgress());
        status.retryCount = job.getRetryCount();
        if (job.getState() == db::JobState::Failed)
        {
            status.errorKind = job.getErrorKind();
            status.errorStage = job.getErrorStage();
        }
        if (job.getState() == db::JobState::Completed)
            status.result = JobResult{ job.getOutputLocation(), job.getContentHash(), job.getEncryptedSize() };

        return status;
    }

    StatusNotifier::StatusNotifier(db::IDb& db)
        : _db{ db }
    {
    }

    JobStatus StatusNotifier::update(const core::UUID& jobId, const JobModifier& modifier)
    {
        const std::shared_ptr<Channel> channel{ getOrCreateChannel(jobId) };

        std::scoped_lock channelLock{ channel->mutex };

        std::optional<JobStatus> status;
        {
            db::Session& session{ _db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            const db::Job::pointer job{ db::Job::find(session, jobId) };
            if (!job)
                throw Exception{ "Job " + std::string{ jobId.getAsString() } + " not found" };

            modifier(*job.modify());
            job.modify()->touch();
            status = toJobStatus(*job);
        }

        // copy, callbacks may unsubscribe themselves
        const std::map<SubscriberId, StatusCallback> subscribers{ channel->subscribers };
        for (const auto& [id, callback] : subscribers)
        {
            if (channel->subscribers.contains(id))
                callback(*status);
        }

        if (db::isTerminal(status->state))
        {
            channel->terminated = true;
            releaseChannelIfUnused(jobId, channel);
        }

        return *status;
    }

    std::optional<StatusSubscription> StatusNotifier::subscribe(const core::UUID& jobId, StatusCallback callback)
    {
        const std::shared_ptr<Channel> channel{ getOrCreateChannel(jobId) };

        std::scoped_lock channelLock{ channel->mutex };

        const std::optional<JobStatus> status{ getStatus(jobId) };
        if (!status)
        {
            channel->terminated = true;
            releaseChannelIfUnused(jobId, channel);
            return std::nullopt;
        }

        SubscriberId id;
        {
            std::scoped_lock lock{ _mutex };
            id = _nextSubscriberId++;
        }
        channel->subscribers.emplace(id, callback);
        channel->terminated = db::isTerminal(status->state);
        LOG(DEBUG, "New subscriber " << id << " for job " << jobId);

        callback(*status);

        return StatusSubscription{ [this, jobId, channel, id] { unsubscribe(jobId, channel, id); } };
    }

    std::optional<JobStatus> StatusNotifier::getStatus(const core::UUID& jobId)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::Job::pointer job{ db::Job::find(session, jobId) };
        if (!job)
            return std::nullopt;

        return toJobStatus(*job);
    }

    std::shared_ptr<StatusNotifier::Channel> StatusNotifier::getOrCreateChannel(const core::UUID& jobId)
    {
        std::scoped_lock lock{ _mutex };

        auto itChannel{ _channels.find(jobId) };
        if (itChannel == std::end(_channels))
            itChannel = _channels.emplace(jobId, std::make_shared<Channel>()).first;

        return itChannel->second;
    }

    void StatusNotifier::unsubscribe(const core::UUID& jobId, const std::shared_ptr<Channel>& channel, SubscriberId id)
    {
        std::scoped_lock channelLock{ channel->mutex };

        channel->subscribers.erase(id);
        LOG(DEBUG, "Removed subscriber " << id << " for job " << jobId);

        releaseChannelIfUnused(jobId, channel);
    }

    // channel mutex must be held
    void StatusNotifier::releaseChannelIfUnused(const core::UUID& jobId, const std::shared_ptr<Channel>& channel)
    {
        if (!channel->subscribers.empty() || !channel->terminated)
            return;

        std::scoped_lock lock{ _mutex };

        auto itChannel{ _channels.find(jobId) };
        if (itChannel != std::end(_channels) && itChannel->second == channel)
            _channels.erase(itChannel);
    }
} // namespace mts::orchestrator
