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
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "core/UUID.hpp"
#include "database/objects/Job.hpp"
#include "orchestrator/IJobOrchestrator.hpp"
#include "orchestrator/Types.hpp"

namespace mts::db
{
    class IDb;
}

namespace mts::orchestrator
{
    JobStatus toJobStatus(const db::Job& job);

    // Persists the job changes and forwards the resulting status to the subscribers
    // Updates and subscriptions of a given job are serialized, so that a subscriber never
    // sees an older status after a newer one
    class StatusNotifier
    {
    public:
        StatusNotifier(db::IDb& db);
        ~StatusNotifier() = default;
        StatusNotifier(const StatusNotifier&) = delete;
        StatusNotifier& operator=(const StatusNotifier&) = delete;

        using JobModifier = std::function<void(db::Job& job)>;
        // Throws Exception if the job does not exist
        JobStatus update(const core::UUID& jobId, const JobModifier& modifier);

        std::optional<StatusSubscription> subscribe(const core::UUID& jobId, StatusCallback callback);
        std::optional<JobStatus> getStatus(const core::UUID& jobId);

    private:
        using SubscriberId = std::size_t;
        struct Channel
        {
            std::recursive_mutex mutex; // callbacks may subscribe, unsubscribe or cancel
            std::map<SubscriberId, StatusCallback> subscribers;
            bool terminated{};
        };

        std::shared_ptr<Channel> getOrCreateChannel(const core::UUID& jobId);
        void unsubscribe(const core::UUID& jobId, const std::shared_ptr<Channel>& channel, SubscriberId id);
        void releaseChannelIfUnused(const core::UUID& jobId, const std::shared_ptr<Channel>& channel);

        db::IDb& _db;

        std::mutex _mutex;
        std::unordered_map<core::UUID, std::shared_ptr<Channel>> _channels;
        SubscriberId _nextSubscriberId{};
    };
} // namespace mts::orchestrator
