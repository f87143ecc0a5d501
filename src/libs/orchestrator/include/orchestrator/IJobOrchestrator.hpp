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
#include <memory>
#include <optional>
#include <stop_token>

#include "core/UUID.hpp"
#include "orchestrator/Config.hpp"
#include "orchestrator/Types.hpp"

namespace mts::db
{
    class IDb;
}

namespace mts::transfer
{
    class IResumableTransferClient;
    class ITransferSessionStore;
} // namespace mts::transfer

namespace mts::encoder
{
    class IEncoderSlotPool;
}

namespace mts::codec
{
    class ICodecRunner;
}

namespace mts::crypto
{
    class ICryptoPipeline;
}

namespace mts::orchestrator
{
    using StatusCallback = std::function<void(const JobStatus& status)>;

    // Notifications stop once destroyed or reset
    // Must not outlive the orchestrator
    class StatusSubscription
    {
    public:
        StatusSubscription() = default;
        ~StatusSubscription();
        StatusSubscription(StatusSubscription&& other) noexcept;
        StatusSubscription& operator=(StatusSubscription&& other) noexcept;
        StatusSubscription(const StatusSubscription&) = delete;
        StatusSubscription& operator=(const StatusSubscription&) = delete;

        bool isActive() const { return static_cast<bool>(_unsubscribe); }
        void reset();

    private:
        friend class StatusNotifier;
        using UnsubscribeFunc = std::function<void()>;
        explicit StatusSubscription(UnsubscribeFunc unsubscribe);

        UnsubscribeFunc _unsubscribe;
    };

    // Shared components, must outlive the orchestrator
    struct Dependencies
    {
        db::IDb& db;
        transfer::IResumableTransferClient& transferClient;
        transfer::ITransferSessionStore& transferSessionStore;
        encoder::IEncoderSlotPool& encoderSlotPool;
        codec::ICodecRunner& codecRunner;
        crypto::ICryptoPipeline& cryptoPipeline;
    };

    class IJobOrchestrator
    {
    public:
        virtual ~IJobOrchestrator() = default;

        // Persists the job as Queued, it is admitted in submission order
        // Throws InvalidJobDescriptorException
        virtual core::UUID submitJob(const JobDescriptor& descriptor) = 0;

        // The current status is delivered right away, then every transition and progress change
        // Callbacks are called from job threads and must not block
        virtual std::optional<StatusSubscription> streamStatus(const core::UUID& jobId, StatusCallback callback) = 0;

        // Cancellation takes effect at the job's next checkpoint
        // Returns false if the job is unknown or already terminated
        virtual bool cancelJob(const core::UUID& jobId) = 0;

        virtual std::optional<JobStatus> getStatus(const core::UUID& jobId) = 0;

        // Requeues the persisted non terminal jobs, they resume from their current stage
        virtual std::size_t recoverJobs() = 0;

        // Blocks until no job is queued or running
        // Returns false if stopToken was triggered first
        virtual bool waitForIdle(std::stop_token stopToken = {}) = 0;
    };

    std::unique_ptr<IJobOrchestrator> createJobOrchestrator(const Config& config, const Dependencies& dependencies);
} // namespace mts::orchestrator
