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

#include "JobOrchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <system_error>

#include <boost/asio/post.hpp>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Job.hpp"
#include "orchestrator/Exception.hpp"
#include "transfer/ITransferSessionStore.hpp"

#include "JobFiles.hpp"
#include "stages/EncryptStage.hpp"
#include "stages/FetchStage.hpp"
#include "stages/PublishStage.hpp"
#include "stages/TranscodeStage.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[job " << jobId << "] - " << message)

namespace mts::orchestrator
{
    namespace
    {
        bool isValidChecksum(std::string_view checksum)
        {
            return checksum.size() == 64 && std::all_of(std::cbegin(checksum), std::cend(checksum), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
        }

        void validateDescriptor(const JobDescriptor& descriptor)
        {
            if (descriptor.sourceEndpoint.empty())
                throw InvalidJobDescriptorException{ "Missing source endpoint" };
            if (descriptor.publishEndpoint.empty())
                throw InvalidJobDescriptorException{ "Missing publish endpoint" };
            if (!descriptor.sourceChecksum.empty() && !isValidChecksum(descriptor.sourceChecksum))
                throw InvalidJobDescriptorException{ "Source checksum must be an hex encoded SHA-256" };
            if (descriptor.profile.videoCodec.empty() || descriptor.profile.container.empty())
                throw InvalidJobDescriptorException{ "Target profile requires a video codec and a container" };
        }
    } // namespace

    std::unique_ptr<IJobOrchestrator> createJobOrchestrator(const Config& config, const Dependencies& dependencies)
    {
        return std::make_unique<JobOrchestrator>(config, dependencies);
    }

    JobOrchestrator::JobOrchestrator(const Config& config, const Dependencies& dependencies)
        : _config{ config }
        , _dependencies{ dependencies }
        , _notifier{ _dependencies.db }
        , _garbageCollector{ _gcIoContext, _config, _dependencies.db, [this] { return getFilesInUse(); } }
        , _gcIoContextRunner{ _gcIoContext, 1, "GarbageCollector" }
        , _jobIoContextRunner{ _jobIoContext, _config.maxConcurrentJobs, "Jobs" }
    {
        std::filesystem::create_directories(_config.getSourceDirectory());
        std::filesystem::create_directories(_config.getOutputDirectory());
        std::filesystem::create_directories(_config.getSealedDirectory());

        const JobStageBase::InitParams initParams{ _config, _dependencies, _notifier };
        _stages.push_back(std::make_unique<FetchStage>(initParams));
        _stages.push_back(std::make_unique<TranscodeStage>(initParams));
        _stages.push_back(std::make_unique<EncryptStage>(initParams));
        _stages.push_back(std::make_unique<PublishStage>(initParams));

        if (_config.gcInterval.count() > 0)
            _garbageCollector.start();

        MTS_LOG(ORCHESTRATOR, INFO, "Started, running up to " << _config.maxConcurrentJobs << " jobs at once");
    }

    JobOrchestrator::~JobOrchestrator()
    {
        MTS_LOG(ORCHESTRATOR, INFO, "Stopping...");

        {
            std::scoped_lock lock{ _mutex };
            for (auto& [jobId, activeJob] : _activeJobs)
                activeJob->stopSource.request_stop();
        }

        _gcIoContextRunner.stop();
        _jobIoContextRunner.stop();
    }

    core::UUID JobOrchestrator::submitJob(const JobDescriptor& descriptor)
    {
        validateDescriptor(descriptor);

        const core::UUID jobId{ core::UUID::generate() };
        {
            db::Session& session{ _dependencies.db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            db::Job::pointer job{ session.create<db::Job>(jobId) };
            db::Job* modifiedJob{ job.modify() };

            modifiedJob->setSource(descriptor.sourceEndpoint, core::stringUtils::stringToLower(descriptor.sourceChecksum));
            if (descriptor.sourceSessionToken)
                modifiedJob->setSourceSessionToken(descriptor.sourceSessionToken->getAsString());
            if (descriptor.sourceSealedBy)
                modifiedJob->setSourceSealedBy(descriptor.sourceSealedBy->getAsString());
            modifiedJob->setPublishEndpoint(descriptor.publishEndpoint);

            const codec::TargetProfile& profile{ descriptor.profile };
            modifiedJob->setProfileLabel(profile.label);
            modifiedJob->setCodec(profile.videoCodec);
            modifiedJob->setContainer(profile.container);
            modifiedJob->setResolution(profile.width, profile.height);
            modifiedJob->setVideoBitrate(profile.videoBitrate);
            modifiedJob->setAudioCodec(profile.audioCodec);
            modifiedJob->setAudioBitrate(profile.audioBitrate);
            modifiedJob->setHardwareAcceleration(profile.hardwareAcceleration);
        }

        LOG(INFO, "Submitted, source = " << descriptor.sourceEndpoint << (descriptor.sourceSealedBy ? " (sealed)" : "") << ", profile = '" << descriptor.profile.label << "'");
        scheduleJob(jobId);

        return jobId;
    }

    std::optional<StatusSubscription> JobOrchestrator::streamStatus(const core::UUID& jobId, StatusCallback callback)
    {
        return _notifier.subscribe(jobId, std::move(callback));
    }

    bool JobOrchestrator::cancelJob(const core::UUID& jobId)
    {
        bool isActive{};
        bool cancelNow{};
        {
            std::scoped_lock lock{ _mutex };

            auto itActiveJob{ _activeJobs.find(jobId) };
            if (itActiveJob != std::end(_activeJobs))
            {
                ActiveJob& activeJob{ *itActiveJob->second };
                isActive = true;
                activeJob.cancelRequested = true;
                if (!activeJob.claimed)
                {
                    // still queued
                    activeJob.claimed = true;
                    cancelNow = true;
                }
                else
                {
                    activeJob.stopSource.request_stop();
                }
            }
        }

        if (isActive)
        {
            LOG(INFO, "Cancellation requested");
            if (cancelNow)
            {
                try
                {
                    cancel(jobId);
                }
                catch (...)
                {
                    onJobEnded(jobId);
                    throw;
                }
                onJobEnded(jobId);
            }

            return true;
        }

        // persisted job not recovered yet
        const std::optional<JobStatus> status{ _notifier.getStatus(jobId) };
        if (!status || db::isTerminal(status->state))
            return false;

        cancel(jobId);
        return true;
    }

    std::optional<JobStatus> JobOrchestrator::getStatus(const core::UUID& jobId)
    {
        return _notifier.getStatus(jobId);
    }

    std::size_t JobOrchestrator::recoverJobs()
    {
        std::vector<core::UUID> jobIds;
        {
            db::Session& session{ _dependencies.db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };

            db::Job::findNonTerminal(session, [&](const db::Job::pointer& job) {
                jobIds.push_back(job->getUUID());
            });
        }

        std::size_t recoveredCount{};
        for (const core::UUID& jobId : jobIds)
        {
            if (!scheduleJob(jobId))
                continue;

            LOG(INFO, "Recovered");
            recoveredCount += 1;
        }

        MTS_LOG(ORCHESTRATOR, INFO, "Recovered " << recoveredCount << " jobs");
        return recoveredCount;
    }

    bool JobOrchestrator::waitForIdle(std::stop_token stopToken)
    {
        std::unique_lock lock{ _mutex };
        return _idleCondition.wait(lock, stopToken, [this] { return _activeJobs.empty(); });
    }

    bool JobOrchestrator::scheduleJob(const core::UUID& jobId)
    {
        {
            std::scoped_lock lock{ _mutex };
            if (!_activeJobs.emplace(jobId, std::make_shared<ActiveJob>()).second)
                return false;
        }

        // admitted in FIFO order by the job threads
        boost::asio::post(_jobIoContext, [this, jobId] { processJob(jobId); });
        return true;
    }

    void JobOrchestrator::processJob(const core::UUID& jobId)
    {
        std::shared_ptr<ActiveJob> activeJob;
        {
            std::scoped_lock lock{ _mutex };

            auto itActiveJob{ _activeJobs.find(jobId) };
            if (itActiveJob == std::end(_activeJobs) || itActiveJob->second->claimed)
                return; // cancelled while queued

            activeJob = itActiveJob->second;
            activeJob->claimed = true;
        }

        try
        {
            runJob(jobId, *activeJob);
        }
        catch (const std::exception& e)
        {
            LOG(ERROR, "Caught exception: " << e.what());

            try
            {
                const std::optional<JobStatus> status{ _notifier.getStatus(jobId) };
                if (status && !db::isTerminal(status->state))
                    fail(jobId, status->state, StageFailed{ db::ErrorKind::FatalInput, e.what() });
            }
            catch (const std::exception& failException)
            {
                LOG(ERROR, "Cannot mark job as failed: " << failException.what());
            }
        }

        onJobEnded(jobId);
    }

    void JobOrchestrator::runJob(const core::UUID& jobId, const ActiveJob& activeJob)
    {
        const std::stop_token stopToken{ activeJob.stopSource.get_token() };

        std::optional<JobStatus> status{ _notifier.getStatus(jobId) };
        if (!status)
            throw Exception{ "Job " + std::string{ jobId.getAsString() } + " not found" };

        LOG(DEBUG, "Processing from state '" << db::toString(status->state) << "'");

        while (!db::isTerminal(status->state) && !stopToken.stop_requested())
        {
            if (status->state == db::JobState::Queued)
            {
                status = transition(jobId, _stages.front()->getState());
                continue;
            }

            IJobStage& stage{ getStage(status->state) };

            JobContext context{ .jobId = jobId, .stopToken = stopToken, .progress = status->progress, .retryCount = status->retryCount };

            LOG(DEBUG, "Starting stage '" << stage.getName() << "'");
            const StageOutcome outcome{ stage.process(context) };

            if (std::holds_alternative<StageCompleted>(outcome))
            {
                LOG(DEBUG, "Completed stage '" << stage.getName() << "'");
                status = transition(jobId, getNextState(status->state));
            }
            else if (const StageFailed* failure{ std::get_if<StageFailed>(&outcome) })
            {
                status = fail(jobId, status->state, *failure);
            }
            else
            {
                break;
            }
        }

        if (db::isTerminal(status->state))
            return;

        if (isCancelRequested(jobId))
            cancel(jobId);
        else
            LOG(INFO, "Interrupted in state '" << db::toString(status->state) << "', will be resumed on next recovery");
    }

    IJobStage& JobOrchestrator::getStage(db::JobState state)
    {
        auto itStage{ std::find_if(std::cbegin(_stages), std::cend(_stages), [=](const auto& stage) { return stage->getState() == state; }) };
        if (itStage == std::cend(_stages))
            throw Exception{ "No stage for state '" + std::string{ db::toString(state) } + "'" };

        return **itStage;
    }

    db::JobState JobOrchestrator::getNextState(db::JobState state) const
    {
        auto itStage{ std::find_if(std::cbegin(_stages), std::cend(_stages), [=](const auto& stage) { return stage->getState() == state; }) };
        if (itStage == std::cend(_stages) || std::next(itStage) == std::cend(_stages))
            return db::JobState::Completed;

        return (*std::next(itStage))->getState();
    }

    JobStatus JobOrchestrator::transition(const core::UUID& jobId, db::JobState state)
    {
        const JobStatus status{ _notifier.update(jobId, [=](db::Job& job) { job.setState(state); }) };

        if (state == db::JobState::Completed)
            LOG(INFO, "Completed, published to " << status.result->outputLocation);
        else
            LOG(DEBUG, "Now in state '" << db::toString(state) << "'");

        return status;
    }

    JobStatus JobOrchestrator::fail(const core::UUID& jobId, db::JobState stage, const StageFailed& failure)
    {
        LOG(ERROR, "Failed in state '" << db::toString(stage) << "': " << db::toString(failure.kind) << ": " << failure.detail);

        releaseJobResources(jobId);

        return _notifier.update(jobId, [&](db::Job& job) {
            job.setState(db::JobState::Failed);
            job.setError(failure.kind, stage, failure.detail);
        });
    }

    JobStatus JobOrchestrator::cancel(const core::UUID& jobId)
    {
        releaseJobResources(jobId);

        LOG(INFO, "Cancelled");
        return _notifier.update(jobId, [](db::Job& job) { job.setState(db::JobState::Cancelled); });
    }

    void JobOrchestrator::releaseJobResources(const core::UUID& jobId)
    {
        std::vector<core::UUID> sessionTokens;
        {
            db::Session& session{ _dependencies.db.getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            const db::Job::pointer job{ db::Job::find(session, jobId) };
            if (!job)
                return;

            for (const std::string& token : { job->getSourceSessionToken(), job->getPublishSessionToken() })
            {
                if (std::optional<core::UUID> sessionToken{ core::UUID::fromString(token) })
                    sessionTokens.push_back(*sessionToken);
            }
            job.modify()->setSourceSessionToken("");
            job.modify()->setPublishSessionToken("");
        }

        for (const core::UUID& sessionToken : sessionTokens)
        {
            LOG(DEBUG, "Discarding transfer session " << sessionToken);
            _dependencies.transferSessionStore.remove(sessionToken);
        }

        for (const std::filesystem::path& file : { getSourcePath(_config, jobId), getSealedSourcePath(_config, jobId), getSealedPath(_config, jobId) })
        {
            std::error_code ec;
            std::filesystem::remove(file, ec);
            if (ec)
                LOG(WARNING, "Cannot remove " << file << ": " << ec.message());
        }
    }

    void JobOrchestrator::onJobEnded(const core::UUID& jobId)
    {
        {
            std::scoped_lock lock{ _mutex };
            _activeJobs.erase(jobId);
        }
        _idleCondition.notify_all();
    }

    bool JobOrchestrator::isCancelRequested(const core::UUID& jobId)
    {
        std::scoped_lock lock{ _mutex };

        auto itActiveJob{ _activeJobs.find(jobId) };
        return itActiveJob != std::end(_activeJobs) && itActiveJob->second->cancelRequested;
    }

    std::set<std::filesystem::path> JobOrchestrator::getFilesInUse()
    {
        std::set<std::filesystem::path> files;

        db::Session& session{ _dependencies.db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Job::findNonTerminal(session, [&](const db::Job::pointer& job) {
            const core::UUID jobId{ job->getUUID() };
            files.insert(getSourcePath(_config, jobId));
            files.insert(getSealedSourcePath(_config, jobId));
            if (const std::optional<std::filesystem::path> outputPath{ getOutputPath(_config, *job) })
            {
                files.insert(*outputPath);
                files.insert(getPartialOutputPath(*outputPath, jobId));
            }
        });

        return files;
    }
} // namespace mts::orchestrator
