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

#include <atomic>
#include <future>
#include <thread>

#include "crypto/Sha256Hasher.hpp"
#include "orchestrator/Exception.hpp"

#include "OrchestratorFixture.hpp"

namespace mts::orchestrator::tests
{
    using namespace std::chrono_literals;
    using transfer::tests::computeChecksum;
    using transfer::tests::generatePayload;

    namespace
    {
        std::string toString(const std::vector<std::byte>& bytes)
        {
            return std::string{ reinterpret_cast<const char*>(bytes.data()), bytes.size() };
        }

        std::optional<JobStatus> findStatus(const std::vector<JobStatus>& statuses, db::JobState state)
        {
            for (const JobStatus& status : statuses)
            {
                if (status.state == state)
                    return status;
            }
            return std::nullopt;
        }
    } // namespace

    TEST_F(OrchestratorFixture, completeJob)
    {
        const std::string source{ generatePayload(300 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };
        ASSERT_TRUE(subscription);

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->jobId, jobId);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_FALSE(status->errorKind);
        ASSERT_TRUE(status->result);

        const std::string expectedOutput{ getExpectedOutput(source) };
        EXPECT_EQ(openPublished(*status), expectedOutput);
        EXPECT_EQ(status->result->contentHash, computeChecksum(expectedOutput));
        EXPECT_EQ(status->result->encryptedSize, _remote.getUploadContent(status->result->outputLocation)->size());

        // states only move forward, progress is monotonic within a stage
        const std::vector<JobStatus> statuses{ recorder.getStatuses() };
        for (std::size_t i{ 1 }; i < statuses.size(); ++i)
        {
            EXPECT_LE(statuses[i - 1].state, statuses[i].state);
            if (statuses[i - 1].state == statuses[i].state)
                EXPECT_LE(statuses[i - 1].progress, statuses[i].progress);
        }
        for (db::JobState state : { db::JobState::Transcoding, db::JobState::Encrypting, db::JobState::Publishing })
            EXPECT_TRUE(findStatus(statuses, state)) << db::toString(state);

        EXPECT_EQ(_codecRunner.getRunCount(), 1);
        EXPECT_EQ(_slotPool->getHeldCount(), 0);
        EXPECT_EQ(_remote.getDownloadedBytes(), source.size());
        EXPECT_TRUE(std::filesystem::is_empty(_config.getSealedDirectory()));

        const std::optional<JobStatus> finalStatus{ orchestrator->getStatus(jobId) };
        ASSERT_TRUE(finalStatus);
        EXPECT_EQ(finalStatus->state, db::JobState::Completed);
    }

    TEST_F(OrchestratorFixture, completeJob_sourceWithoutAdvertisedChecksum)
    {
        const std::string source{ generatePayload(100 * 1024, 3) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source, false) };

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(openPublished(*status), getExpectedOutput(source));

        // output named after the locally computed checksum
        EXPECT_TRUE(std::filesystem::exists(_config.getOutputDirectory() / (computeChecksum(source) + "_720p.mp4")));
    }

    TEST_F(OrchestratorFixture, fetchSealedSource)
    {
        const std::string source{ generatePayload(300 * 1024, 5) };
        const core::UUID sealerJobId{ core::UUID::generate() };
        const std::string sealedSource{ toString(_cryptoPipeline->seal(std::as_bytes(std::span{ source }), sealerJobId).ciphertext) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mts", sealedSource) };

        auto orchestrator{ createOrchestrator() };
        JobDescriptor descriptor{ createDescriptor(sourceUrl) };
        descriptor.sourceSealedBy = sealerJobId;
        const core::UUID jobId{ orchestrator->submitJob(descriptor) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(openPublished(*status), getExpectedOutput(source));
        EXPECT_EQ(_remote.getDownloadedBytes(), sealedSource.size());

        // output named after the plaintext, sealed copy dropped once opened
        EXPECT_TRUE(std::filesystem::exists(_config.getOutputDirectory() / (computeChecksum(source) + "_720p.mp4")));
        EXPECT_FALSE(std::filesystem::exists(_config.getSourceDirectory() / (std::string{ jobId.getAsString() } + ".mts")));
    }

    TEST_F(OrchestratorFixture, fetchSealedSourceWithWrongKey)
    {
        const std::string source{ generatePayload(100 * 1024, 6) };
        const std::string sealedSource{ toString(_cryptoPipeline->seal(std::as_bytes(std::span{ source }), core::UUID::generate()).ciphertext) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mts", sealedSource) };

        auto orchestrator{ createOrchestrator() };
        JobDescriptor descriptor{ createDescriptor(sourceUrl) };
        descriptor.sourceSealedBy = core::UUID::generate();
        const core::UUID jobId{ orchestrator->submitJob(descriptor) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::FatalInput);
        EXPECT_EQ(status->errorStage, db::JobState::Fetching);

        // not retried, nothing transcoded from unauthenticated content
        EXPECT_EQ(_remote.getDownloadedBytes(), sealedSource.size());
        EXPECT_EQ(_codecRunner.getRunCount(), 0);
        EXPECT_FALSE(std::filesystem::exists(_config.getSourceDirectory() / std::string{ jobId.getAsString() }));
    }

    TEST_F(OrchestratorFixture, fetchResumesAfterInterruption)
    {
        _config.transfer.retryPolicy.maxAttempts = 1;

        const std::string source{ generatePayload(1024 * 1024, 1) };
        const std::string sourceUrl{ _remote.addResource("/videos/big.mkv", source) };

        // connection lost after 6 chunks, about 40% of the source
        _remote.injectFault(transfer::http::Method::Get, FakeRemote::Fault{ FakeRemote::FaultType::ConnectionFailure }, 1, 6);

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(openPublished(*status), getExpectedOutput(source));

        // no byte downloaded twice
        EXPECT_EQ(_remote.getDownloadedBytes(), source.size());

        const std::optional<JobStatus> retried{ recorder.waitFor([](const JobStatus& s) { return s.state == db::JobState::Fetching && s.retryCount == 1; }, 0ms) };
        ASSERT_TRUE(retried);
        EXPECT_GT(retried->progress, 0.f);
    }

    TEST_F(OrchestratorFixture, fetchFailsOnMissingSource)
    {
        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor("http://remote.test/videos/missing.mkv")) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::UnrecoverableRemote);
        EXPECT_EQ(status->errorStage, db::JobState::Fetching);
        EXPECT_FALSE(status->result);
        EXPECT_EQ(_codecRunner.getRunCount(), 0);
    }

    TEST_F(OrchestratorFixture, fetchFailsOnChecksumMismatch)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024), false) };

        auto orchestrator{ createOrchestrator() };
        JobDescriptor descriptor{ createDescriptor(sourceUrl) };
        descriptor.sourceChecksum = computeChecksum("something else");
        const core::UUID jobId{ orchestrator->submitJob(descriptor) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::UnrecoverableRemote);
        EXPECT_EQ(status->errorStage, db::JobState::Fetching);
        EXPECT_FALSE(std::filesystem::exists(_config.getSourceDirectory() / std::string{ jobId.getAsString() }));
    }

    TEST_F(OrchestratorFixture, fatalCodecOutcome)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _codecRunner.pushOutcome(codec::ExitOutcome{ .kind = codec::ExitKind::Fatal, .reason = codec::ExitReason::UnsupportedParameters, .exitCode = 1, .signal = std::nullopt, .detail = "Unknown encoder" });

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::FatalInput);
        EXPECT_EQ(status->errorStage, db::JobState::Transcoding);

        EXPECT_EQ(_codecRunner.getRunCount(), 1); // no retry
        EXPECT_EQ(_slotPool->getHeldCount(), 0);
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Post), 0);
        EXPECT_FALSE(findStatus(recorder.getStatuses(), db::JobState::Encrypting));
    }

    TEST_F(OrchestratorFixture, unsupportedContainer)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };

        auto orchestrator{ createOrchestrator() };
        JobDescriptor descriptor{ createDescriptor(sourceUrl) };
        descriptor.profile.container = "avi";
        const core::UUID jobId{ orchestrator->submitJob(descriptor) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::FatalInput);
        EXPECT_EQ(status->errorStage, db::JobState::Transcoding);
        EXPECT_EQ(_codecRunner.getRunCount(), 0);
    }

    TEST_F(OrchestratorFixture, recoverableCodecOutcomeIsRetried)
    {
        const std::string source{ generatePayload(100 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };
        _codecRunner.pushOutcome(codec::ExitOutcome{ .kind = codec::ExitKind::Recoverable, .reason = codec::ExitReason::Crashed, .exitCode = std::nullopt, .signal = 11, .detail = "" });

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(openPublished(*status), getExpectedOutput(source));
        EXPECT_EQ(_codecRunner.getRunCount(), 2);

        const std::optional<JobStatus> retried{ recorder.waitFor([](const JobStatus& s) { return s.state == db::JobState::Transcoding && s.retryCount == 1; }, 0ms) };
        EXPECT_TRUE(retried);
    }

    TEST_F(OrchestratorFixture, recoverableCodecRetriesExhausted)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        for (std::size_t i{}; i < _config.codecMaxRecoverableRetries + 1; ++i)
            _codecRunner.pushOutcome(codec::ExitOutcome{ .kind = codec::ExitKind::Recoverable, .reason = codec::ExitReason::Crashed, .exitCode = std::nullopt, .signal = 9, .detail = "" });

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::Transient);
        EXPECT_EQ(status->errorStage, db::JobState::Transcoding);
        EXPECT_EQ(_codecRunner.getRunCount(), _config.codecMaxRecoverableRetries + 1);
        EXPECT_EQ(_slotPool->getHeldCount(), 0);
    }

    TEST_F(OrchestratorFixture, secondCodecTimeoutIsFatal)
    {
        _config.codecMaxRecoverableRetries = 5;

        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        for (std::size_t i{}; i < 2; ++i)
            _codecRunner.pushOutcome(codec::ExitOutcome{ .kind = codec::ExitKind::Recoverable, .reason = codec::ExitReason::TimedOut, .exitCode = std::nullopt, .signal = 9, .detail = "" });

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::FatalInput);
        EXPECT_EQ(_codecRunner.getRunCount(), 2);
    }

    TEST_F(OrchestratorFixture, waitForEncoderSlot)
    {
        const std::string source{ generatePayload(100 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };

        auto orchestrator{ createOrchestrator() };

        // all the slots are held by someone else
        encoder::AcquireResult heldSlot{ _slotPool->acquire(core::UUID::generate(), 0ms, std::stop_token{}) };
        ASSERT_TRUE(std::holds_alternative<encoder::Slot>(heldSlot));

        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        // slot acquire timeout is 1 second
        const std::optional<JobStatus> waiting{ recorder.waitFor([](const JobStatus& s) { return s.state == db::JobState::Transcoding && s.retryCount >= 1; }, 10s) };
        ASSERT_TRUE(waiting);
        EXPECT_EQ(_codecRunner.getRunCount(), 0);
        EXPECT_EQ(orchestrator->getStatus(jobId)->state, db::JobState::Transcoding);

        std::get<encoder::Slot>(heldSlot).release();

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(_codecRunner.getRunCount(), 1);
        EXPECT_EQ(_slotPool->getHeldCount(), 0);
    }

    TEST_F(OrchestratorFixture, integrityFailure)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };

        TamperingCryptoPipeline tamperingPipeline{ *_cryptoPipeline };
        auto orchestrator{ createOrchestrator(&tamperingPipeline) };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::FatalInput);
        EXPECT_EQ(status->errorStage, db::JobState::Encrypting);

        // never published
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Post), 0);
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Patch), 0);
        EXPECT_FALSE(std::filesystem::exists(_config.getSealedDirectory() / (std::string{ jobId.getAsString() } + ".mts")));
    }

    TEST_F(OrchestratorFixture, publishRetriesTransientFailures)
    {
        _config.transfer.retryPolicy.maxAttempts = 1;

        const std::string source{ generatePayload(200 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };
        _remote.injectFault(transfer::http::Method::Patch, FakeRemote::Fault{ FakeRemote::FaultType::Status, 503 }, 1, 1);

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(openPublished(*status), getExpectedOutput(source));

        // resumed on the same upload
        EXPECT_EQ(_remote.getUploadUrls().size(), 1);
        EXPECT_TRUE(recorder.waitFor([](const JobStatus& s) { return s.state == db::JobState::Publishing && s.retryCount == 1; }, 0ms));
    }

    TEST_F(OrchestratorFixture, publishRetriesExhausted)
    {
        _config.transfer.retryPolicy.maxAttempts = 1;

        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _remote.injectFault(transfer::http::Method::Post, FakeRemote::Fault{ FakeRemote::FaultType::ConnectionFailure }, 100);

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Failed);
        EXPECT_EQ(status->errorKind, db::ErrorKind::Transient);
        EXPECT_EQ(status->errorStage, db::JobState::Publishing);
        EXPECT_TRUE(std::filesystem::is_empty(_config.getSealedDirectory()));
    }

    TEST_F(OrchestratorFixture, cancelDuringFetch)
    {
        const std::string source{ generatePayload(1024 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };

        std::promise<void> chunkStarted;
        std::promise<void> cancelled;
        std::shared_future<void> cancelledFuture{ cancelled.get_future().share() };
        std::atomic<std::size_t> getCount{};
        _remote.setRequestHook([&](const transfer::http::Request& request) {
            if (request.method != transfer::http::Method::Get || ++getCount != 3)
                return;

            chunkStarted.set_value();
            cancelledFuture.wait();
        });

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        ASSERT_EQ(chunkStarted.get_future().wait_for(10s), std::future_status::ready);
        EXPECT_TRUE(orchestrator->cancelJob(jobId));
        cancelled.set_value();

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Cancelled);
        EXPECT_FALSE(status->errorKind);

        // stopped at the next chunk boundary
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Get), 3);
        EXPECT_LT(_remote.getDownloadedBytes(), source.size());

        orchestrator->waitForIdle();
        EXPECT_FALSE(std::filesystem::exists(_config.getSourceDirectory() / std::string{ jobId.getAsString() }));
        EXPECT_EQ(_codecRunner.getRunCount(), 0);
        EXPECT_EQ(_slotPool->getHeldCount(), 0);
        EXPECT_FALSE(orchestrator->cancelJob(jobId));
    }

    TEST_F(OrchestratorFixture, cancelWhileSourceQueryBacksOff)
    {
        _config.transfer.retryPolicy.baseDelay = 60s;
        _config.transfer.retryPolicy.maxDelay = 60s;

        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _remote.injectFault(transfer::http::Method::Head, FakeRemote::Fault{ FakeRemote::FaultType::Status, 503 }, 100);

        std::promise<void> queried;
        std::atomic<bool> queriedOnce{};
        _remote.setRequestHook([&](const transfer::http::Request& request) {
            if (request.method == transfer::http::Method::Head && !queriedOnce.exchange(true))
                queried.set_value();
        });

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        ASSERT_EQ(queried.get_future().wait_for(10s), std::future_status::ready);
        EXPECT_TRUE(orchestrator->cancelJob(jobId));

        const std::optional<JobStatus> status{ recorder.waitForTerminalState(10s) };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Cancelled);
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Head), 1);
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Get), 0);
    }

    TEST_F(OrchestratorFixture, cancelDuringTranscode)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _codecRunner.setBlocking(true);

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };

        ASSERT_TRUE(_codecRunner.waitForRunningCount(1));
        EXPECT_EQ(_slotPool->getHeldCount(), 1);
        EXPECT_TRUE(orchestrator->cancelJob(jobId));

        const std::optional<JobStatus> status{ recorder.waitForTerminalState() };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Cancelled);
        EXPECT_EQ(_slotPool->getHeldCount(), 0);
        EXPECT_EQ(_remote.getRequestCount(transfer::http::Method::Post), 0);
    }

    TEST_F(OrchestratorFixture, cancelQueuedJob)
    {
        _config.maxConcurrentJobs = 1;
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _codecRunner.setBlocking(true);

        auto orchestrator{ createOrchestrator() };
        const core::UUID runningJobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };
        ASSERT_TRUE(_codecRunner.waitForRunningCount(1));

        const core::UUID queuedJobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };
        EXPECT_EQ(orchestrator->getStatus(queuedJobId)->state, db::JobState::Queued);

        EXPECT_TRUE(orchestrator->cancelJob(queuedJobId));
        EXPECT_EQ(orchestrator->getStatus(queuedJobId)->state, db::JobState::Cancelled);

        _codecRunner.unblock();
        orchestrator->waitForIdle();

        EXPECT_EQ(orchestrator->getStatus(runningJobId)->state, db::JobState::Completed);
        EXPECT_EQ(orchestrator->getStatus(queuedJobId)->state, db::JobState::Cancelled);
        EXPECT_EQ(_codecRunner.getRunCount(), 1);
    }

    TEST_F(OrchestratorFixture, cancelUnknownJob)
    {
        auto orchestrator{ createOrchestrator() };
        EXPECT_FALSE(orchestrator->cancelJob(core::UUID::generate()));
        EXPECT_FALSE(orchestrator->getStatus(core::UUID::generate()));
        EXPECT_FALSE(orchestrator->streamStatus(core::UUID::generate(), [](const JobStatus&) {}));
    }

    TEST_F(OrchestratorFixture, concurrencyBound)
    {
        _config.maxConcurrentJobs = 2;
        _config.encoderSlotCount = 3;
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _codecRunner.setBlocking(true);

        auto orchestrator{ createOrchestrator() };
        std::vector<core::UUID> jobIds;
        for (const std::string_view label : { "480p", "720p", "1080p" })
            jobIds.push_back(orchestrator->submitJob(createDescriptor(sourceUrl, label)));

        ASSERT_TRUE(_codecRunner.waitForRunningCount(2));
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(_codecRunner.getRunningCount(), 2);
        EXPECT_EQ(orchestrator->getStatus(jobIds.back())->state, db::JobState::Queued); // FIFO admission

        _codecRunner.unblock();
        orchestrator->waitForIdle();

        for (const core::UUID& jobId : jobIds)
            EXPECT_EQ(orchestrator->getStatus(jobId)->state, db::JobState::Completed);
        EXPECT_EQ(_codecRunner.getMaxConcurrentRuns(), 2);
    }

    TEST_F(OrchestratorFixture, cachedOutput)
    {
        const std::string source{ generatePayload(100 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };

        auto orchestrator{ createOrchestrator() };

        const core::UUID firstJobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };
        orchestrator->waitForIdle();
        const core::UUID secondJobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };
        orchestrator->waitForIdle();

        const std::optional<JobStatus> firstStatus{ orchestrator->getStatus(firstJobId) };
        const std::optional<JobStatus> secondStatus{ orchestrator->getStatus(secondJobId) };
        ASSERT_TRUE(firstStatus);
        ASSERT_TRUE(secondStatus);
        EXPECT_EQ(firstStatus->state, db::JobState::Completed);
        EXPECT_EQ(secondStatus->state, db::JobState::Completed);

        EXPECT_EQ(_codecRunner.getRunCount(), 1);
        EXPECT_EQ(openPublished(*secondStatus), getExpectedOutput(source));
        EXPECT_EQ(firstStatus->result->contentHash, secondStatus->result->contentHash);
        EXPECT_NE(firstStatus->result->outputLocation, secondStatus->result->outputLocation);
    }

    TEST_F(OrchestratorFixture, recoverInterruptedJob)
    {
        const std::string source{ generatePayload(100 * 1024) };
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", source) };
        _codecRunner.setBlocking(true);

        std::optional<core::UUID> jobId;
        {
            auto orchestrator{ createOrchestrator() };
            jobId = orchestrator->submitJob(createDescriptor(sourceUrl));
            ASSERT_TRUE(_codecRunner.waitForRunningCount(1));
        } // shutdown while transcoding

        _codecRunner.unblock();

        auto orchestrator{ createOrchestrator() };
        EXPECT_EQ(orchestrator->getStatus(*jobId)->state, db::JobState::Transcoding);
        EXPECT_EQ(_slotPool->getHeldCount(), 0);

        EXPECT_EQ(orchestrator->recoverJobs(), 1);
        EXPECT_EQ(orchestrator->recoverJobs(), 0); // already scheduled or done
        orchestrator->waitForIdle();

        const std::optional<JobStatus> status{ orchestrator->getStatus(*jobId) };
        ASSERT_TRUE(status);
        EXPECT_EQ(status->state, db::JobState::Completed);
        EXPECT_EQ(openPublished(*status), getExpectedOutput(source));
        EXPECT_EQ(_remote.getDownloadedBytes(), source.size()); // not fetched again
    }

    TEST_F(OrchestratorFixture, streamStatusOfTerminatedJob)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };
        orchestrator->waitForIdle();

        StatusRecorder recorder;
        auto subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };
        ASSERT_TRUE(subscription);

        const std::vector<JobStatus> statuses{ recorder.getStatuses() };
        ASSERT_EQ(statuses.size(), 1);
        EXPECT_EQ(statuses.front().state, db::JobState::Completed);
        EXPECT_EQ(statuses.front().progress, 0.f);
    }

    TEST_F(OrchestratorFixture, subscriptionReset)
    {
        const std::string sourceUrl{ _remote.addResource("/videos/source.mkv", generatePayload(100 * 1024)) };
        _codecRunner.setBlocking(true);

        auto orchestrator{ createOrchestrator() };
        const core::UUID jobId{ orchestrator->submitJob(createDescriptor(sourceUrl)) };

        StatusRecorder recorder;
        std::optional<StatusSubscription> subscription{ orchestrator->streamStatus(jobId, recorder.getCallback()) };
        ASSERT_TRUE(subscription);
        ASSERT_TRUE(_codecRunner.waitForRunningCount(1));

        subscription->reset();
        EXPECT_FALSE(subscription->isActive());
        const std::size_t statusCount{ recorder.getStatuses().size() };

        _codecRunner.unblock();
        orchestrator->waitForIdle();

        EXPECT_EQ(recorder.getStatuses().size(), statusCount);
        EXPECT_EQ(orchestrator->getStatus(jobId)->state, db::JobState::Completed);
    }

    TEST_F(OrchestratorFixture, invalidDescriptor)
    {
        auto orchestrator{ createOrchestrator() };

        {
            JobDescriptor descriptor{ createDescriptor("") };
            EXPECT_THROW(orchestrator->submitJob(descriptor), InvalidJobDescriptorException);
        }
        {
            JobDescriptor descriptor{ createDescriptor("http://remote.test/videos/source.mkv") };
            descriptor.publishEndpoint.clear();
            EXPECT_THROW(orchestrator->submitJob(descriptor), InvalidJobDescriptorException);
        }
        {
            JobDescriptor descriptor{ createDescriptor("http://remote.test/videos/source.mkv") };
            descriptor.sourceChecksum = "not-a-checksum";
            EXPECT_THROW(orchestrator->submitJob(descriptor), InvalidJobDescriptorException);
        }
        {
            JobDescriptor descriptor{ createDescriptor("http://remote.test/videos/source.mkv") };
            descriptor.profile.videoCodec.clear();
            EXPECT_THROW(orchestrator->submitJob(descriptor), InvalidJobDescriptorException);
        }
    }
} // namespace mts::orchestrator::tests
