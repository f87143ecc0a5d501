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

#include "PublishStage.hpp"

#include <system_error>

#include "core/ILogger.hpp"
#include "crypto/Sha256Hasher.hpp"
#include "crypto/Types.hpp"

#include "JobFiles.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[job " << context.jobId << "] [Publish] - " << message)

namespace mts::orchestrator
{
    namespace
    {
        struct PublishInfo
        {
            std::string endpoint;
            std::optional<core::UUID> sessionToken;
        };
    } // namespace

    PublishStage::PublishStage(const InitParams& initParams)
        : JobStageBase{ initParams }
    {
    }

    StageOutcome PublishStage::process(JobContext& context)
    {
        const std::filesystem::path sealedPath{ getSealedPath(_config, context.jobId) };
        if (!std::filesystem::exists(sealedPath))
            return StageFailed{ db::ErrorKind::FatalInput, "Sealed output is missing" };

        std::string sealedChecksum;
        try
        {
            sealedChecksum = crypto::Sha256Hasher::computeFileAsHex(sealedPath);
        }
        catch (const crypto::CryptoException& e)
        {
            return StageFailed{ db::ErrorKind::FatalInput, std::string{ "Cannot hash sealed output: " } + e.what() };
        }

        std::optional<transfer::TransferSession> session;
        const StageOutcome outcome{ runTransferAttempts(context, "Upload", [&]() -> transfer::TransferOutcome {
            transfer::SessionResult result{ openOrResumeSession(context, sealedPath, sealedChecksum) };
            if (std::holds_alternative<transfer::TransferCancelled>(result))
                return transfer::TransferCancelled{};
            if (transfer::TransferError* error{ std::get_if<transfer::TransferError>(&result) })
                return std::move(*error);

            session = std::move(std::get<transfer::TransferSession>(result));
            return _dependencies.transferClient.upload(*session, context.stopToken, [&](std::size_t offset, std::size_t totalLength) {
                if (totalLength > 0)
                    reportProgress(context, static_cast<float>(offset) / static_cast<float>(totalLength));
            });
        }) };

        if (!std::holds_alternative<StageCompleted>(outcome))
            return outcome;

        modifyJob(context, [&](db::Job& job) {
            job.setOutputLocation(session->remoteSessionId);
            job.setPublishSessionToken("");
        });
        _dependencies.transferClient.discard(*session);

        std::error_code ec;
        std::filesystem::remove(sealedPath, ec);
        if (ec)
            LOG(WARNING, "Cannot remove " << sealedPath << ": " << ec.message());

        LOG(INFO, "Published to " << session->remoteSessionId);
        reportProgress(context, 1.f);

        return StageCompleted{};
    }

    transfer::SessionResult PublishStage::openOrResumeSession(JobContext& context, const std::filesystem::path& sealedPath, const std::string& sealedChecksum)
    {
        const PublishInfo publish{ visitJob(context, [](const db::Job& job) {
            return PublishInfo{ job.getPublishEndpoint(), core::UUID::fromString(job.getPublishSessionToken()) };
        }) };

        if (publish.sessionToken)
        {
            transfer::SessionResult result{ _dependencies.transferClient.resume(*publish.sessionToken, context.stopToken) };
            if (std::holds_alternative<transfer::TransferCancelled>(result))
                return result;

            const transfer::TransferError* error{ std::get_if<transfer::TransferError>(&result) };
            if (!error)
            {
                const transfer::TransferSession& session{ std::get<transfer::TransferSession>(result) };
                LOG(DEBUG, "Resumed upload session " << session.token << " at offset " << session.offset << "/" << session.totalLength);
                return result;
            }

            if (error->type != transfer::TransferErrorType::SessionNotFound)
                return result;

            LOG(WARNING, "Upload session " << *publish.sessionToken << " not found, starting over");
        }

        transfer::OpenParameters parameters;
        parameters.endpoint = publish.endpoint;
        parameters.direction = db::TransferDirection::Upload;
        parameters.payloadLength = std::filesystem::file_size(sealedPath);
        parameters.checksum = sealedChecksum;
        parameters.localPath = sealedPath;

        transfer::SessionResult result{ _dependencies.transferClient.open(parameters, context.stopToken) };
        if (const transfer::TransferSession* session{ std::get_if<transfer::TransferSession>(&result) })
        {
            LOG(DEBUG, "Opened upload session " << session->token << " at " << session->remoteSessionId);
            modifyJob(context, [&](db::Job& job) { job.setPublishSessionToken(session->token.getAsString()); });
        }

        return result;
    }
} // namespace mts::orchestrator
