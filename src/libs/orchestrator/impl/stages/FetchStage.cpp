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

#include "FetchStage.hpp"

#include <system_error>

#include "core/ILogger.hpp"
#include "crypto/ICryptoPipeline.hpp"
#include "crypto/Sha256Hasher.hpp"
#include "crypto/Types.hpp"

#include "JobFiles.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[job " << context.jobId << "] [Fetch] - " << message)

namespace mts::orchestrator
{
    namespace
    {
        struct SourceInfo
        {
            std::string endpoint;
            std::string checksum;
            std::optional<core::UUID> sessionToken;
        };

        void removeFile(const JobContext& context, const std::filesystem::path& path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
                LOG(WARNING, "Cannot remove " << path << ": " << ec.message());
        }
    } // namespace

    FetchStage::FetchStage(const InitParams& initParams)
        : JobStageBase{ initParams }
    {
    }

    StageOutcome FetchStage::process(JobContext& context)
    {
        const std::optional<core::UUID> sealedBy{ visitJob(context, [](const db::Job& job) { return core::UUID::fromString(job.getSourceSealedBy()); }) };
        const std::filesystem::path downloadPath{ sealedBy ? getSealedSourcePath(_config, context.jobId) : getSourcePath(_config, context.jobId) };

        std::optional<transfer::TransferSession> session;
        const StageOutcome outcome{ runTransferAttempts(context, "Download", [&]() -> transfer::TransferOutcome {
            transfer::SessionResult result{ openOrResumeSession(context, downloadPath) };
            if (std::holds_alternative<transfer::TransferCancelled>(result))
                return transfer::TransferCancelled{};
            if (transfer::TransferError* error{ std::get_if<transfer::TransferError>(&result) })
                return std::move(*error);

            session = std::move(std::get<transfer::TransferSession>(result));
            return _dependencies.transferClient.download(*session, context.stopToken, [&](std::size_t offset, std::size_t totalLength) {
                if (totalLength > 0)
                    reportProgress(context, static_cast<float>(offset) / static_cast<float>(totalLength));
            });
        }) };

        if (!std::holds_alternative<StageCompleted>(outcome))
            return outcome;

        return onDownloadCompleted(context, *session, downloadPath, sealedBy);
    }

    transfer::SessionResult FetchStage::openOrResumeSession(JobContext& context, const std::filesystem::path& downloadPath)
    {
        const SourceInfo source{ visitJob(context, [](const db::Job& job) {
            return SourceInfo{ job.getSourceEndpoint(), job.getSourceChecksum(), core::UUID::fromString(job.getSourceSessionToken()) };
        }) };

        if (source.sessionToken)
        {
            transfer::SessionResult result{ _dependencies.transferClient.resume(*source.sessionToken, context.stopToken) };
            if (std::holds_alternative<transfer::TransferCancelled>(result))
                return result;

            const transfer::TransferError* error{ std::get_if<transfer::TransferError>(&result) };
            if (!error)
            {
                const transfer::TransferSession& session{ std::get<transfer::TransferSession>(result) };
                if (session.direction != db::TransferDirection::Download)
                    return transfer::TransferError{ transfer::TransferErrorType::ClientError, "Source session " + std::string{ session.token.getAsString() } + " is not a download" };

                LOG(DEBUG, "Resumed download session " << session.token << " at offset " << session.offset << "/" << session.totalLength);
                return result;
            }

            if (error->type != transfer::TransferErrorType::SessionNotFound)
                return result;

            LOG(WARNING, "Download session " << *source.sessionToken << " not found, starting over");
        }

        transfer::OpenParameters parameters;
        parameters.endpoint = source.endpoint;
        parameters.direction = db::TransferDirection::Download;
        parameters.checksum = source.checksum;
        parameters.localPath = downloadPath;

        transfer::SessionResult result{ _dependencies.transferClient.open(parameters, context.stopToken) };
        if (const transfer::TransferSession* session{ std::get_if<transfer::TransferSession>(&result) })
        {
            LOG(DEBUG, "Opened download session " << session->token << ", " << session->totalLength << " bytes");
            modifyJob(context, [&](db::Job& job) { job.setSourceSessionToken(session->token.getAsString()); });
        }

        return result;
    }

    StageOutcome FetchStage::onDownloadCompleted(JobContext& context, const transfer::TransferSession& session, const std::filesystem::path& downloadPath, const std::optional<core::UUID>& sealedBy)
    {
        // session given by the submitter
        if (session.localPath != downloadPath)
        {
            LOG(DEBUG, "Moving " << session.localPath << " to " << downloadPath);
            moveFile(session.localPath, downloadPath);
        }

        std::string checksum{ session.checksum };
        if (sealedBy)
        {
            // outputs are identified by the plaintext
            const StageOutcome outcome{ openSealedSource(context, downloadPath, *sealedBy, checksum) };
            if (!std::holds_alternative<StageCompleted>(outcome))
                return outcome;
        }
        else if (checksum.empty())
        {
            // needed to identify the transcoded outputs
            try
            {
                checksum = crypto::Sha256Hasher::computeFileAsHex(downloadPath);
            }
            catch (const crypto::CryptoException& e)
            {
                return StageFailed{ db::ErrorKind::FatalInput, std::string{ "Cannot hash source: " } + e.what() };
            }
        }

        modifyJob(context, [&](db::Job& job) {
            job.setSourceChecksum(checksum);
            job.setSourceSessionToken("");
        });
        _dependencies.transferClient.discard(session);

        // kept until now so that an interrupted stage can open it again
        if (sealedBy)
            removeFile(context, downloadPath);

        LOG(INFO, "Source fetched, " << session.totalLength << " bytes, checksum " << checksum);
        reportProgress(context, 1.f);

        return StageCompleted{};
    }

    StageOutcome FetchStage::openSealedSource(JobContext& context, const std::filesystem::path& sealedSourcePath, const core::UUID& sealedBy, std::string& contentHash)
    {
        const std::filesystem::path sourcePath{ getSourcePath(_config, context.jobId) };
        LOG(DEBUG, "Opening sealed source using the key of job " << sealedBy);

        crypto::OpenResult result;
        try
        {
            result = _dependencies.cryptoPipeline.openFile(sealedSourcePath, sourcePath, sealedBy);
        }
        catch (const crypto::CryptoException& e)
        {
            removeFile(context, sourcePath);
            return StageFailed{ db::ErrorKind::FatalInput, std::string{ "Cannot open sealed source: " } + e.what() };
        }

        if (const crypto::OpenError* error{ std::get_if<crypto::OpenError>(&result) })
        {
            // never leave unauthenticated content behind
            removeFile(context, sourcePath);
            return StageFailed{ db::ErrorKind::FatalInput, "Cannot open sealed source: " + std::string{ crypto::toString(*error) } };
        }

        const crypto::OpenSuccess& success{ std::get<crypto::OpenSuccess>(result) };
        LOG(DEBUG, "Sealed source opened, " << success.plaintextSize << " bytes");
        contentHash = success.contentHash;

        return StageCompleted{};
    }
} // namespace mts::orchestrator
