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

#include "EncryptStage.hpp"

#include "core/ILogger.hpp"
#include "crypto/ICryptoPipeline.hpp"
#include "crypto/Types.hpp"

#include "JobFiles.hpp"

#define LOG(sev, message) MTS_LOG(ORCHESTRATOR, sev, "[job " << context.jobId << "] [Encrypt] - " << message)

namespace mts::orchestrator
{
    EncryptStage::EncryptStage(const InitParams& initParams)
        : JobStageBase{ initParams }
    {
    }

    StageOutcome EncryptStage::process(JobContext& context)
    {
        const std::optional<std::filesystem::path> outputPath{ visitJob(context, [this](const db::Job& job) { return getOutputPath(_config, job); }) };
        if (!outputPath || !std::filesystem::exists(*outputPath))
            return StageFailed{ db::ErrorKind::FatalInput, "Transcoded output is missing" };

        const std::filesystem::path sealedPath{ getSealedPath(_config, context.jobId) };

        crypto::SealResult sealResult;
        try
        {
            sealResult = _dependencies.cryptoPipeline.sealFile(*outputPath, sealedPath, context.jobId);
        }
        catch (const crypto::CryptoException& e)
        {
            return StageFailed{ db::ErrorKind::FatalInput, std::string{ "Encryption failed: " } + e.what() };
        }
        LOG(DEBUG, "Sealed " << *outputPath << " into " << sealedPath << ", " << sealResult.encryptedSize << " bytes");
        reportProgress(context, 0.5f);

        if (context.stopToken.stop_requested())
            return StageCancelled{};

        crypto::OpenResult openResult;
        try
        {
            openResult = _dependencies.cryptoPipeline.openFile(sealedPath, std::nullopt, context.jobId);
        }
        catch (const crypto::CryptoException& e)
        {
            return StageFailed{ db::ErrorKind::FatalInput, std::string{ "Verification failed: " } + e.what() };
        }

        if (const crypto::OpenError* error{ std::get_if<crypto::OpenError>(&openResult) })
            return StageFailed{ db::ErrorKind::FatalInput, "Verification failed: " + std::string{ crypto::toString(*error) } };

        const crypto::OpenSuccess& openSuccess{ std::get<crypto::OpenSuccess>(openResult) };
        if (openSuccess.contentHash != sealResult.contentHash)
            return StageFailed{ db::ErrorKind::FatalInput, "Verification failed: content hash mismatch" };

        modifyJob(context, [&](db::Job& job) { job.setResult("", sealResult.contentHash, sealResult.encryptedSize); });

        LOG(INFO, "Output sealed, content hash " << sealResult.contentHash);
        reportProgress(context, 1.f);

        return StageCompleted{};
    }
} // namespace mts::orchestrator
