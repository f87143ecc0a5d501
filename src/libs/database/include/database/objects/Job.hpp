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

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "core/UUID.hpp"
#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/JobId.hpp"

namespace mts::db
{
    class Session;

    class Job final : public Object<Job, JobId>
    {
    public:
        Job() = default;

        // Utility
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, JobId id);
        static pointer find(Session& session, const core::UUID& uuid);
        static void findNonTerminal(Session& session, std::function<void(const pointer&)> visitor); // by creation order
        static std::size_t removeTerminatedBefore(Session& session, const Wt::WDateTime& dateTime);

        // Accessors
        core::UUID getUUID() const;
        JobState getState() const { return _state; }
        double getProgress() const { return _progress; }
        std::size_t getRetryCount() const { return static_cast<std::size_t>(_retryCount); }

        const std::string& getSourceEndpoint() const { return _sourceEndpoint; }
        const std::string& getSourceSessionToken() const { return _sourceSessionToken; }
        const std::string& getSourceChecksum() const { return _sourceChecksum; }
        const std::string& getSourceSealedBy() const { return _sourceSealedBy; }
        const std::string& getPublishEndpoint() const { return _publishEndpoint; }
        const std::string& getPublishSessionToken() const { return _publishSessionToken; }

        const std::string& getCodec() const { return _codec; }
        const std::string& getContainer() const { return _container; }
        unsigned getWidth() const { return static_cast<unsigned>(_width); }
        unsigned getHeight() const { return static_cast<unsigned>(_height); }
        std::size_t getVideoBitrate() const { return static_cast<std::size_t>(_videoBitrate); }
        const std::string& getAudioCodec() const { return _audioCodec; }
        std::size_t getAudioBitrate() const { return static_cast<std::size_t>(_audioBitrate); }
        bool isHardwareAccelerated() const { return _hardwareAcceleration; }
        const std::string& getProfileLabel() const { return _profileLabel; }

        std::optional<ErrorKind> getErrorKind() const { return _errorKind; }
        std::optional<JobState> getErrorStage() const { return _errorStage; }
        const std::string& getErrorDetail() const { return _errorDetail; }

        const std::string& getOutputLocation() const { return _outputLocation; }
        const std::string& getContentHash() const { return _contentHash; }
        std::size_t getEncryptedSize() const { return static_cast<std::size_t>(_encryptedSize); }

        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }

        // Setters
        void setState(JobState state);
        void setProgress(double progress) { _progress = progress; }
        void setRetryCount(std::size_t retryCount) { _retryCount = static_cast<int>(retryCount); }

        void setSource(std::string_view endpoint, std::string_view checksum);
        void setSourceChecksum(std::string_view checksum) { _sourceChecksum = checksum; }
        void setSourceSessionToken(std::string_view token) { _sourceSessionToken = token; }
        void setSourceSealedBy(std::string_view jobUUID) { _sourceSealedBy = jobUUID; }
        void setPublishEndpoint(std::string_view endpoint) { _publishEndpoint = endpoint; }
        void setPublishSessionToken(std::string_view token) { _publishSessionToken = token; }

        void setCodec(std::string_view codec) { _codec = codec; }
        void setContainer(std::string_view container) { _container = container; }
        void setResolution(unsigned width, unsigned height);
        void setVideoBitrate(std::size_t bitrate) { _videoBitrate = static_cast<long long>(bitrate); }
        void setAudioCodec(std::string_view codec) { _audioCodec = codec; }
        void setAudioBitrate(std::size_t bitrate) { _audioBitrate = static_cast<long long>(bitrate); }
        void setHardwareAcceleration(bool enable) { _hardwareAcceleration = enable; }
        void setProfileLabel(std::string_view label) { _profileLabel = label; }

        void setError(ErrorKind kind, JobState stage, std::string_view detail);
        void setResult(std::string_view outputLocation, std::string_view contentHash, std::size_t encryptedSize);
        void setOutputLocation(std::string_view outputLocation) { _outputLocation = outputLocation; }

        void touch();

        template<class Action>
        void persist(Action& a)
        {
            Wt::Dbo::field(a, _uuid, "uuid");
            Wt::Dbo::field(a, _state, "state");
            Wt::Dbo::field(a, _progress, "progress");
            Wt::Dbo::field(a, _retryCount, "retry_count");

            Wt::Dbo::field(a, _sourceEndpoint, "source_endpoint");
            Wt::Dbo::field(a, _sourceSessionToken, "source_session_token");
            Wt::Dbo::field(a, _sourceChecksum, "source_checksum");
            Wt::Dbo::field(a, _sourceSealedBy, "source_sealed_by");
            Wt::Dbo::field(a, _publishEndpoint, "publish_endpoint");
            Wt::Dbo::field(a, _publishSessionToken, "publish_session_token");

            Wt::Dbo::field(a, _codec, "codec");
            Wt::Dbo::field(a, _container, "container");
            Wt::Dbo::field(a, _width, "width");
            Wt::Dbo::field(a, _height, "height");
            Wt::Dbo::field(a, _videoBitrate, "video_bitrate");
            Wt::Dbo::field(a, _audioCodec, "audio_codec");
            Wt::Dbo::field(a, _audioBitrate, "audio_bitrate");
            Wt::Dbo::field(a, _hardwareAcceleration, "hardware_acceleration");
            Wt::Dbo::field(a, _profileLabel, "profile_label");

            Wt::Dbo::field(a, _errorKind, "error_kind");
            Wt::Dbo::field(a, _errorStage, "error_stage");
            Wt::Dbo::field(a, _errorDetail, "error_detail");

            Wt::Dbo::field(a, _outputLocation, "output_location");
            Wt::Dbo::field(a, _contentHash, "content_hash");
            Wt::Dbo::field(a, _encryptedSize, "encrypted_size");

            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");
        }

    private:
        friend class Session;
        Job(const core::UUID& uuid);
        static pointer create(Session& session, const core::UUID& uuid);

        std::string _uuid;
        JobState _state{ JobState::Queued };
        double _progress{};
        int _retryCount{};

        std::string _sourceEndpoint;
        std::string _sourceSessionToken;
        std::string _sourceChecksum;
        std::string _sourceSealedBy; // uuid of the job whose key sealed the source, empty if plain
        std::string _publishEndpoint;
        std::string _publishSessionToken;

        std::string _codec;
        std::string _container;
        int _width{};
        int _height{};
        long long _videoBitrate{};
        std::string _audioCodec;
        long long _audioBitrate{};
        bool _hardwareAcceleration{};
        std::string _profileLabel;

        std::optional<ErrorKind> _errorKind;
        std::optional<JobState> _errorStage;
        std::string _errorDetail;

        std::string _outputLocation;
        std::string _contentHash;
        long long _encryptedSize{};

        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;
    };
} // namespace mts::db
