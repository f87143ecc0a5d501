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

#include "Common.hpp"

#include <fstream>

#include "core/Exception.hpp"
#include "core/UUID.hpp"
#include "database/Session.hpp"

namespace mts::transfer::tests
{
    ScopedTmpDirectory::ScopedTmpDirectory()
        : _path{ std::filesystem::temp_directory_path() / ("mts-test-" + std::string{ core::UUID::generate().getAsString() }) }
    {
        std::filesystem::create_directories(_path);
    }

    ScopedTmpDirectory::~ScopedTmpDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    void writeFile(const std::filesystem::path& path, std::string_view content)
    {
        std::ofstream ofs{ path, std::ios::binary | std::ios::trunc };
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs)
            throw core::MtsException{ "Cannot write '" + path.string() + "'" };
    }

    std::string readFile(const std::filesystem::path& path)
    {
        std::ifstream ifs{ path, std::ios::binary };
        if (!ifs)
            throw core::MtsException{ "Cannot read '" + path.string() + "'" };

        return std::string{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
    }

    TransferFixture::TransferFixture()
        : _db{ db::createDb(_tmpDir.getPath() / "mts.db", 2) }
    {
        {
            db::Session& session{ _db->getTLSSession() };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        _store = createTransferSessionStore(*_db);

        _config.chunkSize = chunkSize;
        _config.retryPolicy.maxAttempts = 5;
        _config.retryPolicy.baseDelay = std::chrono::milliseconds{ 1 };
        _config.retryPolicy.maxDelay = std::chrono::milliseconds{ 4 };
    }

    std::unique_ptr<IResumableTransferClient> TransferFixture::createClient()
    {
        return createResumableTransferClient(_remote, *_store, _config);
    }
} // namespace mts::transfer::tests
