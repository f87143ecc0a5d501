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

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "database/IDb.hpp"
#include "transfer/IResumableTransferClient.hpp"
#include "transfer/ITransferSessionStore.hpp"
#include "transfer/Types.hpp"

#include "FakeRemote.hpp"

namespace mts::transfer::tests
{
    class ScopedTmpDirectory final
    {
    public:
        ScopedTmpDirectory();
        ~ScopedTmpDirectory();
        ScopedTmpDirectory(const ScopedTmpDirectory&) = delete;
        ScopedTmpDirectory& operator=(const ScopedTmpDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        const std::filesystem::path _path;
    };

    void writeFile(const std::filesystem::path& path, std::string_view content);
    std::string readFile(const std::filesystem::path& path);

    class TransferFixture : public ::testing::Test
    {
    protected:
        TransferFixture();

        std::unique_ptr<IResumableTransferClient> createClient();
        std::filesystem::path getPath(std::string_view fileName) const { return _tmpDir.getPath() / fileName; }

        static constexpr std::size_t chunkSize{ minChunkSize };

        ScopedTmpDirectory _tmpDir;
        std::unique_ptr<db::IDb> _db;
        std::unique_ptr<ITransferSessionStore> _store;
        FakeRemote _remote;
        TransferClientConfig _config;
    };
} // namespace mts::transfer::tests
