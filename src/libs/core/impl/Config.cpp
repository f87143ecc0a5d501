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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace mts::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw MtsException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw MtsException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw MtsException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    template<typename T>
    T Config::lookupOr(std::string_view setting, T def) const
    {
        T res{ def };

        try
        {
            if (!_config.lookupValue(std::string{ setting }, res))
                res = def;
        }
        catch (const libconfig::ConfigException& e)
        {
            MTS_LOG(MAIN, WARNING, "Cannot read setting '" << setting << "': " << e.what() << ", using default value");
            res = def;
        }

        return res;
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            const libconfig::Setting& value{ _config.lookup(std::string{ setting }) };
            if (value.getType() == libconfig::Setting::TypeString)
                return static_cast<const char*>(value);
        }
        catch (const libconfig::SettingNotFoundException&)
        {
        }

        return def;
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const std::string_view res{ getString(setting, {}) };
        if (res.empty())
            return def;

        return std::filesystem::path{ res };
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        // libconfig has no unsigned type
        const long long value{ lookupOr<long long>(setting, static_cast<long long>(def)) };
        if (value < 0)
            throw MtsException{ "Setting '" + std::string{ setting } + "' must be positive" };

        return static_cast<unsigned long>(value);
    }

    long Config::getLong(std::string_view setting, long def)
    {
        return static_cast<long>(lookupOr<long long>(setting, def));
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookupOr<bool>(setting, def);
    }
} // namespace mts::core
