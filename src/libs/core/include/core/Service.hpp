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

#include <cassert>
#include <memory>

namespace mts::core
{
    // Process-wide access point to a single instance of an interface
    // The owning Service object controls the lifetime: the instance is destroyed with it
    // Tag allows several instances of the same interface to coexist
    template<typename Interface, typename Tag = Interface>
    class Service
    {
    public:
        Service() = default;
        explicit Service(std::unique_ptr<Interface> instance)
        {
            assign(std::move(instance));
        }

        ~Service()
        {
            _instance.reset();
        }

        Service(const Service&) = delete;
        Service(Service&&) = delete;
        Service& operator=(const Service&) = delete;
        Service& operator=(Service&&) = delete;

        Interface* operator->() const { return get(); }
        Interface& operator*() const { return *get(); }

        static Interface* get() { return _instance.get(); }
        static bool exists() { return static_cast<bool>(_instance); }

        template<typename Impl>
        static Interface& assign(std::unique_ptr<Impl> instance)
        {
            assert(!_instance);
            _instance = std::move(instance);
            return *_instance;
        }

    private:
        static inline std::unique_ptr<Interface> _instance;
    };
} // namespace mts::core
