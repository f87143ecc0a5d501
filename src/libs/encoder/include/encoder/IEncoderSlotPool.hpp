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

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <variant>

#include "core/UUID.hpp"

namespace mts::encoder
{
    using SlotId = std::size_t;

    class IEncoderSlotPool;
    class EncoderSlotPool;

    // Held encoder slot, given back to the pool on release or destruction
    // The pool must outlive its slots
    class Slot
    {
    public:
        ~Slot();
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool isHeld() const { return _pool != nullptr; }
        SlotId getId() const { return _id; }
        const core::UUID& getHolder() const { return _holder; }

        void release();

    private:
        friend class EncoderSlotPool;
        Slot(IEncoderSlotPool& pool, SlotId id, const core::UUID& holder);

        IEncoderSlotPool* _pool{};
        SlotId _id{};
        core::UUID _holder;
    };

    // No slot freed before the timeout, the caller is expected to try again later
    struct Busy
    {
    };
    struct Cancelled
    {
    };
    using AcquireResult = std::variant<Slot, Busy, Cancelled>;

    // Bounded pool of hardware encoding slots, waiters are admitted in FIFO order
    class IEncoderSlotPool
    {
    public:
        virtual ~IEncoderSlotPool() = default;

        virtual AcquireResult acquire(const core::UUID& jobId, std::chrono::milliseconds timeout, std::stop_token stopToken) = 0;
        virtual void release(Slot& slot) = 0;

        virtual std::size_t getCapacity() const = 0;
        virtual std::size_t getHeldCount() const = 0;
        virtual std::size_t getWaiterCount() const = 0;
        virtual std::optional<core::UUID> getHolder(SlotId slotId) const = 0;
    };

    std::unique_ptr<IEncoderSlotPool> createEncoderSlotPool(std::size_t capacity);
} // namespace mts::encoder
