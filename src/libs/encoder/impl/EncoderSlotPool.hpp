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

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "encoder/IEncoderSlotPool.hpp"

namespace mts::encoder
{
    class EncoderSlotPool final : public IEncoderSlotPool
    {
    public:
        EncoderSlotPool(std::size_t capacity);
        ~EncoderSlotPool() override;
        EncoderSlotPool(const EncoderSlotPool&) = delete;
        EncoderSlotPool& operator=(const EncoderSlotPool&) = delete;

    private:
        AcquireResult acquire(const core::UUID& jobId, std::chrono::milliseconds timeout, std::stop_token stopToken) override;
        void release(Slot& slot) override;

        std::size_t getCapacity() const override;
        std::size_t getHeldCount() const override;
        std::size_t getWaiterCount() const override;
        std::optional<core::UUID> getHolder(SlotId slotId) const override;

        bool isHeldBy(const core::UUID& jobId) const;
        SlotId pickFreeSlot() const;

        struct SlotRecord
        {
            std::optional<core::UUID> heldBy;
        };

        mutable std::mutex _mutex;
        std::condition_variable_any _cv;
        std::vector<SlotRecord> _slots;
        std::size_t _heldCount{};
        std::uint64_t _nextTicket{};
        std::deque<std::uint64_t> _waitingTickets; // admission order
    };
} // namespace mts::encoder
