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

#include "EncoderSlotPool.hpp"

#include <algorithm>
#include <utility>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

#define LOG(sev, message) MTS_LOG(ENCODER, sev, "[Encoder slot pool] - " << message)

namespace mts::encoder
{
    Slot::Slot(IEncoderSlotPool& pool, SlotId id, const core::UUID& holder)
        : _pool{ &pool }
        , _id{ id }
        , _holder{ holder }
    {
    }

    Slot::~Slot()
    {
        release();
    }

    Slot::Slot(Slot&& other) noexcept
        : _pool{ std::exchange(other._pool, nullptr) }
        , _id{ other._id }
        , _holder{ other._holder }
    {
    }

    Slot& Slot::operator=(Slot&& other) noexcept
    {
        if (this != &other)
        {
            release();
            _pool = std::exchange(other._pool, nullptr);
            _id = other._id;
            _holder = other._holder;
        }

        return *this;
    }

    void Slot::release()
    {
        if (_pool)
            _pool->release(*this);
    }

    std::unique_ptr<IEncoderSlotPool> createEncoderSlotPool(std::size_t capacity)
    {
        return std::make_unique<EncoderSlotPool>(capacity);
    }

    EncoderSlotPool::EncoderSlotPool(std::size_t capacity)
        : _slots(capacity)
    {
        if (capacity == 0)
            throw core::MtsException{ "Encoder slot capacity must not be null" };

        LOG(INFO, "Started with " << capacity << " slot(s)");
    }

    EncoderSlotPool::~EncoderSlotPool()
    {
        if (_heldCount > 0)
            LOG(ERROR, "Destroyed while " << _heldCount << " slot(s) are still held");
    }

    AcquireResult EncoderSlotPool::acquire(const core::UUID& jobId, std::chrono::milliseconds timeout, std::stop_token stopToken)
    {
        std::unique_lock lock{ _mutex };

        if (isHeldBy(jobId))
            throw core::MtsException{ "Job " + std::string{ jobId.getAsString() } + " already holds an encoder slot" };

        const std::uint64_t ticket{ _nextTicket++ };
        _waitingTickets.push_back(ticket);

        const bool admitted{ _cv.wait_for(lock, stopToken, timeout, [&] {
            return _waitingTickets.front() == ticket && _heldCount < _slots.size();
        }) };

        if (!admitted)
        {
            _waitingTickets.erase(std::find(std::cbegin(_waitingTickets), std::cend(_waitingTickets), ticket));
            // the next waiter may now be first in line
            _cv.notify_all();

            if (stopToken.stop_requested())
            {
                LOG(DEBUG, "Job " << jobId << ": slot wait cancelled");
                return Cancelled{};
            }

            LOG(DEBUG, "Job " << jobId << ": no slot freed within " << timeout.count() << " ms");
            return Busy{};
        }

        _waitingTickets.pop_front();

        const SlotId slotId{ pickFreeSlot() };
        _slots[slotId].heldBy = jobId;
        _heldCount++;

        LOG(DEBUG, "Job " << jobId << ": acquired slot " << slotId << " (" << _heldCount << "/" << _slots.size() << " held)");

        // capacity may remain for the next waiter
        _cv.notify_all();

        return Slot{ *this, slotId, jobId };
    }

    void EncoderSlotPool::release(Slot& slot)
    {
        if (!slot.isHeld())
            return;

        {
            const std::scoped_lock lock{ _mutex };

            SlotRecord& record{ _slots.at(slot.getId()) };
            if (record.heldBy != slot.getHolder())
            {
                LOG(ERROR, "Slot " << slot.getId() << " is not held by job " << slot.getHolder());
            }
            else
            {
                record.heldBy.reset();
                _heldCount--;
                LOG(DEBUG, "Job " << slot.getHolder() << ": released slot " << slot.getId() << " (" << _heldCount << "/" << _slots.size() << " held)");
            }

            slot._pool = nullptr;
        }

        _cv.notify_all();
    }

    std::size_t EncoderSlotPool::getCapacity() const
    {
        return _slots.size();
    }

    std::size_t EncoderSlotPool::getHeldCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _heldCount;
    }

    std::size_t EncoderSlotPool::getWaiterCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _waitingTickets.size();
    }

    std::optional<core::UUID> EncoderSlotPool::getHolder(SlotId slotId) const
    {
        const std::scoped_lock lock{ _mutex };
        return _slots.at(slotId).heldBy;
    }

    bool EncoderSlotPool::isHeldBy(const core::UUID& jobId) const
    {
        return std::any_of(std::cbegin(_slots), std::cend(_slots), [&](const SlotRecord& record) { return record.heldBy == jobId; });
    }

    SlotId EncoderSlotPool::pickFreeSlot() const
    {
        auto it{ std::find_if(std::cbegin(_slots), std::cend(_slots), [](const SlotRecord& record) { return !record.heldBy; }) };
        if (it == std::cend(_slots))
            throw core::MtsException{ "No free encoder slot" };

        return static_cast<SlotId>(std::distance(std::cbegin(_slots), it));
    }
} // namespace mts::encoder
