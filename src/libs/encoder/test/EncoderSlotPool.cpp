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

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "encoder/IEncoderSlotPool.hpp"

namespace mts::encoder::tests
{
    namespace
    {
        constexpr std::chrono::milliseconds shortTimeout{ 20 };
        constexpr std::chrono::milliseconds longTimeout{ 30'000 };

        void waitForWaiters(const IEncoderSlotPool& pool, std::size_t count)
        {
            while (pool.getWaiterCount() != count)
                std::this_thread::sleep_for(std::chrono::milliseconds{ 1 });
        }

        Slot acquireSlot(IEncoderSlotPool& pool, const core::UUID& jobId)
        {
            AcquireResult result{ pool.acquire(jobId, longTimeout, std::stop_token{}) };
            if (!std::holds_alternative<Slot>(result))
                throw core::MtsException{ "No slot" };

            return std::move(std::get<Slot>(result));
        }
    } // namespace

    TEST(EncoderSlotPool, invalidCapacity)
    {
        EXPECT_THROW(createEncoderSlotPool(0), core::MtsException);
    }

    TEST(EncoderSlotPool, acquireRelease)
    {
        auto pool{ createEncoderSlotPool(2) };
        EXPECT_EQ(pool->getCapacity(), 2);
        EXPECT_EQ(pool->getHeldCount(), 0);

        const core::UUID job1{ core::UUID::generate() };
        const core::UUID job2{ core::UUID::generate() };
        {
            Slot slot1{ acquireSlot(*pool, job1) };
            Slot slot2{ acquireSlot(*pool, job2) };
            EXPECT_TRUE(slot1.isHeld());
            EXPECT_NE(slot1.getId(), slot2.getId());
            EXPECT_EQ(slot1.getHolder(), job1);
            EXPECT_EQ(pool->getHolder(slot1.getId()), job1);
            EXPECT_EQ(pool->getHolder(slot2.getId()), job2);
            EXPECT_EQ(pool->getHeldCount(), 2);

            slot1.release();
            EXPECT_FALSE(slot1.isHeld());
            EXPECT_EQ(pool->getHeldCount(), 1);
            EXPECT_FALSE(pool->getHolder(slot1.getId()));

            // released only once
            slot1.release();
            EXPECT_EQ(pool->getHeldCount(), 1);
        }
        EXPECT_EQ(pool->getHeldCount(), 0);
    }

    TEST(EncoderSlotPool, moveSlot)
    {
        auto pool{ createEncoderSlotPool(1) };

        Slot slot{ acquireSlot(*pool, core::UUID::generate()) };
        Slot movedSlot{ std::move(slot) };
        EXPECT_FALSE(slot.isHeld());
        EXPECT_TRUE(movedSlot.isHeld());
        EXPECT_EQ(pool->getHeldCount(), 1);

        Slot otherSlot{ std::move(movedSlot) };
        movedSlot = std::move(otherSlot);
        EXPECT_TRUE(movedSlot.isHeld());
        EXPECT_EQ(pool->getHeldCount(), 1);

        movedSlot.release();
        EXPECT_EQ(pool->getHeldCount(), 0);
    }

    TEST(EncoderSlotPool, busy)
    {
        auto pool{ createEncoderSlotPool(1) };

        Slot slot{ acquireSlot(*pool, core::UUID::generate()) };
        AcquireResult result{ pool->acquire(core::UUID::generate(), shortTimeout, std::stop_token{}) };
        EXPECT_TRUE(std::holds_alternative<Busy>(result));
        EXPECT_EQ(pool->getWaiterCount(), 0);

        slot.release();
        result = pool->acquire(core::UUID::generate(), shortTimeout, std::stop_token{});
        EXPECT_TRUE(std::holds_alternative<Slot>(result));
    }

    TEST(EncoderSlotPool, alreadyHeld)
    {
        auto pool{ createEncoderSlotPool(2) };

        const core::UUID jobId{ core::UUID::generate() };
        Slot slot{ acquireSlot(*pool, jobId) };
        EXPECT_THROW(pool->acquire(jobId, shortTimeout, std::stop_token{}), core::MtsException);
    }

    TEST(EncoderSlotPool, cancelWait)
    {
        auto pool{ createEncoderSlotPool(1) };
        Slot slot{ acquireSlot(*pool, core::UUID::generate()) };

        std::stop_source stopSource;
        std::optional<AcquireResult> result;
        std::thread waiter{ [&] { result.emplace(pool->acquire(core::UUID::generate(), longTimeout, stopSource.get_token())); } };

        waitForWaiters(*pool, 1);
        stopSource.request_stop();
        waiter.join();

        ASSERT_TRUE(result);
        EXPECT_TRUE(std::holds_alternative<Cancelled>(*result));
        EXPECT_EQ(pool->getWaiterCount(), 0);
        EXPECT_EQ(pool->getHeldCount(), 1);
    }

    // all slots held: the waiter proceeds once a slot frees
    TEST(EncoderSlotPool, waitForFreeSlot)
    {
        auto pool{ createEncoderSlotPool(2) };
        Slot slot1{ acquireSlot(*pool, core::UUID::generate()) };
        Slot slot2{ acquireSlot(*pool, core::UUID::generate()) };

        const core::UUID waitingJob{ core::UUID::generate() };
        std::optional<AcquireResult> result;
        std::thread waiter{ [&] { result.emplace(pool->acquire(waitingJob, longTimeout, std::stop_token{})); } };

        waitForWaiters(*pool, 1);
        EXPECT_EQ(pool->getHeldCount(), 2);
        const SlotId freedSlotId{ slot2.getId() };
        slot2.release();
        waiter.join();

        ASSERT_TRUE(result);
        ASSERT_TRUE(std::holds_alternative<Slot>(*result));
        EXPECT_EQ(std::get<Slot>(*result).getId(), freedSlotId);
        EXPECT_EQ(pool->getHolder(freedSlotId), waitingJob);
    }

    TEST(EncoderSlotPool, fifoAdmission)
    {
        auto pool{ createEncoderSlotPool(1) };
        Slot slot{ acquireSlot(*pool, core::UUID::generate()) };

        constexpr std::size_t waiterCount{ 5 };
        std::mutex admittedMutex;
        std::vector<std::size_t> admitted;

        std::vector<std::thread> waiters;
        for (std::size_t i{}; i < waiterCount; ++i)
        {
            waiters.emplace_back([&, i] {
                Slot waiterSlot{ acquireSlot(*pool, core::UUID::generate()) };
                const std::scoped_lock lock{ admittedMutex };
                admitted.push_back(i);
            });
            waitForWaiters(*pool, i + 1);
        }

        slot.release();
        for (std::thread& waiter : waiters)
            waiter.join();

        EXPECT_EQ(admitted, (std::vector<std::size_t>{ 0, 1, 2, 3, 4 }));
        EXPECT_EQ(pool->getHeldCount(), 0);
    }

    TEST(EncoderSlotPool, timedOutWaiterDoesNotBlockQueue)
    {
        auto pool{ createEncoderSlotPool(1) };
        Slot slot{ acquireSlot(*pool, core::UUID::generate()) };

        std::optional<AcquireResult> firstResult;
        std::thread firstWaiter{ [&] { firstResult.emplace(pool->acquire(core::UUID::generate(), std::chrono::milliseconds{ 100 }, std::stop_token{})); } };
        waitForWaiters(*pool, 1);

        std::optional<AcquireResult> secondResult;
        std::thread secondWaiter{ [&] { secondResult.emplace(pool->acquire(core::UUID::generate(), longTimeout, std::stop_token{})); } };

        firstWaiter.join();
        ASSERT_TRUE(firstResult);
        EXPECT_TRUE(std::holds_alternative<Busy>(*firstResult));

        slot.release();
        secondWaiter.join();
        ASSERT_TRUE(secondResult);
        EXPECT_TRUE(std::holds_alternative<Slot>(*secondResult));
    }

    TEST(EncoderSlotPool, capacityNeverExceeded)
    {
        constexpr std::size_t capacity{ 3 };
        auto pool{ createEncoderSlotPool(capacity) };

        std::atomic<std::size_t> concurrentHolders{};
        std::atomic<std::size_t> maxConcurrentHolders{};
        std::atomic<std::size_t> acquisitions{};

        std::vector<std::thread> workers;
        for (std::size_t i{}; i < 16; ++i)
        {
            workers.emplace_back([&] {
                for (std::size_t j{}; j < 50; ++j)
                {
                    Slot slot{ acquireSlot(*pool, core::UUID::generate()) };
                    const std::size_t holders{ ++concurrentHolders };

                    std::size_t currentMax{ maxConcurrentHolders.load() };
                    while (holders > currentMax && !maxConcurrentHolders.compare_exchange_weak(currentMax, holders))
                        ;

                    EXPECT_LE(pool->getHeldCount(), capacity);
                    std::this_thread::yield();
                    --concurrentHolders;
                    acquisitions++;
                }
            });
        }

        for (std::thread& worker : workers)
            worker.join();

        EXPECT_LE(maxConcurrentHolders.load(), capacity);
        EXPECT_EQ(acquisitions.load(), 16 * 50);
        EXPECT_EQ(pool->getHeldCount(), 0);
        EXPECT_EQ(pool->getWaiterCount(), 0);
    }
} // namespace mts::encoder::tests
