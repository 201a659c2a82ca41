///////////////////////////////////////////////////////////////////////////////
// FILE:          ThreadPool.h
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   A class executing queued tasks on separate threads, with a
//                bounded queue.
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include <boost/circular_buffer.hpp>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class Task;

class ThreadPool final
{
public:
    // With a single thread, tasks run in submission order.
    explicit ThreadPool(size_t threadCount, size_t queueCapacity);
    // Runs all queued tasks before joining the threads.
    ~ThreadPool();

    size_t GetSize() const;
    size_t GetQueueCapacity() const;

    // Throws CLSAError if the queue is full.
    void Execute(std::unique_ptr<Task> task);

    // Blocks until the queue is empty and no task is running.
    void WaitIdle();

private:
    void ThreadFunc();

private:
    std::vector<std::unique_ptr<std::thread>> threads_{};
    bool stopFlag_{ false };
    size_t runningCount_{ 0 };
    std::mutex mx_{};
    std::condition_variable cv_{};
    std::condition_variable idleCv_{};
    boost::circular_buffer<std::unique_ptr<Task>> queue_;
};
