///////////////////////////////////////////////////////////////////////////////
// FILE:          ThreadPool.cpp
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

#include "ThreadPool.h"

#include "CoreUtils.h"
#include "Error.h"
#include "Task.h"

#include <algorithm>
#include <utility>

ThreadPool::ThreadPool(size_t threadCount, size_t queueCapacity)
    : queue_(std::max<size_t>(1, queueCapacity))
{
    threadCount = std::max<size_t>(1, threadCount);
    for (size_t n = 0; n < threadCount; ++n)
    {
        auto thread = std::make_unique<std::thread>(&ThreadPool::ThreadFunc, this);
        threads_.push_back(std::move(thread));
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> lock(mx_);
        stopFlag_ = true;
    }
    cv_.notify_all();

    for (const auto& thread : threads_)
        thread->join();
}

size_t ThreadPool::GetSize() const
{
    return threads_.size();
}

size_t ThreadPool::GetQueueCapacity() const
{
    return queue_.capacity();
}

void ThreadPool::Execute(std::unique_ptr<Task> task)
{
    if (!task)
        throw CLSAError("Null task submitted to thread pool", LSAERR_NullPointer);
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (queue_.full())
            throw CLSAError("Task queue is full (capacity " +
                    ToString(queue_.capacity()) + ")", LSAERR_SaveQueueFull);
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::WaitIdle()
{
    std::unique_lock<std::mutex> lock(mx_);
    idleCv_.wait(lock, [&]() { return queue_.empty() && runningCount_ == 0; });
}

void ThreadPool::ThreadFunc()
{
    for (;;)
    {
        std::unique_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(mx_);
            cv_.wait(lock, [&]() { return stopFlag_ || !queue_.empty(); });
            if (queue_.empty())
                break;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++runningCount_;
        }
        task->Execute();
        task.reset();
        {
            std::lock_guard<std::mutex> lock(mx_);
            --runningCount_;
        }
        idleCv_.notify_all();
    }
}
