///////////////////////////////////////////////////////////////////////////////
// FILE:          Semaphore.cpp
// PROJECT:       LSAcq
// SUBSYSTEM:     LSACore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Synchronization primitive with counter.
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

#include "Semaphore.h"

Semaphore::Semaphore()
{
}

Semaphore::Semaphore(size_t initCount)
    : count_(initCount)
{
}

void Semaphore::Wait(size_t count)
{
    std::unique_lock<std::mutex> lock(mx_);
    cv_.wait(lock, [&]() { return count_ >= count; });
    count_ -= count;
}

bool Semaphore::TryWait(size_t count)
{
    std::lock_guard<std::mutex> lock(mx_);
    if (count_ < count)
        return false;
    count_ -= count;
    return true;
}

void Semaphore::Release(size_t count)
{
    {
        std::lock_guard<std::mutex> lock(mx_);
        count_ += count;
    }
    cv_.notify_all();
}

size_t Semaphore::GetCount() const
{
    std::lock_guard<std::mutex> lock(mx_);
    return count_;
}
