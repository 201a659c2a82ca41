#include <catch2/catch_all.hpp>

#include "Error.h"
#include "Semaphore.h"
#include "Task.h"
#include "ThreadPool.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace {

class RecordingTask : public Task
{
   int id_;
   std::mutex& mutex_;
   std::vector<int>& order_;

public:
   RecordingTask(int id, std::mutex& mutex, std::vector<int>& order) :
      id_(id), mutex_(mutex), order_(order)
   {}

   void Execute() override
   {
      std::lock_guard<std::mutex> lock(mutex_);
      order_.push_back(id_);
   }
};

class BlockingTask : public Task
{
   Semaphore& started_;
   Semaphore& release_;

public:
   BlockingTask(Semaphore& started, Semaphore& release) :
      started_(started), release_(release)
   {}

   void Execute() override
   {
      started_.Release();
      release_.Wait();
   }
};

class CountingTask : public Task
{
   std::atomic<int>& count_;

public:
   explicit CountingTask(std::atomic<int>& count) : count_(count) {}
   void Execute() override { ++count_; }
};

} // anonymous namespace


TEST_CASE("semaphore counts", "[Semaphore]")
{
   Semaphore sem(2);
   CHECK(sem.GetCount() == 2);
   CHECK(sem.TryWait());
   CHECK(sem.TryWait());
   CHECK_FALSE(sem.TryWait());
   sem.Release(3);
   CHECK(sem.GetCount() == 3);
   sem.Wait(3);
   CHECK(sem.GetCount() == 0);
   CHECK_FALSE(sem.TryWait(1));
}


TEST_CASE("single thread pool runs tasks in submission order", "[ThreadPool]")
{
   std::mutex mutex;
   std::vector<int> order;
   {
      ThreadPool pool(1, 64);
      CHECK(pool.GetSize() == 1);
      CHECK(pool.GetQueueCapacity() == 64);
      for (int i = 0; i < 50; ++i)
         pool.Execute(std::make_unique<RecordingTask>(i, mutex, order));
      pool.WaitIdle();
      CHECK(order.size() == 50);
   }
   for (int i = 0; i < 50; ++i)
      CHECK(order[i] == i);
}


TEST_CASE("destructor drains queued tasks", "[ThreadPool]")
{
   std::atomic<int> count{ 0 };
   {
      ThreadPool pool(2, 32);
      for (int i = 0; i < 32; ++i)
         pool.Execute(std::make_unique<CountingTask>(count));
   }
   CHECK(count == 32);
}


TEST_CASE("full queue rejects task", "[ThreadPool]")
{
   Semaphore started;
   Semaphore release;
   std::atomic<int> count{ 0 };

   ThreadPool pool(1, 2);
   pool.Execute(std::make_unique<BlockingTask>(started, release));
   started.Wait();

   pool.Execute(std::make_unique<CountingTask>(count));
   pool.Execute(std::make_unique<CountingTask>(count));
   try
   {
      pool.Execute(std::make_unique<CountingTask>(count));
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_SaveQueueFull);
   }

   release.Release();
   pool.WaitIdle();
   CHECK(count == 2);
}


TEST_CASE("null task is rejected", "[ThreadPool]")
{
   ThreadPool pool(1, 1);
   try
   {
      pool.Execute(std::unique_ptr<Task>());
      FAIL("expected CLSAError");
   }
   catch (const CLSAError& e)
   {
      CHECK(e.getCode() == LSAERR_NullPointer);
   }
}


TEST_CASE("zero sizes are raised to one", "[ThreadPool]")
{
   ThreadPool pool(0, 0);
   CHECK(pool.GetSize() == 1);
   CHECK(pool.GetQueueCapacity() == 1);
}
