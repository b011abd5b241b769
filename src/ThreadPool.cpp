#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace
{
    size_t CoreCount()
    {
        unsigned int Cores = std::thread::hardware_concurrency();
        return Cores == 0 ? 4 : static_cast<size_t>(Cores);
    }
}

ThreadPool::ThreadPool(size_t ThreadCount): ThreadPoolStop(false), ThreadPoolActiveJobs(0)
{
    if (ThreadCount == 0)
    {
        ThreadCount = 1;
    }
    for (size_t i = 0; i < ThreadCount; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        ThreadPoolStop = true;
    }
    ThreadPool_CV.notify_all();
    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
}

void ThreadPool::Submit(std::function<void()> Job)
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        Jobs.push(std::move(Job));
    }
    ThreadPool_CV.notify_one();
}

void ThreadPool::Join()
{
    std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
    ThreadPoolIdle_CV.wait(Lock, [this] { return Jobs.empty() && ThreadPoolActiveJobs == 0; });
}

size_t ThreadPool::OptimalIOWorkers()
{
    return std::min<size_t>(32, std::max<size_t>(4, CoreCount() * 2));
}

size_t ThreadPool::OptimalCPUWorkers()
{
    size_t Cores = CoreCount();
    return std::min<size_t>(16, std::max<size_t>(2, Cores > 0 ? Cores - 1 : 0));
}

void ThreadPool::WorkerThread()
{
    while (true)
    {
        std::function<void()> Job;
        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            ThreadPool_CV.wait(Lock, [this] { return ThreadPoolStop || !Jobs.empty(); });
            if (ThreadPoolStop && Jobs.empty())
            {
                return;
            }
            Job = std::move(Jobs.front());
            Jobs.pop();
            ++ThreadPoolActiveJobs;
        }

        try
        {
            Job();
        }
        catch (const std::exception& e)
        {
            Log.Error(std::string("[ThreadPool] Job threw: ") + e.what());
        }
        catch (...)
        {
            Log.Error("[ThreadPool] Job threw a non-standard exception");
        }

        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            --ThreadPoolActiveJobs;
            if (Jobs.empty() && ThreadPoolActiveJobs == 0)
            {
                ThreadPoolIdle_CV.notify_all();
            }
        }
    }
}
