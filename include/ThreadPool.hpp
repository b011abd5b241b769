#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <type_traits>

class ThreadPool
{
public:
    explicit ThreadPool(size_t ThreadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Job);

    // Exceptions thrown by Task surface through the returned future
    template<typename Callable>
    auto SubmitTask(Callable&& Task) -> std::future<std::invoke_result_t<std::decay_t<Callable>>>
    {
        using ResultType = std::invoke_result_t<std::decay_t<Callable>>;
        auto Packaged = std::make_shared<std::packaged_task<ResultType()>>(std::forward<Callable>(Task));
        std::future<ResultType> Future = Packaged->get_future();
        Submit([Packaged]() { (*Packaged)(); });
        return Future;
    }

    // Blocks until the queue is empty and no job is running
    void Join();

    size_t Size() const { return Workers.size(); }

    // I/O bound work: min(32, max(4, 2 x cores))
    static size_t OptimalIOWorkers();
    // CPU bound work: min(16, max(2, cores - 1))
    static size_t OptimalCPUWorkers();

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;

    std::mutex ThreadPoolMutex;
    std::condition_variable ThreadPool_CV;
    std::condition_variable ThreadPoolIdle_CV;
    bool ThreadPoolStop;
    size_t ThreadPoolActiveJobs;

    void WorkerThread();
};
