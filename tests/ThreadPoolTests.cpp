#include "EventChannel.hpp"
#include "TestSupport.hpp"
#include "ThreadPool.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    void TestPoolSurvivesThrowingJobs(TestContext& T)
    {
        ThreadPool Pool(2);
        std::atomic<int> Ran{ 0 };

        Pool.Submit([] { throw 42; });
        Pool.Submit([] { throw std::runtime_error("boom"); });
        for (int i = 0; i < 8; ++i)
        {
            Pool.Submit([&Ran] { ++Ran; });
        }
        Pool.Join();
        T.Check(Ran == 8, "jobs after throwing ones should still run, ran " + std::to_string(Ran.load()));

        std::future<int> Answer = Pool.SubmitTask([] { return 7; });
        T.Check(Answer.get() == 7, "workers should still be alive");

        std::future<void> Failing = Pool.SubmitTask([] { throw 1; });
        bool Surfaced = false;
        try
        {
            Failing.get();
        }
        catch (int)
        {
            Surfaced = true;
        }
        T.Check(Surfaced, "task exceptions should surface through the future");
    }

    void TestChannelSurvivesThrowingListener(TestContext& T)
    {
        EventChannel<int> Channel;
        Channel.Start();

        std::vector<int> Seen;
        Channel.Subscribe([](const int& Value) {
            if (Value == 1)
            {
                throw Value;
            }
            if (Value == 2)
            {
                throw std::logic_error("bad event");
            }
        });
        Channel.Subscribe([&Seen](const int& Value) { Seen.push_back(Value); });

        for (int Value = 1; Value <= 4; ++Value)
        {
            Channel.Publish(Value);
        }
        Channel.Flush();
        Channel.Stop();

        T.Check(Seen == std::vector<int>({ 1, 2, 3, 4 }), "every event should reach the other listeners");
    }
}

int main()
{
    TestContext T;
    TestPoolSurvivesThrowingJobs(T);
    TestChannelSurvivesThrowingListener(T);
    return T.Finish("thread_pool_tests");
}
