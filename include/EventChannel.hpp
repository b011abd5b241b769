#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "Logger.hpp"

// Single dispatcher thread delivering published events to listeners.
// Listeners run on the dispatcher thread, never inside a publisher's lock.
template<typename EventType>
class EventChannel
{
public:
    using Listener = std::function<void(const EventType&)>;

    EventChannel() = default;
    ~EventChannel()
    {
        Stop();
    }

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void Start()
    {
        std::lock_guard<std::mutex> Lock(ChannelMutex);
        if (Running)
        {
            return;
        }
        Running = true;
        DispatchThread = std::thread(&EventChannel::DispatchLoop, this);
    }

    // Drains what is already queued, then joins the dispatcher
    void Stop()
    {
        {
            std::lock_guard<std::mutex> Lock(ChannelMutex);
            if (!Running)
            {
                return;
            }
            Running = false;
        }
        Channel_CV.notify_all();
        if (DispatchThread.joinable())
        {
            DispatchThread.join();
        }
    }

    void Subscribe(Listener NewListener)
    {
        std::lock_guard<std::mutex> Lock(ListenerMutex);
        Listeners.push_back(std::move(NewListener));
    }

    void Publish(EventType Event)
    {
        {
            std::lock_guard<std::mutex> Lock(ChannelMutex);
            if (!Running)
            {
                return;
            }
            Pending.push(std::move(Event));
        }
        Channel_CV.notify_one();
    }

    // Waits until every event published so far has been delivered
    void Flush()
    {
        std::unique_lock<std::mutex> Lock(ChannelMutex);
        Drained_CV.wait(Lock, [this] { return (Pending.empty() && !Delivering) || !Running; });
    }

private:
    void DispatchLoop()
    {
        while (true)
        {
            std::unique_lock<std::mutex> Lock(ChannelMutex);
            Channel_CV.wait(Lock, [this] { return !Pending.empty() || !Running; });
            if (Pending.empty())
            {
                Drained_CV.notify_all();
                if (!Running)
                {
                    return;
                }
                continue;
            }

            EventType Event = std::move(Pending.front());
            Pending.pop();
            Delivering = true;
            Lock.unlock();

            std::vector<Listener> Snapshot;
            {
                std::lock_guard<std::mutex> ListenerLock(ListenerMutex);
                Snapshot = Listeners;
            }
            for (const Listener& Target : Snapshot)
            {
                try
                {
                    Target(Event);
                }
                catch (const std::exception& e)
                {
                    Log.Error(std::string("[EventChannel] Listener threw: ") + e.what());
                }
                catch (...)
                {
                    Log.Error("[EventChannel] Listener threw a non-standard exception");
                }
            }

            Lock.lock();
            Delivering = false;
            if (Pending.empty())
            {
                Drained_CV.notify_all();
            }
        }
    }

    std::mutex ChannelMutex;
    std::condition_variable Channel_CV;
    std::condition_variable Drained_CV;
    std::queue<EventType> Pending;
    bool Running = false;
    bool Delivering = false;
    std::thread DispatchThread;

    std::mutex ListenerMutex;
    std::vector<Listener> Listeners;
};
