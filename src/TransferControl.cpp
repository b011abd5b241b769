#include "TransferControl.hpp"

void TransferControl::Pause()
{
    std::lock_guard<std::mutex> Lock(GateMutex);
    Paused = true;
}

void TransferControl::Resume()
{
    {
        std::lock_guard<std::mutex> Lock(GateMutex);
        Paused = false;
    }
    Gate_CV.notify_all();
}

void TransferControl::Cancel()
{
    {
        std::lock_guard<std::mutex> Lock(GateMutex);
        Cancelled = true;
    }
    Gate_CV.notify_all();
}

void TransferControl::ResetCancel()
{
    Cancelled = false;
}

bool TransferControl::IsPaused() const
{
    std::lock_guard<std::mutex> Lock(GateMutex);
    return Paused;
}

bool TransferControl::WaitIfPaused()
{
    std::unique_lock<std::mutex> Lock(GateMutex);
    Gate_CV.wait(Lock, [this] { return !Paused || Cancelled.load(); });
    return !Cancelled.load();
}
