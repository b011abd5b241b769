#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

// Cooperative pause gate and cancel flag, polled at every buffer chunk
class TransferControl
{
public:
    TransferControl() = default;

    TransferControl(const TransferControl&) = delete;
    TransferControl& operator=(const TransferControl&) = delete;

    void Pause();
    void Resume();
    // Also releases anyone blocked on the pause gate
    void Cancel();
    void ResetCancel();

    bool IsPaused() const;
    bool IsCancelled() const { return Cancelled.load(); }

    // Blocks while paused. Returns false once cancelled.
    bool WaitIfPaused();

private:
    mutable std::mutex GateMutex;
    std::condition_variable Gate_CV;
    bool Paused = false;
    std::atomic<bool> Cancelled{ false };
};
