#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared between a run and whoever may abandon it (signal handler thread,
// test). Cancel() wakes any WaitFor() in progress.
class CancellationToken {
public:
    void Cancel();
    bool IsCancelled() const;

    // Sleeps for `duration` unless cancelled first. Returns false when the
    // wait ended because of cancellation.
    bool WaitFor(std::chrono::milliseconds duration);

    // Throws OperationCancelled if Cancel() has been called.
    void ThrowIfCancelled(const char* where) const;

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
