#include "CancellationToken.hpp"

#include "ZoneErrors.hpp"

#include <string>

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
    return cancelled_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

void CancellationToken::ThrowIfCancelled(const char* where) const {
    if (cancelled_) {
        throw OperationCancelled(std::string("Cancelled during ") + where);
    }
}
