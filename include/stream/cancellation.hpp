#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <stdexcept>

class Cancelled : public std::runtime_error {
public:
    Cancelled() : std::runtime_error("operation cancelled") {}
};

// Cooperative cancellation flag. Set once, observed by whoever holds a reference.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

    void throwIfCancelled() const {
        if (isCancelled()) throw Cancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
};

#endif
