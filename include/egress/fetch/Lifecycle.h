#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "egress/common/noncopyable.h"
#include "egress/fetch/CancellationToken.h"

namespace egress {
namespace fetch {

// Disposed flag plus the tokens of every request currently in flight.
class Lifecycle : common::noncopyable {
public:
    // Keeps a token registered until destroyed.
    class Registration {
    public:
        Registration() = default;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration();

        void Reset();

    private:
        friend class Lifecycle;
        Registration(Lifecycle* owner, std::uint64_t id) : owner_(owner), id_(id) {}

        Lifecycle* owner_{nullptr};
        std::uint64_t id_{0};
    };

    bool disposed() const;

    // Throws FetchError(kDisposed).
    void ThrowIfDisposed() const;

    // Throws FetchError(kDisposed) if already disposed.
    Registration Track(const CancellationTokenPtr& token);

    std::size_t inFlight() const;

    // First call cancels every tracked token with CancelReason::kDisposed.
    // Returns false if already disposed.
    bool Dispose();

private:
    void Untrack(std::uint64_t id);

    mutable std::mutex mutex_;
    bool disposed_{false};
    std::uint64_t nextId_{1};
    std::unordered_map<std::uint64_t, CancellationTokenPtr> tokens_;
};

} // namespace fetch
} // namespace egress
