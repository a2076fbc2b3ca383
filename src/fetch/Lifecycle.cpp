#include "egress/fetch/Lifecycle.h"
#include "egress/fetch/FetchError.h"

#include <vector>

namespace egress {
namespace fetch {

Lifecycle::Registration::Registration(Registration&& other) noexcept
    : owner_(other.owner_), id_(other.id_) {
    other.owner_ = nullptr;
    other.id_ = 0;
}

Lifecycle::Registration& Lifecycle::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        Reset();
        owner_ = other.owner_;
        id_ = other.id_;
        other.owner_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

Lifecycle::Registration::~Registration() {
    Reset();
}

void Lifecycle::Registration::Reset() {
    if (owner_) owner_->Untrack(id_);
    owner_ = nullptr;
    id_ = 0;
}

bool Lifecycle::disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

void Lifecycle::ThrowIfDisposed() const {
    if (disposed()) {
        throw FetchError(FetchError::Kind::kDisposed, "gateway disposed");
    }
}

Lifecycle::Registration Lifecycle::Track(const CancellationTokenPtr& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        throw FetchError(FetchError::Kind::kDisposed, "gateway disposed");
    }
    const std::uint64_t id = nextId_++;
    tokens_.emplace(id, token);
    return Registration(this, id);
}

std::size_t Lifecycle::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

void Lifecycle::Untrack(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(id);
}

bool Lifecycle::Dispose() {
    std::vector<CancellationTokenPtr> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) return false;
        disposed_ = true;
        live.reserve(tokens_.size());
        for (const auto& kv : tokens_) live.push_back(kv.second);
    }
    for (const auto& token : live) {
        if (token) token->Cancel(CancelReason::kDisposed);
    }
    return true;
}

} // namespace fetch
} // namespace egress
