#include <segmd/propagation/limiter.hpp>

#include <stdexcept>
#include <utility>

namespace segmd::propagation {

process_limiter::permit::permit(process_limiter* owner) noexcept : owner_{owner} {}

process_limiter::permit::permit(permit&& other) noexcept : owner_{std::exchange(other.owner_, nullptr)} {}

process_limiter::permit& process_limiter::permit::operator=(permit&& other) noexcept {
    if (this != &other) {
        if (owner_) {
            owner_->release_();
        }
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

process_limiter::permit::~permit() {
    if (owner_) {
        owner_->release_();
    }
}

process_limiter::process_limiter(std::size_t capacity) : capacity_{capacity}, available_{capacity} {
    if (capacity == 0) {
        throw std::invalid_argument{"process limiter capacity must be positive"};
    }
}

process_limiter::permit process_limiter::acquire() {
    std::unique_lock lock{mutex_};
    released_.wait(lock, [this] { return available_ > 0; });
    --available_;
    return permit{this};
}

std::size_t process_limiter::capacity() const noexcept {
    return capacity_;
}

std::size_t process_limiter::available() const {
    const std::lock_guard lock{mutex_};
    return available_;
}

void process_limiter::release_() noexcept {
    {
        const std::lock_guard lock{mutex_};
        ++available_;
    }
    released_.notify_one();
}

}  // namespace segmd::propagation
