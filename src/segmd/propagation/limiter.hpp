#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace segmd::propagation {

///
/// Counting limiter bounding how much heavy, process-bound work runs at once.
///
/// One instance is shared by every propagator and stitcher of a process. It is
/// constructed explicitly and handed to its users; there is no global instance.
/// Waiters are released in whatever order the underlying condition variable
/// wakes them.
///
class process_limiter {
   public:
    ///
    /// RAII ownership of one permit. Releases the permit on destruction.
    ///
    class permit {
       public:
        permit(permit&& other) noexcept;
        permit& operator=(permit&& other) noexcept;
        permit(const permit&) = delete;
        permit& operator=(const permit&) = delete;
        ~permit();

       private:
        friend class process_limiter;
        explicit permit(process_limiter* owner) noexcept;

        process_limiter* owner_;
    };

    ///
    /// Constructs a limiter.
    ///
    /// @param capacity Maximum number of permits held at the same time
    /// @throws std::invalid_argument if capacity is zero
    ///
    explicit process_limiter(std::size_t capacity);

    process_limiter(const process_limiter&) = delete;
    process_limiter& operator=(const process_limiter&) = delete;

    ///
    /// Blocks until a permit is free and takes it.
    ///
    /// @return Permit, released when it goes out of scope
    ///
    [[nodiscard]] permit acquire();

    ///
    /// Gets the maximum number of concurrently held permits.
    ///
    std::size_t capacity() const noexcept;

    ///
    /// Gets the number of permits currently free.
    ///
    std::size_t available() const;

   private:
    void release_() noexcept;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::size_t available_;
};

}  // namespace segmd::propagation
