#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>

#include <segmd/segments/frame_locator.hpp>

namespace segmd::propagation {

using segments::inconsistent_condition_shape;

///
/// Raised when propagation exhausted its step budget before any condition held.
///
/// Terminal outcome of a propagation; never retried automatically. Callers
/// that want to go on must invoke the continuation path explicitly.
///
class step_budget_exceeded : public std::runtime_error {
   public:
    step_budget_exceeded(std::uint64_t steps, std::uint64_t max_steps);

    ///
    /// Gets the number of integration steps the engine produced.
    ///
    std::uint64_t steps() const noexcept;

    ///
    /// Gets the configured step budget.
    ///
    std::uint64_t max_steps() const noexcept;

   private:
    std::uint64_t steps_;
    std::uint64_t max_steps_;
};

///
/// Raised when a stitching target exists and overwriting was not permitted.
///
class output_already_exists : public std::runtime_error {
   public:
    explicit output_already_exists(std::filesystem::path path);

    const std::filesystem::path& path() const noexcept;

   private:
    std::filesystem::path path_;
};

}  // namespace segmd::propagation
