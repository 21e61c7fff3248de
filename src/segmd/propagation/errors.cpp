#include <segmd/propagation/errors.hpp>

#include <string>
#include <utility>

namespace segmd::propagation {

step_budget_exceeded::step_budget_exceeded(std::uint64_t steps, std::uint64_t max_steps)
    : std::runtime_error{"engine produced " + std::to_string(steps) + " steps (> " + std::to_string(max_steps) +
                         ") without any condition being fulfilled"},
      steps_{steps},
      max_steps_{max_steps} {}

std::uint64_t step_budget_exceeded::steps() const noexcept {
    return steps_;
}

std::uint64_t step_budget_exceeded::max_steps() const noexcept {
    return max_steps_;
}

output_already_exists::output_already_exists(std::filesystem::path path)
    : std::runtime_error{"output trajectory '" + path.string() + "' exists and overwriting was not permitted"},
      path_{std::move(path)} {}

const std::filesystem::path& output_already_exists::path() const noexcept {
    return path_;
}

}  // namespace segmd::propagation
