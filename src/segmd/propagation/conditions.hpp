#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <segmd/segments/frame_locator.hpp>
#include <segmd/segments/trajectory.hpp>

namespace segmd::propagation {

using segments::condition_matrix;
using segments::condition_values;
using segments::trajectory;

///
/// Condition evaluated inline on the calling thread.
///
/// Blocks whoever evaluates it for the whole computation.
///
struct blocking_condition {
    std::string name;
    std::function<condition_values(const trajectory&)> fn;
};

///
/// Condition whose evaluation runs elsewhere and completes through a future.
///
/// Suspending conditions of one evaluation are started together and run
/// concurrently.
///
struct suspending_condition {
    std::string name;
    std::function<std::future<condition_values>(const trajectory&)> fn;
};

///
/// A state condition: trajectory -> one boolean per frame.
///
/// Conditions of one propagator are assumed mutually exclusive on every frame;
/// this is the caller's responsibility and is not checked.
///
using state_condition = std::variant<blocking_condition, suspending_condition>;

///
/// Gets the name of a condition.
///
std::string_view condition_name(const state_condition& c) noexcept;

///
/// Gets whether a condition evaluates inline.
///
bool is_blocking(const state_condition& c) noexcept;

///
/// Wraps a plain function so that it is evaluated on its own thread.
///
/// @param name Condition name
/// @param fn Function computing the per-frame values
/// @return Suspending condition running fn via std::async
///
suspending_condition make_suspending(std::string name, std::function<condition_values(const trajectory&)> fn);

///
/// Applies a fixed list of state conditions to trajectories.
///
/// Performs no caching; every call invokes every condition. Exceptions thrown
/// by a condition propagate unchanged.
///
class condition_evaluator {
   public:
    ///
    /// Constructs an evaluator.
    ///
    /// Logs a warning if any condition is blocking, since blocking conditions
    /// stall the caller while they run.
    ///
    /// @param conditions Conditions, identified by their index in this list
    /// @throws std::invalid_argument if conditions is empty or a condition has no function
    ///
    explicit condition_evaluator(std::vector<state_condition> conditions);

    ///
    /// Evaluates every condition on a trajectory.
    ///
    /// Suspending conditions are started first and run concurrently; blocking
    /// conditions then run inline in list order. Results are returned in
    /// condition order regardless of completion order.
    ///
    /// @param traj Trajectory to evaluate
    /// @return One 1-D vector per condition, each of length traj.size()
    /// @throws inconsistent_condition_shape if a result does not have one value per frame
    ///
    std::vector<condition_values> evaluate(const trajectory& traj) const;

    ///
    /// Evaluates every condition on a trajectory into a conditions x frames matrix.
    ///
    condition_matrix evaluate_matrix(const trajectory& traj) const;

    ///
    /// Evaluates every condition on each of the given trajectories.
    ///
    std::vector<condition_matrix> evaluate_matrices(const std::vector<trajectory>& trajs) const;

    ///
    /// Evaluates a single condition on a trajectory.
    ///
    /// @param index Index of the condition
    /// @param traj Trajectory to evaluate
    /// @return 1-D vector of length traj.size()
    /// @throws std::out_of_range if index is not a condition index
    ///
    condition_values evaluate_one(std::size_t index, const trajectory& traj) const;

    ///
    /// Gets number of conditions.
    ///
    std::size_t size() const noexcept;

    ///
    /// Gets the conditions.
    ///
    const std::vector<state_condition>& conditions() const noexcept;

   private:
    std::vector<state_condition> conditions_;
};

}  // namespace segmd::propagation
