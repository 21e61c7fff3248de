#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include <segmd/propagation/conditions.hpp>
#include <segmd/propagation/stitcher.hpp>
#include <segmd/segments/slice_plan.hpp>
#include <segmd/segments/trajectory.hpp>

namespace segmd::propagation {

///
/// Finds where a chain first fulfills one specific condition.
///
/// Only the named condition is evaluated.
///
/// @param conditions Condition set holding the condition
/// @param condition Index of the condition
/// @param chain Segments in production order
/// @return Address of the first frame on which the condition holds
/// @throws std::out_of_range if condition is not a condition index
/// @throws std::invalid_argument if chain is empty or the condition never holds on it
///
segments::frame_address locate_chain_terminal(const condition_evaluator& conditions,
                                              std::size_t condition,
                                              const std::vector<trajectory>& chain);

///
/// Builds the joined read plan for a transition between two states.
///
/// @see segments::build_transition_plan
///
slice_plan plan_transition_from_segment_chains(const std::vector<trajectory>& minus_trajs,
                                               std::size_t minus_condition,
                                               const std::vector<trajectory>& plus_trajs,
                                               std::size_t plus_condition,
                                               const condition_evaluator& conditions);

///
/// Constructs one continuous transition path from a backward and a forward segment chain.
///
/// Used for two-way shooting and for extracting transitions from committor
/// runs. The minus chain (propagated backward in time from the shared
/// starting configuration) is reversed, with momenta inverted, and followed by
/// the plus chain; the starting configuration appears once. Each chain is cut
/// at the first frame on which its own condition holds.
///
/// @param minus_trajs Segments propagated backward in time
/// @param minus_condition Index of the condition first fulfilled on the minus chain
/// @param plus_trajs Segments propagated forward in time
/// @param plus_condition Index of the condition first fulfilled on the plus chain
/// @param conditions Condition set the indices refer to
/// @param tra_out Output trajectory file
/// @param struct_out Output structure file; if absent the concatenator uses the
///        structure file of the first minus segment
/// @param overwrite Whether an existing tra_out may be replaced
/// @param stitcher Stitcher performing the concatenation
/// @return The constructed transition
/// @throws output_already_exists if tra_out exists and overwrite is false
///
trajectory construct_transition_from_segment_chains(const std::vector<trajectory>& minus_trajs,
                                                    std::size_t minus_condition,
                                                    const std::vector<trajectory>& plus_trajs,
                                                    std::size_t plus_condition,
                                                    const condition_evaluator& conditions,
                                                    const std::filesystem::path& tra_out,
                                                    const std::optional<std::filesystem::path>& struct_out,
                                                    bool overwrite,
                                                    const bounded_stitcher& stitcher);

}  // namespace segmd::propagation
