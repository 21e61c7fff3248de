#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <segmd/propagation/conditions.hpp>
#include <segmd/propagation/engine.hpp>
#include <segmd/propagation/stitcher.hpp>
#include <segmd/segments/trajectory.hpp>

namespace segmd::propagation {

///
/// Segments produced by a propagation and the condition that ended it.
///
/// The last segment holds the first frame on which the condition is fulfilled.
///
struct propagation_result {
    std::vector<trajectory> segments;
    std::size_t condition;
};

///
/// Stitched trajectory (start configuration through first fulfilling frame) and its condition.
///
struct concatenation_result {
    trajectory traj;
    std::size_t condition;
};

///
/// Propagates a trajectory in walltime-bounded segments until any condition holds.
///
/// After each segment the conditions are evaluated on it; propagation stops at
/// the first segment on which any condition holds, or fails with
/// step_budget_exceeded once the engine has done more steps than allowed.
/// The produced segments can then be cut at the first fulfilling frame and
/// stitched into one trajectory.
///
/// A propagator holds no per-run state: every call creates its own engine and
/// segment list, so independent propagations may run concurrently on
/// different threads as long as the conditions tolerate concurrent use.
///
class conditional_propagator {
   public:
    ///
    /// Propagation options.
    ///
    struct options {
        ///
        /// Walltime per segment.
        ///
        md_engine::hours walltime_per_part;

        ///
        /// Maximum number of integration steps before giving up.
        ///
        /// Takes precedence over max_frames if both are given.
        ///
        std::optional<std::uint64_t> max_steps = std::nullopt;

        ///
        /// Maximum number of output frames before giving up.
        ///
        /// Converted to steps using the engine's output frequency.
        ///
        std::optional<std::uint64_t> max_frames = std::nullopt;
    };

    ///
    /// Constructs a propagator.
    ///
    /// @param conditions State conditions, identified by index
    /// @param engine_factory Creates one engine per propagation
    /// @param opts Propagation options
    /// @param stitcher Stitcher used by cut_and_concatenate()
    /// @param discovery Recovers existing segments for continuation
    /// @throws std::invalid_argument if engine_factory is null, walltime_per_part
    ///         is not positive, or max_frames is given but the engine
    ///         configuration has no output frequency or the resulting step
    ///         budget does not fit 64 bits
    ///
    conditional_propagator(std::vector<state_condition> conditions,
                           std::shared_ptr<const md_engine_factory> engine_factory,
                           options opts,
                           bounded_stitcher stitcher,
                           segment_discovery discovery = discover_part_files);

    ///
    /// Propagates until any condition is fulfilled.
    ///
    /// If the starting configuration itself fulfills a condition nothing is
    /// propagated and the result holds the starting configuration alone. On
    /// continuation every segment already on disk is re-evaluated and
    /// propagation resumes from the last one if none fulfills a condition.
    ///
    /// @param starting_configuration Configuration (with momenta) to start from
    /// @param workdir Working directory of the engine
    /// @param deffnm Run name
    /// @param continuation Whether to continue an earlier run with the same workdir and deffnm
    /// @return Segments and index of the condition fulfilled first
    /// @throws step_budget_exceeded if the step budget ran out first
    ///
    propagation_result propagate(const trajectory& starting_configuration,
                                 const std::filesystem::path& workdir,
                                 const std::string& deffnm,
                                 bool continuation = false) const;

    ///
    /// Cuts segments at the first fulfilling frame and stitches them into one trajectory.
    ///
    /// Frame 0 of the first segment is assumed not to fulfill any condition
    /// unless it is the only frame taken.
    ///
    /// @param trajs Segments in production order, e.g. from propagate()
    /// @param tra_out Output trajectory file
    /// @param overwrite Whether an existing tra_out may be replaced
    /// @return Stitched trajectory and index of the condition fulfilled first
    /// @throws std::invalid_argument if trajs is empty or no condition holds on any frame
    /// @throws output_already_exists if tra_out exists and overwrite is false
    ///
    concatenation_result cut_and_concatenate(const std::vector<trajectory>& trajs,
                                             const std::filesystem::path& tra_out,
                                             bool overwrite = false) const;

    ///
    /// Chains propagate() and cut_and_concatenate().
    ///
    concatenation_result propagate_and_concatenate(const trajectory& starting_configuration,
                                                   const std::filesystem::path& workdir,
                                                   const std::string& deffnm,
                                                   const std::filesystem::path& tra_out,
                                                   bool overwrite = false,
                                                   bool continuation = false) const;

    ///
    /// Gets the resolved step budget, std::nullopt when unbounded.
    ///
    const std::optional<std::uint64_t>& max_steps() const noexcept;

    ///
    /// Gets the conditions.
    ///
    const condition_evaluator& conditions() const noexcept;

    ///
    /// Gets the options this propagator was created with.
    ///
    const options& get_options() const noexcept;

   private:
    bool within_budget_(std::uint64_t steps) const noexcept;

    condition_evaluator conditions_;
    std::shared_ptr<const md_engine_factory> engine_factory_;
    options options_;
    bounded_stitcher stitcher_;
    segment_discovery discovery_;
    std::optional<std::uint64_t> max_steps_;
};

}  // namespace segmd::propagation
