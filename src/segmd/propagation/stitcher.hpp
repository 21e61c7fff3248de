#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <optional>

#include <segmd/propagation/limiter.hpp>
#include <segmd/segments/slice_plan.hpp>
#include <segmd/segments/trajectory.hpp>

namespace segmd::propagation {

using segments::slice_plan;
using segments::trajectory;

///
/// Concatenation collaborator: reads the frames a plan selects and writes one trajectory.
///
/// Implementations block for the whole read/write and invert momenta on
/// slices with negative stride.
///
class trajectory_concatenator {
   public:
    virtual ~trajectory_concatenator();

    ///
    /// Writes the frames selected by plan, in order, to one output trajectory.
    ///
    /// @param plan Read plan
    /// @param tra_out Output trajectory file
    /// @param struct_out Output structure file; if absent the structure file of
    ///        the first planned segment is used
    /// @param overwrite Whether an existing tra_out may be replaced
    /// @return Handle to the written trajectory
    ///
    virtual trajectory concatenate(const slice_plan& plan,
                                   const std::filesystem::path& tra_out,
                                   const std::optional<std::filesystem::path>& struct_out,
                                   bool overwrite) = 0;
};

///
/// Runs concatenations off the caller's thread, bounded by a process limiter.
///
/// Each stitch runs on a dedicated thread, which takes a permit from the shared
/// limiter before calling the concatenator, so the caller is never blocked by
/// the read/write work and at most limiter.capacity() heavy operations run at
/// once across everything sharing the limiter.
///
class bounded_stitcher {
   public:
    ///
    /// Constructs a stitcher.
    ///
    /// @throws std::invalid_argument if concatenator or limiter is null
    ///
    bounded_stitcher(std::shared_ptr<trajectory_concatenator> concatenator, std::shared_ptr<process_limiter> limiter);

    ///
    /// Starts stitching a plan into one output trajectory.
    ///
    /// The operation is single-shot on its output path: with overwrite disabled
    /// a second call for the same path fails; with overwrite enabled it
    /// recomputes the output from the plan.
    ///
    /// @param plan Read plan, consumed by this call
    /// @param tra_out Output trajectory file
    /// @param struct_out Output structure file, optional
    /// @param overwrite Whether an existing tra_out may be replaced
    /// @return Future of the stitched trajectory; concatenator errors surface from get()
    /// @throws output_already_exists if tra_out exists and overwrite is false
    /// @throws std::invalid_argument if plan selects no frames
    ///
    [[nodiscard]] std::future<trajectory> stitch(slice_plan plan,
                                                 std::filesystem::path tra_out,
                                                 std::optional<std::filesystem::path> struct_out,
                                                 bool overwrite) const;

    ///
    /// Gets the limiter bounding this stitcher.
    ///
    const std::shared_ptr<process_limiter>& limiter() const noexcept;

   private:
    std::shared_ptr<trajectory_concatenator> concatenator_;
    std::shared_ptr<process_limiter> limiter_;
};

}  // namespace segmd::propagation
