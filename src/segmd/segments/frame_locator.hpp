#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#if __has_include(<xtensor/containers/xarray.hpp>)
#include <xtensor/containers/xarray.hpp>
#else
#include <xtensor/xarray.hpp>
#endif

namespace segmd::segments {

///
/// Per-frame values of a single condition (1-D, one entry per frame).
///
using condition_values = xt::xarray<bool>;

///
/// Values of every condition on one segment (2-D, conditions x frames).
///
using condition_matrix = xt::xarray<bool>;

///
/// Raised when condition values do not have the shape their trajectory implies.
///
/// This signals a defect in a condition function or its caller, never a
/// valid runtime state.
///
class inconsistent_condition_shape : public std::logic_error {
   public:
    explicit inconsistent_condition_shape(const std::string& what);
};

///
/// Location of a frame within an ordered list of segments.
///
struct frame_address {
    std::size_t segment;  ///< Index of the segment holding the frame
    std::size_t frame;    ///< Frame index local to that segment

    friend bool operator==(const frame_address&, const frame_address&) = default;
};

///
/// First frame (along the concatenated frame axis) on which any condition holds.
///
struct first_true_frame {
    std::size_t condition;     ///< Index of the condition that holds
    std::size_t global_frame;  ///< Frame index along the concatenated axis
    frame_address address;     ///< The same frame as (segment, local frame)

    friend bool operator==(const first_true_frame&, const first_true_frame&) = default;
};

///
/// Converts a global frame index into a (segment, local frame) address.
///
/// Walks the segment lengths cumulatively until the owning segment is found.
///
/// @param part_lengths Frame count of every segment, in order
/// @param global_frame Frame index along the concatenated frame axis
/// @return Address of the frame
/// @throws std::out_of_range if global_frame is not below the total frame count
///
frame_address address_of_global_frame(std::span<const std::size_t> part_lengths, std::size_t global_frame);

///
/// Converts a (segment, local frame) address back into a global frame index.
///
/// @throws std::out_of_range if the address does not name a frame
///
std::size_t global_frame_of_address(std::span<const std::size_t> part_lengths, frame_address address);

///
/// Assembles per-condition values into a single conditions x frames matrix.
///
/// @param values One 1-D vector per condition
/// @param frames Expected length of every vector
/// @return Matrix with one row per condition
/// @throws inconsistent_condition_shape if any vector is not 1-D of length frames
///
condition_matrix make_condition_matrix(const std::vector<condition_values>& values, std::size_t frames);

///
/// Finds the first frame on which any condition holds.
///
/// The matrices are treated as concatenated along the frame axis. The result
/// is the smallest global frame index at which any condition is true. When
/// several conditions hold at that frame, the lowest condition index wins;
/// conditions are expected to be mutually exclusive, so this is a policy for
/// misconfigured inputs rather than a normal outcome.
///
/// @param matrices Conditions x frames matrix of every segment, in order
/// @return The first true frame, or std::nullopt if no condition holds anywhere
/// @throws inconsistent_condition_shape if a matrix is not 2-D or the
///         matrices disagree on the number of conditions
///
std::optional<first_true_frame> locate_first_true_frame(const std::vector<condition_matrix>& matrices);

///
/// Frame counts of the given condition matrices (their second dimension).
///
std::vector<std::size_t> part_lengths_of(const std::vector<condition_matrix>& matrices);

}  // namespace segmd::segments
