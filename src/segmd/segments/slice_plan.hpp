#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <segmd/segments/frame_locator.hpp>
#include <segmd/segments/trajectory.hpp>

namespace segmd::segments {

///
/// Read instruction for one segment.
///
/// Selects frames `start, start + stride, ...` up to but excluding `stop`, with
/// the same clamping rules as Python slicing. A missing `stop` reads to the end
/// of the segment in the stride direction: through the last frame for a
/// forward read, through frame 0 for a reversed read. A negative stride means
/// the frames are consumed in reverse time order, which the concatenator
/// treats as requiring momentum inversion.
///
struct slice {
    trajectory segment;               ///< Segment to read from
    std::size_t start;                ///< First frame read
    std::optional<std::size_t> stop;  ///< Exclusive bound in the read direction
    int stride;                       ///< +1 (forward) or -1 (reversed)

    ///
    /// Gets number of frames this slice selects.
    ///
    std::size_t frame_count() const noexcept;

    ///
    /// Gets the local frame indices this slice selects, in read order.
    ///
    std::vector<std::size_t> frames() const;

    friend bool operator==(const slice&, const slice&) = default;
};

///
/// Ordered read plan producing one continuous trajectory.
///
using slice_plan = std::vector<slice>;

///
/// Total number of frames selected by a plan.
///
std::size_t total_frames(const slice_plan& plan) noexcept;

///
/// Time direction in which a segment chain was propagated.
///
enum class chain_direction : std::uint8_t {
    k_forward,   ///< Read as produced (stride +1)
    k_backward,  ///< Time-reversed chain, read in reverse (stride -1)
};

///
/// Whether the starting configuration (frame 0 of segment 0) is part of the read.
///
enum class shared_start : std::uint8_t {
    k_include,
    k_exclude,
};

///
/// Builds the read plan for one segment chain ending at a terminal frame.
///
/// Forward chains take every segment before the terminal one in full, then the
/// terminal segment from frame 0 through the terminal frame. Backward chains
/// start at the terminal frame, read down to frame 0 of the terminal segment,
/// then take every earlier segment reversed in full, so the starting
/// configuration ends up last. With shared_start::k_exclude the slice covering
/// segment 0 leaves out its frame 0.
///
/// @param segments Segments of the chain, in production order
/// @param terminal Address of the terminal (first condition-satisfying) frame
/// @param direction Direction the chain was propagated in
/// @param start Whether the starting configuration is read
/// @return Read plan
/// @throws std::invalid_argument if segments is empty
/// @throws std::out_of_range if terminal does not name a frame of segments
///
slice_plan build_chain_plan(const std::vector<trajectory>& segments,
                            frame_address terminal,
                            chain_direction direction,
                            shared_start start = shared_start::k_include);

///
/// Builds the plan for a single forward run: start configuration through the terminal frame.
///
slice_plan build_forward_plan(const std::vector<trajectory>& segments, frame_address terminal);

///
/// Builds the plan joining a backward (minus) chain to a forward (plus) chain.
///
/// The minus chain is read reversed, from its terminal frame back to the shared
/// starting configuration; the plus chain follows, read forward from the frame
/// after the starting configuration through its terminal frame. The starting
/// configuration therefore appears exactly once.
///
/// @param minus_segments Segments propagated backward in time
/// @param minus_terminal First condition-satisfying frame of the minus chain
/// @param plus_segments Segments propagated forward in time
/// @param plus_terminal First condition-satisfying frame of the plus chain
/// @return Joined read plan
///
slice_plan build_transition_plan(const std::vector<trajectory>& minus_segments,
                                 frame_address minus_terminal,
                                 const std::vector<trajectory>& plus_segments,
                                 frame_address plus_terminal);

}  // namespace segmd::segments
