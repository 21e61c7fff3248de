#pragma once

#include <iosfwd>
#include <string>

#include <segmd/segments/slice_plan.hpp>

namespace segmd::segments {

///
/// Serializes a slice plan to JSON.
///
/// JSON structure:
/// @code{.json}
/// {
///   "total_frames": <int>,
///   "slices": [
///     {
///       "structure_file": <string>,
///       "trajectory_files": [<string>, ...],
///       "segment_frames": <int>,
///       "start": <int>,
///       "stop": <int|null>,
///       "stride": <int>,
///       "frames": <int>
///     }, ...
///   ]
/// }
/// @endcode
///
/// @param plan The plan to serialize
/// @return JSON string
///
std::string serialize_slice_plan_to_json(const slice_plan& plan);

///
/// Writes slice plan JSON directly to output stream.
///
/// @param out Output stream to write to
/// @param plan The plan to serialize
///
void write_slice_plan_json(std::ostream& out, const slice_plan& plan);

}  // namespace segmd::segments
