#pragma once

#include <iosfwd>

#include <json/json.h>

#include <segmd/propagation/engine.hpp>
#include <segmd/propagation/propagator.hpp>

namespace segmd::propagation {

///
/// Reads propagation options from a JSON object.
///
/// Recognized keys:
/// @code{.json}
/// {
///   "walltime_per_part": <number, hours, required>,
///   "max_steps": <integer, optional>,
///   "max_frames": <integer, optional>
/// }
/// @endcode
/// A `null` value counts as absent.
///
/// @throws std::invalid_argument if a required key is missing or a key has the wrong type
///
conditional_propagator::options options_from_json(const Json::Value& root);

///
/// Parses a JSON document from a stream and reads propagation options from it.
///
/// @throws std::invalid_argument if the document does not parse or options_from_json() rejects it
///
conditional_propagator::options read_options(std::istream& in);

///
/// Reads an engine configuration from a flat JSON object.
///
/// String values are taken verbatim, integers are printed in decimal, other
/// numbers with full precision and booleans become `yes`/`no`.
///
/// @throws std::invalid_argument if root is not an object or holds arrays or objects
///
md_config md_config_from_json(const Json::Value& root);

}  // namespace segmd::propagation
