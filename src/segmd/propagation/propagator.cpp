#include <segmd/propagation/propagator.hpp>

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/log/trivial.hpp>

#include <segmd/propagation/errors.hpp>
#include <segmd/segments/frame_locator.hpp>
#include <segmd/segments/slice_plan.hpp>

namespace segmd::propagation {

using segments::build_forward_plan;
using segments::locate_first_true_frame;

conditional_propagator::conditional_propagator(std::vector<state_condition> conditions,
                                               std::shared_ptr<const md_engine_factory> engine_factory,
                                               options opts,
                                               bounded_stitcher stitcher,
                                               segment_discovery discovery)
    : conditions_{std::move(conditions)},
      engine_factory_{std::move(engine_factory)},
      options_{std::move(opts)},
      stitcher_{std::move(stitcher)},
      discovery_{std::move(discovery)} {
    if (!engine_factory_) {
        throw std::invalid_argument{"conditional_propagator requires an engine factory"};
    }
    if (!discovery_) {
        throw std::invalid_argument{"conditional_propagator requires a segment discovery function"};
    }
    if (!(options_.walltime_per_part.count() > 0.0)) {
        throw std::invalid_argument{"walltime_per_part must be positive"};
    }

    if (options_.max_steps && options_.max_frames) {
        BOOST_LOG_TRIVIAL(warning) << "Both max_steps and max_frames given; max_steps (" << *options_.max_steps
                                   << ") takes precedence.";
    }
    if (options_.max_steps) {
        max_steps_ = options_.max_steps;
    } else if (options_.max_frames) {
        const auto nstout = output_frequency(engine_factory_->config(), engine_factory_->output_traj_type());
        if (*options_.max_frames > std::numeric_limits<std::uint64_t>::max() / nstout) {
            throw std::invalid_argument{"max_frames (" + std::to_string(*options_.max_frames) + ") times the output frequency (" +
                                        std::to_string(nstout) + ") exceeds the step counter range"};
        }
        max_steps_ = *options_.max_frames * nstout;
    } else {
        BOOST_LOG_TRIVIAL(info) << "Neither max_frames nor max_steps given; propagation is unbounded.";
    }
}

bool conditional_propagator::within_budget_(std::uint64_t steps) const noexcept {
    return !max_steps_ || steps <= *max_steps_;
}

propagation_result conditional_propagator::propagate(const trajectory& starting_configuration,
                                                     const std::filesystem::path& workdir,
                                                     const std::string& deffnm,
                                                     bool continuation) const {
    // Nothing to propagate if the start is already in a state.
    if (const auto hit = locate_first_true_frame({conditions_.evaluate_matrix(starting_configuration)})) {
        BOOST_LOG_TRIVIAL(warning) << "Starting configuration " << starting_configuration << " already fulfills condition "
                                   << hit->condition << " (`" << condition_name(conditions_.conditions()[hit->condition])
                                   << "`).";
        return {{starting_configuration}, hit->condition};
    }

    auto engine = engine_factory_->create();
    if (!engine) {
        throw std::logic_error{"engine factory returned no engine"};
    }

    std::vector<trajectory> parts;
    std::uint64_t step_counter = 0;
    if (!continuation) {
        engine->prepare(starting_configuration, workdir, deffnm);
    } else {
        // The conditions may differ from the earlier run, so nothing recorded
        // about the existing parts is trusted.
        parts = discovery_(workdir, deffnm, *engine);
        if (const auto hit = locate_first_true_frame(conditions_.evaluate_matrices(parts))) {
            BOOST_LOG_TRIVIAL(info) << "Existing " << parts.size() << " segments of `" << deffnm << "` already fulfill condition "
                                    << hit->condition << " at frame " << hit->global_frame << ".";
            return {std::move(parts), hit->condition};
        }
        engine->prepare_from_files(workdir, deffnm);
        step_counter = engine->steps_done();
        BOOST_LOG_TRIVIAL(info) << "Continuing `" << deffnm << "` after " << parts.size() << " segments (" << step_counter
                                << " steps).";
    }

    // Earlier segments are known to be condition free, so only the newest one is checked.
    std::optional<segments::first_true_frame> hit;
    while (!hit && within_budget_(step_counter)) {
        auto part = engine->run_for_duration(options_.walltime_per_part);
        hit = locate_first_true_frame({conditions_.evaluate_matrix(part)});
        step_counter = engine->steps_done();
        BOOST_LOG_TRIVIAL(debug) << "`" << deffnm << "` segment " << parts.size() << ": " << part << ", " << step_counter
                                 << " steps done";
        parts.push_back(std::move(part));
    }

    if (!hit) {
        throw step_budget_exceeded{step_counter, *max_steps_};
    }

    BOOST_LOG_TRIVIAL(info) << "`" << deffnm << "` fulfilled condition " << hit->condition << " after " << parts.size()
                            << " segments (" << step_counter << " steps).";
    return {std::move(parts), hit->condition};
}

concatenation_result conditional_propagator::cut_and_concatenate(const std::vector<trajectory>& trajs,
                                                                 const std::filesystem::path& tra_out,
                                                                 bool overwrite) const {
    if (trajs.empty()) {
        throw std::invalid_argument{"no segments to cut and concatenate"};
    }

    // Values are recomputed here; caching, if wanted, belongs in the conditions.
    const auto hit = locate_first_true_frame(conditions_.evaluate_matrices(trajs));
    if (!hit) {
        throw std::invalid_argument{"no condition is fulfilled on any frame of the " + std::to_string(trajs.size()) +
                                    " segments"};
    }

    auto plan = build_forward_plan(trajs, hit->address);
    auto traj = stitcher_.stitch(std::move(plan), tra_out, std::nullopt, overwrite).get();
    return {std::move(traj), hit->condition};
}

concatenation_result conditional_propagator::propagate_and_concatenate(const trajectory& starting_configuration,
                                                                       const std::filesystem::path& workdir,
                                                                       const std::string& deffnm,
                                                                       const std::filesystem::path& tra_out,
                                                                       bool overwrite,
                                                                       bool continuation) const {
    const auto result = propagate(starting_configuration, workdir, deffnm, continuation);
    return cut_and_concatenate(result.segments, tra_out, overwrite);
}

const std::optional<std::uint64_t>& conditional_propagator::max_steps() const noexcept {
    return max_steps_;
}

const condition_evaluator& conditional_propagator::conditions() const noexcept {
    return conditions_;
}

const conditional_propagator::options& conditional_propagator::get_options() const noexcept {
    return options_;
}

}  // namespace segmd::propagation
