#include <segmd/propagation/stitcher.hpp>

#include <stdexcept>
#include <utility>

#include <boost/log/trivial.hpp>

#include <segmd/propagation/errors.hpp>

namespace segmd::propagation {

trajectory_concatenator::~trajectory_concatenator() = default;

bounded_stitcher::bounded_stitcher(std::shared_ptr<trajectory_concatenator> concatenator, std::shared_ptr<process_limiter> limiter)
    : concatenator_{std::move(concatenator)}, limiter_{std::move(limiter)} {
    if (!concatenator_) {
        throw std::invalid_argument{"bounded_stitcher requires a concatenator"};
    }
    if (!limiter_) {
        throw std::invalid_argument{"bounded_stitcher requires a process limiter"};
    }
}

std::future<trajectory> bounded_stitcher::stitch(slice_plan plan,
                                                 std::filesystem::path tra_out,
                                                 std::optional<std::filesystem::path> struct_out,
                                                 bool overwrite) const {
    if (segments::total_frames(plan) == 0) {
        throw std::invalid_argument{"slice plan for '" + tra_out.string() + "' selects no frames"};
    }
    if (!overwrite && std::filesystem::exists(tra_out)) {
        throw output_already_exists{std::move(tra_out)};
    }

    BOOST_LOG_TRIVIAL(debug) << "stitching " << plan.size() << " slices (" << segments::total_frames(plan) << " frames) into "
                             << tra_out;

    // The task holds its own references so that it may outlive this stitcher.
    return std::async(std::launch::async,
                      [concatenator = concatenator_,
                       limiter = limiter_,
                       plan = std::move(plan),
                       tra_out = std::move(tra_out),
                       struct_out = std::move(struct_out),
                       overwrite] {
                          const auto permit = limiter->acquire();
                          return concatenator->concatenate(plan, tra_out, struct_out, overwrite);
                      });
}

const std::shared_ptr<process_limiter>& bounded_stitcher::limiter() const noexcept {
    return limiter_;
}

}  // namespace segmd::propagation
