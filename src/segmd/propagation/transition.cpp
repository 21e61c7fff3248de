#include <segmd/propagation/transition.hpp>

#include <stdexcept>
#include <string>
#include <utility>

#include <segmd/segments/frame_locator.hpp>

namespace segmd::propagation {

segments::frame_address locate_chain_terminal(const condition_evaluator& conditions,
                                              std::size_t condition,
                                              const std::vector<trajectory>& chain) {
    if (condition >= conditions.size()) {
        throw std::out_of_range{"condition index " + std::to_string(condition) + " out of range (" +
                                std::to_string(conditions.size()) + " conditions)"};
    }
    if (chain.empty()) {
        throw std::invalid_argument{"segment chain is empty"};
    }

    std::vector<condition_matrix> matrices;
    matrices.reserve(chain.size());
    for (const auto& t : chain) {
        matrices.push_back(segments::make_condition_matrix({conditions.evaluate_one(condition, t)}, t.size()));
    }

    const auto hit = segments::locate_first_true_frame(matrices);
    if (!hit) {
        throw std::invalid_argument{"condition " + std::to_string(condition) + " is not fulfilled on any frame of the " +
                                    std::to_string(chain.size()) + " segments"};
    }
    return hit->address;
}

slice_plan plan_transition_from_segment_chains(const std::vector<trajectory>& minus_trajs,
                                               std::size_t minus_condition,
                                               const std::vector<trajectory>& plus_trajs,
                                               std::size_t plus_condition,
                                               const condition_evaluator& conditions) {
    const auto minus_terminal = locate_chain_terminal(conditions, minus_condition, minus_trajs);
    const auto plus_terminal = locate_chain_terminal(conditions, plus_condition, plus_trajs);
    return segments::build_transition_plan(minus_trajs, minus_terminal, plus_trajs, plus_terminal);
}

trajectory construct_transition_from_segment_chains(const std::vector<trajectory>& minus_trajs,
                                                    std::size_t minus_condition,
                                                    const std::vector<trajectory>& plus_trajs,
                                                    std::size_t plus_condition,
                                                    const condition_evaluator& conditions,
                                                    const std::filesystem::path& tra_out,
                                                    const std::optional<std::filesystem::path>& struct_out,
                                                    bool overwrite,
                                                    const bounded_stitcher& stitcher) {
    auto plan = plan_transition_from_segment_chains(minus_trajs, minus_condition, plus_trajs, plus_condition, conditions);
    return stitcher.stitch(std::move(plan), tra_out, struct_out, overwrite).get();
}

}  // namespace segmd::propagation
