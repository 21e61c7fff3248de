#include <segmd/segments/slice_plan.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace segmd::segments {

namespace {

// Bounds of a slice in ascending frame order, as [low, high). Empty when low >= high.
struct frame_bounds {
    std::size_t low;
    std::size_t high;
};

frame_bounds bounds_of(const slice& s) noexcept {
    const std::size_t size = s.segment.size();
    if (s.stride > 0) {
        const std::size_t high = std::min(s.stop.value_or(size), size);
        return {std::min(s.start, high), high};
    }
    if (size == 0) {
        return {0, 0};
    }
    const std::size_t first = std::min(s.start, size - 1);
    const std::size_t low = s.stop ? *s.stop + 1 : 0;
    if (low > first) {
        return {0, 0};
    }
    return {low, first + 1};
}

void check_terminal(const std::vector<trajectory>& segments, frame_address terminal) {
    if (segments.empty()) {
        throw std::invalid_argument{"cannot build a slice plan without segments"};
    }
    if (terminal.segment >= segments.size() || terminal.frame >= segments[terminal.segment].size()) {
        std::ostringstream buffer;
        buffer << "terminal frame " << terminal.frame << " of segment " << terminal.segment
               << " does not exist in a chain of " << segments.size() << " segments";
        throw std::out_of_range{buffer.str()};
    }
}

}  // namespace

std::size_t slice::frame_count() const noexcept {
    if (stride != 1 && stride != -1) {
        return 0;
    }
    const auto b = bounds_of(*this);
    return b.high > b.low ? b.high - b.low : 0;
}

std::vector<std::size_t> slice::frames() const {
    std::vector<std::size_t> result;
    const auto b = bounds_of(*this);
    if (b.high <= b.low || (stride != 1 && stride != -1)) {
        return result;
    }
    result.reserve(b.high - b.low);
    for (std::size_t f = b.low; f < b.high; ++f) {
        result.push_back(f);
    }
    if (stride < 0) {
        std::reverse(result.begin(), result.end());
    }
    return result;
}

std::size_t total_frames(const slice_plan& plan) noexcept {
    std::size_t total = 0;
    for (const auto& s : plan) {
        total += s.frame_count();
    }
    return total;
}

slice_plan build_chain_plan(const std::vector<trajectory>& segments,
                            frame_address terminal,
                            chain_direction direction,
                            shared_start start) {
    check_terminal(segments, terminal);

    const bool exclude_start = (start == shared_start::k_exclude);
    slice_plan plan;
    plan.reserve(terminal.segment + 1);

    if (direction == chain_direction::k_forward) {
        // Frame 0 of segment 0 is the starting configuration.
        for (std::size_t i = 0; i < terminal.segment; ++i) {
            plan.push_back({segments[i], (i == 0 && exclude_start) ? 1u : 0u, std::nullopt, 1});
        }
        const std::size_t first = (terminal.segment == 0 && exclude_start) ? 1 : 0;
        plan.push_back({segments[terminal.segment], first, terminal.frame + 1, 1});
        return plan;
    }

    // Backward: the terminal frame comes first and the starting configuration last.
    const auto until_start = [&](std::size_t i) -> std::optional<std::size_t> {
        if (i == 0 && exclude_start) {
            return 0;
        }
        return std::nullopt;
    };
    plan.push_back({segments[terminal.segment], terminal.frame, until_start(terminal.segment), -1});
    for (std::size_t i = terminal.segment; i-- > 0;) {
        const std::size_t last = segments[i].empty() ? 0 : segments[i].size() - 1;
        plan.push_back({segments[i], last, until_start(i), -1});
    }
    return plan;
}

slice_plan build_forward_plan(const std::vector<trajectory>& segments, frame_address terminal) {
    return build_chain_plan(segments, terminal, chain_direction::k_forward, shared_start::k_include);
}

slice_plan build_transition_plan(const std::vector<trajectory>& minus_segments,
                                 frame_address minus_terminal,
                                 const std::vector<trajectory>& plus_segments,
                                 frame_address plus_terminal) {
    auto plan = build_chain_plan(minus_segments, minus_terminal, chain_direction::k_backward, shared_start::k_include);
    auto plus = build_chain_plan(plus_segments, plus_terminal, chain_direction::k_forward, shared_start::k_exclude);
    plan.insert(plan.end(), std::make_move_iterator(plus.begin()), std::make_move_iterator(plus.end()));
    return plan;
}

}  // namespace segmd::segments
