#include <segmd/propagation/conditions.hpp>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/log/trivial.hpp>

namespace segmd::propagation {

namespace {

struct name_visitor {
    std::string_view operator()(const blocking_condition& c) const noexcept {
        return c.name;
    }
    std::string_view operator()(const suspending_condition& c) const noexcept {
        return c.name;
    }
};

condition_values checked(condition_values values, const state_condition& c, const trajectory& traj) {
    if (values.dimension() != 1 || values.shape()[0] != traj.size()) {
        std::ostringstream buffer;
        buffer << "condition `" << condition_name(c) << "` returned " << values.size() << " values in " << values.dimension()
               << " dimensions for " << traj;
        throw inconsistent_condition_shape{buffer.str()};
    }
    return values;
}

std::future<condition_values> start(const suspending_condition& c, const trajectory& traj) {
    auto pending = c.fn(traj);
    if (!pending.valid()) {
        throw std::logic_error{"suspending condition `" + c.name + "` returned an invalid future"};
    }
    return pending;
}

}  // namespace

std::string_view condition_name(const state_condition& c) noexcept {
    return std::visit(name_visitor{}, c);
}

bool is_blocking(const state_condition& c) noexcept {
    return std::holds_alternative<blocking_condition>(c);
}

suspending_condition make_suspending(std::string name, std::function<condition_values(const trajectory&)> fn) {
    if (!fn) {
        throw std::invalid_argument{"condition `" + name + "` has no function"};
    }
    return {std::move(name), [fn = std::move(fn)](const trajectory& traj) {
                return std::async(std::launch::async, fn, traj);
            }};
}

condition_evaluator::condition_evaluator(std::vector<state_condition> conditions) : conditions_{std::move(conditions)} {
    if (conditions_.empty()) {
        throw std::invalid_argument{"at least one condition is required"};
    }

    std::ostringstream blocking;
    bool any_blocking = false;
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        const bool has_fn = std::visit([](const auto& c) { return static_cast<bool>(c.fn); }, conditions_[i]);
        if (!has_fn) {
            throw std::invalid_argument{"condition " + std::to_string(i) + " has no function"};
        }
        if (is_blocking(conditions_[i])) {
            blocking << (any_blocking ? ", " : "") << i << " (`" << condition_name(conditions_[i]) << "`)";
            any_blocking = true;
        }
    }
    if (any_blocking) {
        BOOST_LOG_TRIVIAL(warning) << "Blocking conditions will stall their caller while they are evaluated; prefer "
                                   << "suspending conditions. Blocking: " << blocking.str();
    }
}

std::vector<condition_values> condition_evaluator::evaluate(const trajectory& traj) const {
    std::vector<std::optional<std::future<condition_values>>> pending(conditions_.size());
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        if (const auto* s = std::get_if<suspending_condition>(&conditions_[i])) {
            pending[i].emplace(start(*s, traj));
        }
    }

    std::vector<condition_values> results(conditions_.size());
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        if (const auto* b = std::get_if<blocking_condition>(&conditions_[i])) {
            results[i] = checked(b->fn(traj), conditions_[i], traj);
        }
    }

    for (std::size_t i = 0; i < conditions_.size(); ++i) {
        if (pending[i]) {
            results[i] = checked(pending[i]->get(), conditions_[i], traj);
        }
    }
    return results;
}

condition_matrix condition_evaluator::evaluate_matrix(const trajectory& traj) const {
    return segments::make_condition_matrix(evaluate(traj), traj.size());
}

std::vector<condition_matrix> condition_evaluator::evaluate_matrices(const std::vector<trajectory>& trajs) const {
    std::vector<condition_matrix> matrices;
    matrices.reserve(trajs.size());
    for (const auto& t : trajs) {
        matrices.push_back(evaluate_matrix(t));
    }
    return matrices;
}

condition_values condition_evaluator::evaluate_one(std::size_t index, const trajectory& traj) const {
    if (index >= conditions_.size()) {
        throw std::out_of_range{"condition index " + std::to_string(index) + " out of range (" +
                                std::to_string(conditions_.size()) + " conditions)"};
    }
    const auto& c = conditions_[index];
    if (const auto* s = std::get_if<suspending_condition>(&c)) {
        return checked(start(*s, traj).get(), c, traj);
    }
    return checked(std::get<blocking_condition>(c).fn(traj), c, traj);
}

std::size_t condition_evaluator::size() const noexcept {
    return conditions_.size();
}

const std::vector<state_condition>& condition_evaluator::conditions() const noexcept {
    return conditions_;
}

}  // namespace segmd::propagation
