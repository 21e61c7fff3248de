// Condition evaluator tests

#include <segmd/propagation/conditions.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/test/unit_test.hpp>

#if __has_include(<xtensor/generators/xbuilder.hpp>)
#include <xtensor/generators/xbuilder.hpp>
#else
#include <xtensor/xbuilder.hpp>
#endif

#include "test_utils.hpp"

using namespace std::chrono_literals;

namespace {

// Rendezvous of a fixed number of parties; records whether everyone arrived in time.
class rendezvous {
   public:
    explicit rendezvous(int parties) : parties_{parties} {}

    bool arrive_and_wait(std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        ++arrived_;
        all_arrived_.notify_all();
        return all_arrived_.wait_for(lock, timeout, [this] { return arrived_ >= parties_; });
    }

   private:
    const int parties_;
    int arrived_ = 0;
    std::mutex mutex_;
    std::condition_variable all_arrived_;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(condition_evaluator_tests)

BOOST_AUTO_TEST_CASE(requires_conditions) {
    using namespace segmd::propagation;

    BOOST_CHECK_THROW(condition_evaluator{{}}, std::invalid_argument);
    BOOST_CHECK_THROW((condition_evaluator{{blocking_condition{"empty", nullptr}}}), std::invalid_argument);
    BOOST_CHECK_THROW((condition_evaluator{{suspending_condition{"empty", nullptr}}}), std::invalid_argument);
    BOOST_CHECK_THROW(make_suspending("empty", nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(names_and_kinds) {
    using namespace segmd::propagation;

    auto table = std::make_shared<test::value_table>();
    const state_condition b = test::table_blocking(table, 0);
    const state_condition s = test::table_suspending(table, 1);
    BOOST_CHECK_EQUAL(condition_name(b), "blocking_0");
    BOOST_CHECK_EQUAL(condition_name(s), "suspending_1");
    BOOST_CHECK(is_blocking(b));
    BOOST_CHECK(!is_blocking(s));
}

BOOST_AUTO_TEST_CASE(mixed_conditions_keep_input_order) {
    using namespace segmd::propagation;

    auto table = std::make_shared<test::value_table>();
    const auto traj = test::make_segment("mixed", 4);
    table->set_true(traj, 0, 0);
    table->set_true(traj, 1, 1);
    table->set_true(traj, 2, 2);

    // The suspending condition finishes well after both blocking ones.
    const condition_evaluator evaluator{{
        test::table_blocking(table, 0),
        test::table_suspending(table, 1, 50ms),
        test::table_blocking(table, 2),
    }};

    const auto results = evaluator.evaluate(traj);
    BOOST_REQUIRE_EQUAL(results.size(), 3);
    for (std::size_t c = 0; c < 3; ++c) {
        BOOST_REQUIRE_EQUAL(results[c].size(), 4);
        for (std::size_t f = 0; f < 4; ++f) {
            BOOST_CHECK_EQUAL(results[c](f), c == f);
        }
    }
}

BOOST_AUTO_TEST_CASE(order_independent_of_completion) {
    using namespace segmd::propagation;

    const auto traj = test::make_segment("order", 2);
    std::atomic<int> completion{0};
    std::atomic<int> slow_finished_at{-1};
    std::atomic<int> fast_finished_at{-1};

    const auto marked = [&](std::chrono::milliseconds delay, std::atomic<int>& finished_at, bool first_frame) {
        return make_suspending("marked", [&completion, finished = &finished_at, delay, first_frame](const trajectory&) {
            std::this_thread::sleep_for(delay);
            *finished = completion++;
            return condition_values{first_frame, !first_frame};
        });
    };

    const condition_evaluator evaluator{{marked(60ms, slow_finished_at, true), marked(0ms, fast_finished_at, false)}};
    const auto results = evaluator.evaluate(traj);

    BOOST_CHECK_LT(fast_finished_at.load(), slow_finished_at.load());
    BOOST_CHECK(results[0](0));
    BOOST_CHECK(!results[0](1));
    BOOST_CHECK(!results[1](0));
    BOOST_CHECK(results[1](1));
}

BOOST_AUTO_TEST_CASE(suspending_conditions_run_concurrently) {
    using namespace segmd::propagation;

    const auto traj = test::make_segment("concurrent", 3);
    rendezvous meeting{2};
    std::atomic<int> met{0};

    const auto waiting = [&](std::string name) {
        return make_suspending(std::move(name), [&](const trajectory& t) {
            if (meeting.arrive_and_wait(5s)) {
                ++met;
            }
            return condition_values(xt::zeros<bool>({t.size()}));
        });
    };

    const condition_evaluator evaluator{{waiting("first"), waiting("second")}};
    BOOST_CHECK_NO_THROW(evaluator.evaluate(traj));
    BOOST_CHECK_EQUAL(met.load(), 2);
}

BOOST_AUTO_TEST_CASE(rejects_wrong_shape) {
    using namespace segmd::propagation;

    auto table = std::make_shared<test::value_table>();
    const auto traj = test::make_segment("shape", 4);
    table->set(traj, 0, {true, false, false});

    BOOST_CHECK_THROW(condition_evaluator{{test::table_blocking(table, 0)}}.evaluate(traj), inconsistent_condition_shape);
    BOOST_CHECK_THROW(condition_evaluator{{test::table_suspending(table, 0)}}.evaluate(traj), inconsistent_condition_shape);
}

BOOST_AUTO_TEST_CASE(condition_errors_propagate_unchanged) {
    using namespace segmd::propagation;

    const auto traj = test::make_segment("failing", 2);
    const blocking_condition failing_blocking{"failing", [](const trajectory&) -> condition_values {
                                                  throw std::runtime_error{"analysis failed"};
                                              }};
    const auto failing_suspending = make_suspending("failing", [](const trajectory&) -> condition_values {
        throw std::domain_error{"analysis failed"};
    });

    BOOST_CHECK_THROW(condition_evaluator{{failing_blocking}}.evaluate(traj), std::runtime_error);
    BOOST_CHECK_THROW(condition_evaluator{{failing_suspending}}.evaluate(traj), std::domain_error);
}

BOOST_AUTO_TEST_CASE(rejects_invalid_future) {
    using namespace segmd::propagation;

    const suspending_condition broken{"broken", [](const trajectory&) { return std::future<condition_values>{}; }};
    BOOST_CHECK_THROW(condition_evaluator{{broken}}.evaluate(test::make_segment("broken", 1)), std::logic_error);
}

BOOST_AUTO_TEST_CASE(evaluate_matrix_shape) {
    using namespace segmd::propagation;

    auto table = std::make_shared<test::value_table>();
    const auto traj = test::make_segment("matrix", 5);
    table->set_true(traj, 1, 3);

    const condition_evaluator evaluator{{test::table_blocking(table, 0), test::table_suspending(table, 1)}};
    const auto m = evaluator.evaluate_matrix(traj);
    BOOST_REQUIRE_EQUAL(m.dimension(), 2);
    BOOST_CHECK_EQUAL(m.shape()[0], 2);
    BOOST_CHECK_EQUAL(m.shape()[1], 5);
    BOOST_CHECK(m(1, 3));
    BOOST_CHECK(!m(0, 3));

    const auto matrices = evaluator.evaluate_matrices({traj, test::make_segment("other", 2)});
    BOOST_REQUIRE_EQUAL(matrices.size(), 2);
    BOOST_CHECK_EQUAL(matrices[1].shape()[1], 2);
}

BOOST_AUTO_TEST_CASE(evaluate_one_calls_only_that_condition) {
    using namespace segmd::propagation;

    auto table = std::make_shared<test::value_table>();
    const auto traj = test::make_segment("one", 3);
    table->set_true(traj, 1, 2);

    const condition_evaluator evaluator{{test::table_blocking(table, 0), test::table_suspending(table, 1)}};
    const auto values = evaluator.evaluate_one(1, traj);
    BOOST_CHECK(values(2));
    BOOST_CHECK_EQUAL(table->calls(0), 0);
    BOOST_CHECK_EQUAL(table->calls(1), 1);

    BOOST_CHECK_THROW(evaluator.evaluate_one(2, traj), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(no_caching) {
    using namespace segmd::propagation;

    auto table = std::make_shared<test::value_table>();
    const auto traj = test::make_segment("cache", 3);
    const condition_evaluator evaluator{{test::table_blocking(table, 0)}};
    static_cast<void>(evaluator.evaluate(traj));
    static_cast<void>(evaluator.evaluate(traj));
    BOOST_CHECK_EQUAL(table->calls(0), 2);
}

BOOST_AUTO_TEST_SUITE_END()
