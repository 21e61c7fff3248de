// Bounded stitcher tests

#include <segmd/propagation/stitcher.hpp>

#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <segmd/propagation/errors.hpp>

#include "test_utils.hpp"

using namespace std::chrono_literals;

namespace {

segmd::propagation::slice_plan three_frame_plan() {
    const auto t = segmd::propagation::test::make_segment("stitch", 5);
    return {{t, 0, 3, 1}};
}

}  // namespace

BOOST_AUTO_TEST_SUITE(bounded_stitcher_tests)

BOOST_AUTO_TEST_CASE(requires_collaborators) {
    using namespace segmd::propagation;

    BOOST_CHECK_THROW((bounded_stitcher{nullptr, std::make_shared<process_limiter>(1)}), std::invalid_argument);
    BOOST_CHECK_THROW((bounded_stitcher{std::make_shared<test::recording_concatenator>(), nullptr}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(stitches_plan) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch"};
    auto concatenator = std::make_shared<test::recording_concatenator>();
    const bounded_stitcher stitcher{concatenator, std::make_shared<process_limiter>(1)};

    const auto plan = three_frame_plan();
    const auto result = stitcher.stitch(plan, dir.path() / "out.xtc", std::nullopt, false).get();

    BOOST_CHECK_EQUAL(result.size(), 3);
    BOOST_CHECK_EQUAL(result.trajectory_files().front(), dir.path() / "out.xtc");
    BOOST_CHECK_EQUAL(result.structure_file(), std::filesystem::path{"stitch.gro"});
    BOOST_REQUIRE_EQUAL(concatenator->plans().size(), 1);
    BOOST_CHECK(concatenator->plans().front() == plan);
}

BOOST_AUTO_TEST_CASE(passes_structure_output) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_struct"};
    auto concatenator = std::make_shared<test::recording_concatenator>();
    const bounded_stitcher stitcher{concatenator, std::make_shared<process_limiter>(1)};

    const auto result = stitcher.stitch(three_frame_plan(), dir.path() / "out.xtc", dir.path() / "out.gro", false).get();
    BOOST_CHECK_EQUAL(result.structure_file(), dir.path() / "out.gro");
    BOOST_REQUIRE(concatenator->last_struct_out());
    BOOST_CHECK_EQUAL(*concatenator->last_struct_out(), dir.path() / "out.gro");
}

BOOST_AUTO_TEST_CASE(rejects_empty_plan) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_empty"};
    const bounded_stitcher stitcher{std::make_shared<test::recording_concatenator>(), std::make_shared<process_limiter>(1)};

    BOOST_CHECK_THROW(static_cast<void>(stitcher.stitch({}, dir.path() / "out.xtc", std::nullopt, false)), std::invalid_argument);

    const auto t = test::make_segment("stitch_empty", 5);
    const slice_plan nothing{{t, 3, 3, 1}};
    BOOST_CHECK_THROW(static_cast<void>(stitcher.stitch(nothing, dir.path() / "out.xtc", std::nullopt, false)), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(refuses_existing_output) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_exists"};
    auto concatenator = std::make_shared<test::recording_concatenator>();
    const bounded_stitcher stitcher{concatenator, std::make_shared<process_limiter>(1)};
    const auto out = dir.path() / "out.xtc";
    std::ofstream{out};

    try {
        static_cast<void>(stitcher.stitch(three_frame_plan(), out, std::nullopt, false));
        BOOST_FAIL("expected output_already_exists");
    } catch (const output_already_exists& e) {
        BOOST_CHECK_EQUAL(e.path(), out);
    }
    BOOST_CHECK_EQUAL(concatenator->calls(), 0);
}

BOOST_AUTO_TEST_CASE(overwrite_recomputes) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_overwrite"};
    auto concatenator = std::make_shared<test::recording_concatenator>(0ms, true);
    const bounded_stitcher stitcher{concatenator, std::make_shared<process_limiter>(1)};
    const auto out = dir.path() / "out.xtc";

    BOOST_CHECK_EQUAL(stitcher.stitch(three_frame_plan(), out, std::nullopt, false).get().size(), 3);
    BOOST_REQUIRE(std::filesystem::exists(out));

    // Second call on the same output is refused unless overwriting.
    BOOST_CHECK_THROW(static_cast<void>(stitcher.stitch(three_frame_plan(), out, std::nullopt, false)), output_already_exists);
    BOOST_CHECK_EQUAL(stitcher.stitch(three_frame_plan(), out, std::nullopt, true).get().size(), 3);
    BOOST_CHECK_EQUAL(concatenator->calls(), 2);
}

BOOST_AUTO_TEST_CASE(concatenator_errors_surface_from_future) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_error"};
    auto concatenator = std::make_shared<test::recording_concatenator>();
    auto limiter = std::make_shared<process_limiter>(1);
    const bounded_stitcher stitcher{concatenator, limiter};
    const auto out = dir.path() / "out.xtc";

    // Holding the only permit keeps the task waiting until the output shows up.
    auto held = std::make_unique<process_limiter::permit>(limiter->acquire());
    auto pending = stitcher.stitch(three_frame_plan(), out, std::nullopt, false);
    std::ofstream{out};
    held.reset();
    BOOST_CHECK_THROW(pending.get(), output_already_exists);
}

BOOST_AUTO_TEST_CASE(caps_concurrent_concatenations) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_cap"};
    auto concatenator = std::make_shared<test::recording_concatenator>(30ms);
    auto limiter = std::make_shared<process_limiter>(2);
    const bounded_stitcher stitcher{concatenator, limiter};

    std::vector<std::future<trajectory>> pending;
    for (int i = 0; i < 8; ++i) {
        pending.push_back(stitcher.stitch(three_frame_plan(), dir.path() / ("out" + std::to_string(i) + ".xtc"), std::nullopt, false));
    }
    for (auto& p : pending) {
        BOOST_CHECK_EQUAL(p.get().size(), 3);
    }

    BOOST_CHECK_EQUAL(concatenator->calls(), 8);
    BOOST_CHECK_LE(concatenator->peak_concurrency(), 2);
    BOOST_CHECK_GE(concatenator->peak_concurrency(), 1);
    BOOST_CHECK_EQUAL(limiter->available(), 2);
    BOOST_CHECK(stitcher.limiter() == limiter);
}

BOOST_AUTO_TEST_CASE(limiter_shared_between_stitchers) {
    using namespace segmd::propagation;

    const test::scoped_temp_dir dir{"stitch_shared"};
    auto concatenator = std::make_shared<test::recording_concatenator>(30ms);
    auto limiter = std::make_shared<process_limiter>(1);
    const bounded_stitcher first{concatenator, limiter};
    const bounded_stitcher second{concatenator, limiter};

    std::vector<std::future<trajectory>> pending;
    for (int i = 0; i < 3; ++i) {
        pending.push_back(first.stitch(three_frame_plan(), dir.path() / ("a" + std::to_string(i) + ".xtc"), std::nullopt, false));
        pending.push_back(second.stitch(three_frame_plan(), dir.path() / ("b" + std::to_string(i) + ".xtc"), std::nullopt, false));
    }
    for (auto& p : pending) {
        p.get();
    }
    BOOST_CHECK_EQUAL(concatenator->peak_concurrency(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
