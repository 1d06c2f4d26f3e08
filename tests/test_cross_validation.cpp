#undef NDEBUG

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "healthopt/cross_validation.hpp"
#include "healthopt/errors.hpp"
#include "test_support.hpp"

using healthopt::KNNOptions;
using healthopt_test::throws_as;

namespace {

void test_linear_population() {
    auto data = healthopt_test::activity_dataset(40);
    data.push_back(healthopt::make_entry(healthopt_test::day_of(60), healthopt_test::low_anchor()));

    KNNOptions opt;
    opt.k = 3;
    const auto res = healthopt::leave_one_out(data, opt);
    assert(res.k == 3);
    assert(res.samples == 40);
    assert(res.mae >= 0.0);
    assert(res.mae <= res.rmse + 1e-12);
    assert(res.mae < 0.75);
    healthopt_test::report("leave-one-out on a smooth population");
}

void test_thread_count_does_not_change_result() {
    const auto data = healthopt_test::activity_dataset(25);
    KNNOptions opt;
    opt.k = 5;

    healthopt::set_worker_threads(1);
    const auto one = healthopt::leave_one_out(data, opt);
    healthopt::set_worker_threads(4);
    const auto many = healthopt::leave_one_out(data, opt);
    assert(one.mae == many.mae);
    assert(one.rmse == many.rmse);
    assert(healthopt::max_worker_threads() >= 1);
    healthopt_test::report("thread count");
}

void test_needs_two_rated_entries() {
    const auto one = healthopt_test::activity_dataset(1);
    assert(throws_as<healthopt::EmptyTrainingSetError>([&] { (void)healthopt::leave_one_out(one, KNNOptions{}); }));

    KNNOptions bad;
    bad.k = 0;
    const auto data = healthopt_test::activity_dataset(5);
    assert(throws_as<std::invalid_argument>([&] { (void)healthopt::leave_one_out(data, bad); }));
    healthopt_test::report("leave-one-out errors");
}

}  // namespace

int main() {
    test_linear_population();
    test_thread_count_does_not_change_result();
    test_needs_two_rated_entries();
    std::cout << "cross validation: all tests passed\n";
    return 0;
}
