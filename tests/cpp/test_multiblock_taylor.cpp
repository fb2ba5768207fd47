#include "optimization/errors.h"
#include "optimization/taylor.h"
#include "test/numerical_tests.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

using namespace taylix;
using taylix::test::CountingBilinear;

namespace {

bool close(double a, double b, double tol = 1e-10) {
    return std::abs(a - b) <= tol * (1.0 + std::abs(b));
}

bool close(const Eigen::VectorXd& a, const Eigen::VectorXd& b, double tol = 1e-10) {
    return a.size() == b.size() && (a - b).norm() <= tol * (1.0 + b.norm());
}

std::shared_ptr<CountingBilinear> make_bilinear() {
    Eigen::MatrixXd M(2, 3);
    M << 1.0, -2.0, 0.5,
         0.0, 3.0, -1.0;
    return std::make_shared<CountingBilinear>(M);
}

double f_ref(const CountingBilinear& f, const Eigen::VectorXd& w0, const Eigen::VectorXd& w1) {
    return w0.dot(f.M * w1) + 0.5 * w0.squaredNorm();
}

Eigen::VectorXd g0_ref(const CountingBilinear& f, const Eigen::VectorXd& w0, const Eigen::VectorXd& w1) {
    return f.M * w1 + w0;
}

Eigen::VectorXd g1_ref(const CountingBilinear& f, const Eigen::VectorXd& w0) {
    return f.M.transpose() * w0;
}

BlockPoint make_point(double shift) {
    Eigen::VectorXd a0(2), a1(3);
    a0 << 1.0 + shift, -0.5;
    a1 << 0.25, 2.0 - shift, -1.0;
    return {a0, a1};
}

template <typename Fn>
bool throws_structure_error(Fn fn) {
    try {
        fn();
    } catch (const StructureError&) {
        return true;
    }
    return false;
}

} // namespace

void test_pairwise_expansion() {
    std::cout << "Testing two-block expansion..." << std::endl;
    auto f = make_bilinear();
    BlockPoint a = make_point(0.0);
    MultiblockFirstOrderTaylorApproximation taylor(f, a, {0, 1});

    BlockPoint w = make_point(1.5);
    double expected = f_ref(*f, a[0], a[1])
                    + g0_ref(*f, a[0], a[1]).dot(w[0] - a[0])
                    + g1_ref(*f, a[0]).dot(w[1] - a[1]);
    assert(close(taylor.value(w), expected));
    assert(close(taylor.value(a), f_ref(*f, a[0], a[1])));

    // Second block only
    assert(close(taylor.gradient(w, 1), g1_ref(*f, a[0])));
    assert(close(taylor.gradient(w, 0), g0_ref(*f, a[0], a[1])));
    assert(taylor.num_blocks() == 2);

    for (int b = 0; b < 2; ++b) {
        auto check = test::check_gradient(taylor, w, b);
        assert(check.passed);
    }
    std::cout << "[PASS] Sum of per-block linear terms" << std::endl;
}

void test_block_selection() {
    std::cout << "\nTesting block selection from a larger joint point..." << std::endl;
    auto f = make_bilinear();
    // Joint point with 3 blocks; the function takes blocks 2 and 0, in that order
    Eigen::VectorXd p0(3), p1(4), p2(2);
    p0 << 1.0, 0.0, -1.0;
    p1 << 9.0, 9.0, 9.0, 9.0;
    p2 << 0.5, 2.0;
    BlockPoint joint = {p0, p1, p2};

    MultiblockFirstOrderTaylorApproximation taylor(f, joint, {2, 0});
    assert(taylor.local_point()[0] == p2);
    assert(taylor.local_point()[1] == p0);

    BlockPoint w = {Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(3)};
    double expected = f_ref(*f, p2, p0)
                    + g0_ref(*f, p2, p0).dot(w[0] - p2)
                    + g1_ref(*f, p2).dot(w[1] - p0);
    assert(close(taylor.value(w), expected));
    std::cout << "[PASS] Expansion uses the indexed blocks" << std::endl;
}

void test_cache_and_recenter() {
    std::cout << "\nTesting multiblock caching and recenter..." << std::endl;
    auto f = make_bilinear();
    BlockPoint a = make_point(0.0);
    BlockPoint b = make_point(-2.0);
    MultiblockFirstOrderTaylorApproximation taylor(f, a, {0, 1});

    assert(f->counts->value == 0);
    taylor.value(b);
    taylor.value(a);
    taylor.gradient(b, 0);
    taylor.gradient(b, 1);
    // One value call, all block gradients computed together
    assert(f->counts->value == 1);
    assert(f->counts->gradient == 2);

    taylor.recenter(b);
    assert(close(taylor.value(b), f_ref(*f, b[0], b[1])));
    assert(close(taylor.gradient(a, 1), g1_ref(*f, b[0])));
    assert(f->counts->value == 2);
    assert(f->counts->gradient == 4);
    assert(f->counts->reset == 1);

    assert(taylor.lipschitz_constant(a, 0) > 0.0);
    assert(taylor.lipschitz_constant(a, 0) == taylor.lipschitz_constant(b, 1));
    std::cout << "[PASS] Lazy cache, cleared on recenter" << std::endl;
}

void test_structure_errors() {
    std::cout << "\nTesting block index validation..." << std::endl;
    auto f = make_bilinear();
    BlockPoint a = make_point(0.0);

    assert(throws_structure_error([&] { MultiblockFirstOrderTaylorApproximation t(f, a, {0, 5}); }));
    assert(throws_structure_error([&] { MultiblockFirstOrderTaylorApproximation t(f, a, {-1, 0}); }));
    assert(throws_structure_error([&] { MultiblockFirstOrderTaylorApproximation t(f, a, {}); }));

    MultiblockFirstOrderTaylorApproximation taylor(f, a, {0, 1});
    assert(throws_structure_error([&] { taylor.value({a[0]}); }));
    assert(throws_structure_error([&] { taylor.gradient(a, 2); }));
    assert(throws_structure_error([&] { taylor.gradient(a, -1); }));
    assert(throws_structure_error([&] { taylor.recenter({a[0]}); }));
    std::cout << "[PASS] Out-of-range indices raise StructureError" << std::endl;
}

void test_clone() {
    std::cout << "\nTesting multiblock clone..." << std::endl;
    auto f = make_bilinear();
    BlockPoint a = make_point(0.0);
    BlockPoint b = make_point(1.0);
    MultiblockFirstOrderTaylorApproximation taylor(f, a, {0, 1});

    auto copy = taylor.clone();
    copy->recenter(b);
    assert(taylor.point()[0] == a[0]);
    assert(close(copy->value(b), f_ref(*f, b[0], b[1])));
    assert(close(taylor.value(a), f_ref(*f, a[0], a[1])));
    std::cout << "[PASS] Clone recenters independently" << std::endl;
}

int main() {
    std::cout << "--- Multiblock Taylor Approximation Tests ---" << std::endl;
    test_pairwise_expansion();
    test_block_selection();
    test_cache_and_recenter();
    test_structure_errors();
    test_clone();
    std::cout << "\nAll multiblock Taylor tests passed!" << std::endl;
    return 0;
}
