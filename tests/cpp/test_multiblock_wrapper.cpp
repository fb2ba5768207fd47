#include "optimization/errors.h"
#include "optimization/multiblock.h"
#include "optimization/penalty.h"
#include "optimization/taylor.h"
#include "optimization/taylor_wrapper.h"
#include "test/numerical_tests.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <variant>

using namespace taylix;
using taylix::test::CountingBilinear;
using taylix::test::CountingQuadratic;

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

std::shared_ptr<CountingQuadratic> make_quadratic() {
    Eigen::MatrixXd A(3, 3);
    A << 2, 0, 1,
         0, 1, 0,
         1, 0, 3;
    Eigen::VectorXd b(3);
    b << 0.5, 0.0, -1.0;
    return std::make_shared<CountingQuadratic>(A, b);
}

double bil_ref(const CountingBilinear& f, const Eigen::VectorXd& w0, const Eigen::VectorXd& w1) {
    return w0.dot(f.M * w1) + 0.5 * w0.squaredNorm();
}

Eigen::VectorXd bil_g0(const CountingBilinear& f, const Eigen::VectorXd& w0, const Eigen::VectorXd& w1) {
    return f.M * w1 + w0;
}

Eigen::VectorXd bil_g1(const CountingBilinear& f, const Eigen::VectorXd& w0) {
    return f.M.transpose() * w0;
}

double quad_ref(const CountingQuadratic& q, const Eigen::VectorXd& x) {
    return 0.5 * x.dot(q.A * x) + q.b.dot(x);
}

Eigen::VectorXd quad_grad(const CountingQuadratic& q, const Eigen::VectorXd& x) {
    return 0.5 * (q.A + q.A.transpose()) * x + q.b;
}

BlockPoint make_point(double shift) {
    Eigen::VectorXd a0(2), a1(3);
    a0 << 1.0 + shift, -0.5 * shift;
    a1 << 0.25, 2.0 - shift, -1.0 + shift;
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

/**
 * Two blocks: Taylor bilinear loss on (0, 1), exact L1 on block 0 and a
 * Taylor quadratic penalty on block 1, all centered away from the tests' points.
 */
struct Problem {
    std::shared_ptr<CountingBilinear> bil = make_bilinear();
    std::shared_ptr<CountingQuadratic> quad = make_quadratic();
    double lambda = 0.3;
    MultiblockCompositeObjective composite{2};

    Problem() {
        BlockPoint far = make_point(10.0);
        composite.add_loss(0, 1, std::make_shared<MultiblockFirstOrderTaylorApproximation>(
            bil, far, std::vector<int>{0, 1}));
        composite.add_decoupled_penalty(0, std::make_shared<L1Penalty>(lambda));
        composite.add_coupled_penalty(1, std::make_shared<FirstOrderTaylorApproximation>(quad, far[1]));
    }

    double surrogate_value(const BlockPoint& a, const BlockPoint& w) const {
        return bil_ref(*bil, a[0], a[1])
             + bil_g0(*bil, a[0], a[1]).dot(w[0] - a[0])
             + bil_g1(*bil, a[0]).dot(w[1] - a[1])
             + lambda * w[0].lpNorm<1>()
             + quad_ref(*quad, a[1]) + quad_grad(*quad, a[1]).dot(w[1] - a[1]);
    }
};

} // namespace

void test_composite_surrogate() {
    std::cout << "Testing multiblock composite surrogate..." << std::endl;
    Problem p;
    BlockPoint a = make_point(0.0);
    BlockPoint w = make_point(-1.3);

    FirstOrderTaylorWrapper taylor;
    auto surrogate = taylor(p.composite, a);

    assert(close(surrogate->value(w), p.surrogate_value(a, w)));
    assert(close(surrogate->value(a), p.surrogate_value(a, a)));

    L1Penalty l1(p.lambda);
    assert(close(surrogate->gradient(w, 0), bil_g0(*p.bil, a[0], a[1]) + l1.gradient(w[0])));
    assert(close(surrogate->gradient(w, 1), bil_g1(*p.bil, a[0]) + quad_grad(*p.quad, a[1])));

    auto* typed = dynamic_cast<MultiblockCompositeObjective*>(surrogate.get());
    assert(typed != nullptr);
    auto* loss = dynamic_cast<MultiblockLinearizedObjective*>(typed->losses[0][1][0].get());
    assert(loss != nullptr);
    assert(std::holds_alternative<MultiblockTaylorWrapped>(loss->taylor_state()));
    assert(dynamic_cast<LinearizedObjective*>(typed->coupled_penalties[1][0].get()) != nullptr);
    assert(dynamic_cast<L1Penalty*>(typed->decoupled_penalties[0][0].get()) != nullptr);
    std::cout << "[PASS] Losses linearized over their block pair, penalties exact" << std::endl;
}

void test_composite_recenter() {
    std::cout << "\nTesting multiblock recenter cascade..." << std::endl;
    Problem p;
    BlockPoint a = make_point(0.0);
    BlockPoint b = make_point(2.5);
    BlockPoint w = make_point(-0.7);

    FirstOrderTaylorWrapper taylor;
    auto surrogate = taylor(p.composite, a);
    surrogate->recenter(b);

    assert(close(surrogate->value(w), p.surrogate_value(b, w)));
    assert(close(surrogate->gradient(w, 1), bil_g1(*p.bil, b[0]) + quad_grad(*p.quad, b[1])));

    auto* typed = dynamic_cast<MultiblockCompositeObjective*>(surrogate.get());
    auto* loss = dynamic_cast<MultiblockLinearizedObjective*>(typed->losses[0][1][0].get());
    assert(loss->point()[0] == b[0]);
    assert(loss->point()[1] == b[1]);
    auto* penalty = dynamic_cast<LinearizedObjective*>(typed->coupled_penalties[1][0].get());
    assert(penalty->point() == b[1]);

    // The caller's composite keeps its original center
    auto* original = dynamic_cast<MultiblockTaylorApproximation*>(p.composite.losses[0][1][0].get());
    assert(original->point()[0] == make_point(10.0)[0]);
    std::cout << "[PASS] Every surrogate moved to the new joint point" << std::endl;
}

void test_plain_multiblock() {
    std::cout << "\nTesting wrap of a plain multiblock function..." << std::endl;
    auto f = make_bilinear();
    BlockPoint a = make_point(0.0);
    BlockPoint w = make_point(3.0);

    FirstOrderTaylorWrapper taylor;
    auto surrogate = taylor(*f, a);
    assert(f->counts->value == 1);
    assert(f->counts->gradient == 2);

    double expected = bil_ref(*f, a[0], a[1])
                    + bil_g0(*f, a[0], a[1]).dot(w[0] - a[0])
                    + bil_g1(*f, a[0]).dot(w[1] - a[1]);
    assert(close(surrogate->value(w), expected));
    assert(close(surrogate->gradient(w, 1), bil_g1(*f, a[0])));
    assert(f->counts->value == 1);
    assert(f->counts->gradient == 2);

    // Wrapping the surrogate again is refused
    bool thrown = false;
    try {
        taylor(*surrogate, a);
    } catch (const DoubleWrapError&) {
        thrown = true;
    }
    assert(thrown);

    // Two-block function, three-block point
    BlockPoint three = {a[0], a[1], Eigen::VectorXd::Zero(4)};
    assert(throws_structure_error([&] { taylor(*f, three); }));
    std::cout << "[PASS] Surrogate over all blocks, double wrap refused" << std::endl;
}

void test_direct_composite_wrap() {
    std::cout << "\nTesting the multiblock wrap routine on a composite..." << std::endl;
    auto f = make_bilinear();
    MultiblockCompositeObjective composite(2);
    composite.add_loss(0, 1, f);
    composite.add_decoupled_penalty(0, std::make_shared<L1Penalty>(0.5));
    BlockPoint a = make_point(0.0);
    BlockPoint w = make_point(1.7);

    auto surrogate = FirstOrderTaylorWrapper::wrap_multiblock(
        std::shared_ptr<MultiblockObjective>(composite.clone()), a, {0, 1});

    double expected = bil_ref(*f, a[0], a[1])
                    + bil_g0(*f, a[0], a[1]).dot(w[0] - a[0])
                    + bil_g1(*f, a[0]).dot(w[1] - a[1])
                    + 0.5 * w[0].lpNorm<1>();
    assert(close(surrogate->value(w), expected));
    assert(close(surrogate->gradient(w, 0),
                 bil_g0(*f, a[0], a[1]) + 0.5 * w[0].array().sign().matrix()));
    assert(surrogate->block_indices() == std::vector<int>({0, 1}));
    std::cout << "[PASS] Smooth part linearized, L1 part exact" << std::endl;
}

void test_chain_rule_gradient() {
    std::cout << "\nTesting block gradients with a diagonal loss..." << std::endl;
    Eigen::MatrixXd D(2, 2);
    D << 1.0, 0.5,
         -0.5, 2.0;
    MultiblockCompositeObjective composite(2);
    composite.add_loss(0, 0, std::make_shared<CountingBilinear>(D));
    composite.add_loss(0, 1, make_bilinear());
    composite.add_decoupled_penalty(1, std::make_shared<L2Penalty>(0.8));

    BlockPoint w = make_point(0.4);
    for (int b = 0; b < 2; ++b) {
        auto check = test::check_gradient(composite, w, b);
        if (!check.passed) test::print_gradient_check(check);
        assert(check.passed);
    }
    std::cout << "[PASS] Both argument slots of a diagonal loss contribute" << std::endl;
}

void test_structure_errors() {
    std::cout << "\nTesting malformed multiblock composites..." << std::endl;
    BlockPoint a = make_point(0.0);
    FirstOrderTaylorWrapper taylor;

    // Loss stored at (1, 0) but approximating blocks {0, 1}
    MultiblockCompositeObjective swapped(2);
    swapped.add_loss(1, 0, std::make_shared<MultiblockFirstOrderTaylorApproximation>(
        make_bilinear(), a, std::vector<int>{0, 1}));
    assert(throws_structure_error([&] { taylor(swapped, a); }));

    Problem p;
    assert(throws_structure_error([&] { taylor(p.composite, BlockPoint{a[0]}); }));

    MultiblockCompositeObjective ragged(2);
    ragged.losses[1].pop_back();
    assert(throws_structure_error([&] { taylor(ragged, a); }));
    assert(throws_structure_error([&] { ragged.value(a); }));

    assert(throws_structure_error([] { MultiblockCompositeObjective empty(0); }));
    MultiblockCompositeObjective small(2);
    assert(throws_structure_error([&] { small.add_loss(0, 2, make_bilinear()); }));
    assert(throws_structure_error([&] { small.add_decoupled_penalty(-1, std::make_shared<L1Penalty>()); }));
    std::cout << "[PASS] StructureError on mismatched layouts" << std::endl;
}

void test_wrap_block_selection() {
    std::cout << "\nTesting wrap of a Taylor approximation over selected blocks..." << std::endl;
    auto f = make_bilinear();
    Eigen::VectorXd p0(3), p1(4), p2(2);
    p0 << 1.0, 0.0, -1.0;
    p1 << 9.0, 9.0, 9.0, 9.0;
    p2 << 0.5, 2.0;
    BlockPoint joint = {p0, p1, p2};

    MultiblockFirstOrderTaylorApproximation approx(f, joint, {2, 0});
    FirstOrderTaylorWrapper taylor;
    auto surrogate = taylor(approx, joint);

    auto* typed = dynamic_cast<MultiblockLinearizedObjective*>(surrogate.get());
    assert(typed != nullptr);
    assert(typed->block_indices() == std::vector<int>({2, 0}));

    BlockPoint w = {Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(3)};
    double expected = bil_ref(*f, p2, p0)
                    + bil_g0(*f, p2, p0).dot(w[0] - p2)
                    + bil_g1(*f, p2).dot(w[1] - p0);
    assert(close(surrogate->value(w), expected));

    Eigen::VectorXd q0(3), q2(2);
    q0 << -2.0, 1.0, 0.0;
    q2 << 1.5, -1.0;
    surrogate->recenter({q0, p1, q2});
    assert(close(surrogate->value({q2, q0}), bil_ref(*f, q2, q0)));
    assert(close(surrogate->gradient(w, 1), bil_g1(*f, q2)));

    // Reversed pair on a two-block point
    BlockPoint pair = {p0, p2};
    MultiblockFirstOrderTaylorApproximation reversed(f, pair, {1, 0});
    auto swapped = taylor(reversed, pair);
    assert(close(swapped->value({p2, p0}), bil_ref(*f, p2, p0)));
    std::cout << "[PASS] The approximation's own block indices are kept" << std::endl;
}

void test_composite_double_wrap() {
    std::cout << "\nTesting double wrap of a multiblock composite..." << std::endl;
    Problem p;
    BlockPoint a = make_point(0.0);
    FirstOrderTaylorWrapper taylor;

    auto once = taylor(p.composite, a);
    bool thrown = false;
    try {
        taylor(*once, a);
    } catch (const DoubleWrapError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Re-wrapping linearized losses fails loudly" << std::endl;
}

int main() {
    std::cout << "--- Multiblock Taylor Wrapper Tests ---" << std::endl;
    test_composite_surrogate();
    test_composite_recenter();
    test_plain_multiblock();
    test_wrap_block_selection();
    test_composite_double_wrap();
    test_direct_composite_wrap();
    test_chain_rule_gradient();
    test_structure_errors();
    std::cout << "\nAll multiblock wrapper tests passed!" << std::endl;
    return 0;
}
