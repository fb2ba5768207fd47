/**
 * @file taylor_wrapper.h
 * @brief Taylix v1.0 - Replace smooth parts of composite objectives by linear surrogates
 *
 * Used once per outer iteration of majorize-minimize or proximal-gradient
 * schemes: the engine deep-copies the objective, replaces every Taylor
 * approximation inside it by a linear surrogate centered at the current
 * iterate, and returns the copy. Non-smooth penalties stay exact.
 *
 * Usage:
 *   FirstOrderTaylorWrapper taylor;
 *   auto surrogate = taylor(objective, x_k);
 *   ... inner steps on surrogate->value / surrogate->gradient ...
 *   surrogate->recenter(x_next);   // cascades to every surrogate inside
 */
#ifndef TAYLIX_TAYLOR_WRAPPER_H
#define TAYLIX_TAYLOR_WRAPPER_H

#include <Eigen/Dense>
#include <memory>
#include <vector>
#include "composite.h"
#include "consts.h"
#include "multiblock.h"
#include "objective.h"
#include "taylor.h"

namespace taylix {

// =============================================================================
// Surrogates built by the engine
// =============================================================================

/**
 * @brief Linear surrogate of a single-block function, captured eagerly
 *
 *   S(x) = v(a) + <g(a), x - a> + h(x)
 *
 * For a CompositeObjective target, v and g come from its losses only and
 * h is its exact penalty part; otherwise h = 0.
 */
class LinearizedObjective : public TaylorApproximation {
public:
    /**
     * @param target Function to linearize, owned by the surrogate
     * @param point Expansion point
     * @throws DoubleWrapError if target already is a surrogate
     */
    LinearizedObjective(std::shared_ptr<Objective> target,
                        const Eigen::VectorXd& point,
                        TaylorOptions options = TaylorOptions());

    double value(const Eigen::VectorXd& x) const override;
    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override;

    double lipschitz_constant() const override { return options_.lipschitz_constant; }

    /**
     * @brief Recenter the target if it has an expansion point, then recapture
     */
    void recenter(const Eigen::VectorXd& point) override;

    /**
     * @brief Reset the target's caches; the capture is kept until recenter
     */
    void reset() override { target_->reset(); }

    const Eigen::VectorXd& point() const override { return capture_.point; }

    TaylorState taylor_state() const override { return capture_; }

    std::unique_ptr<Objective> clone() const override;

    int dimension() const override { return static_cast<int>(capture_.point.size()); }

    const std::shared_ptr<Objective>& target() const { return target_; }

private:
    LinearizedObjective(const LinearizedObjective& other);

    void capture(const Eigen::VectorXd& point);

    std::shared_ptr<Objective> target_;
    const CompositeObjective* composite_ = nullptr;
    TaylorOptions options_;
    TaylorWrapped capture_;
};

/**
 * @brief Linear surrogate of a multiblock function, captured eagerly
 *
 *   S(w) = v(a_I) + sum_b <g_b(a_I), w_b - a_{I_b}> + h(w)
 *
 * where a_I is the joint point restricted to block_indices. For a
 * MultiblockCompositeObjective target, v and g come from its losses and h
 * is its exact penalty part.
 */
class MultiblockLinearizedObjective : public MultiblockTaylorApproximation {
public:
    /**
     * @param target Function to linearize, owned by the surrogate
     * @param points Joint expansion point
     * @param block_indices Blocks of `points` the target takes, in order
     * @throws DoubleWrapError if target already is a surrogate
     * @throws StructureError if the indices do not fit target or points
     */
    MultiblockLinearizedObjective(std::shared_ptr<MultiblockObjective> target,
                                  const BlockPoint& points,
                                  std::vector<int> block_indices,
                                  TaylorOptions options = TaylorOptions());

    double value(const BlockPoint& w) const override;
    Eigen::VectorXd gradient(const BlockPoint& w, int index) const override;

    double lipschitz_constant(const BlockPoint&, int) const override {
        return options_.lipschitz_constant;
    }

    void recenter(const BlockPoint& points) override;

    void reset() override { target_->reset(); }

    const BlockPoint& point() const override { return points_; }

    const std::vector<int>& block_indices() const override { return indices_; }

    MultiblockTaylorState taylor_state() const override { return capture_; }

    std::unique_ptr<MultiblockObjective> clone() const override;

    const std::shared_ptr<MultiblockObjective>& target() const { return target_; }

private:
    MultiblockLinearizedObjective(const MultiblockLinearizedObjective& other);

    void capture(const BlockPoint& points);

    std::shared_ptr<MultiblockObjective> target_;
    const MultiblockCompositeObjective* composite_ = nullptr;
    BlockPoint points_;
    std::vector<int> indices_;
    TaylorOptions options_;
    MultiblockTaylorWrapped capture_;
};

// =============================================================================
// Wrapping engine
// =============================================================================

/**
 * @brief Builds first-order surrogates of (composite) objectives
 *
 * Shapes handled, on a deep copy of the input:
 *   - CompositeObjective: every TaylorApproximation entry is replaced by a
 *     LinearizedObjective at `point`; nested composites are traversed.
 *   - MultiblockCompositeObjective: Taylor losses at (i, j) are replaced by
 *     multiblock surrogates over blocks {i, j}; Taylor penalties on block i
 *     by single-block surrogates at point[i].
 *   - Any other MultiblockObjective: surrogate over all its blocks.
 *   - Any other Objective: surrogate of the whole function.
 */
class FirstOrderTaylorWrapper {
public:
    double lipschitz_constant = consts::taylor_lipschitz();
    bool verbose = false;

    std::unique_ptr<Objective> operator()(const Objective& function,
                                          const Eigen::VectorXd& point) const;

    std::unique_ptr<MultiblockObjective> operator()(const MultiblockObjective& function,
                                                    const BlockPoint& points) const;

    /**
     * @brief Single-block wrap routine; takes ownership of `function`
     * @throws DoubleWrapError if function already is a surrogate
     */
    static std::unique_ptr<LinearizedObjective> wrap(std::shared_ptr<Objective> function,
                                                     const Eigen::VectorXd& point,
                                                     TaylorOptions options = TaylorOptions());

    /**
     * @brief Multiblock wrap routine; takes ownership of `function`
     * @throws DoubleWrapError if function already is a surrogate
     */
    static std::unique_ptr<MultiblockLinearizedObjective>
    wrap_multiblock(std::shared_ptr<MultiblockObjective> function,
                    const BlockPoint& points,
                    std::vector<int> block_indices,
                    TaylorOptions options = TaylorOptions());

    TaylorOptions options() const;
};

} // namespace taylix

#endif // TAYLIX_TAYLOR_WRAPPER_H
