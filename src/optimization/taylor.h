/**
 * @file taylor.h
 * @brief Taylix v1.0 - First-order Taylor approximations
 *
 * A first-order Taylor approximation of f around a point a:
 *
 *   T(x) = f(a) + <grad f(a), x - a>
 *
 * f(a) and grad f(a) are computed lazily on first use and reused for every
 * trial point x until the approximation is recentered or reset.
 */
#ifndef TAYLIX_TAYLOR_H
#define TAYLIX_TAYLOR_H

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <vector>
#include "consts.h"
#include "multiblock.h"
#include "objective.h"

namespace taylix {

/**
 * @brief Settings shared by all Taylor surrogates
 */
struct TaylorOptions {
    // Reported by lipschitz_constant(); must be strictly positive.
    double lipschitz_constant = consts::taylor_lipschitz();

    /**
     * @throws std::invalid_argument if lipschitz_constant is not positive
     */
    void validate() const;
};

// =============================================================================
// Base classes
// =============================================================================

/**
 * @brief Base class of single-block Taylor approximations
 *
 * Composites cascade recenter() to every entry deriving from this class,
 * and the wrapping engine replaces these entries by recentered surrogates.
 */
class TaylorApproximation : public Objective {
public:
    /**
     * @brief Current expansion point
     */
    virtual const Eigen::VectorXd& point() const = 0;

    void recenter(const Eigen::VectorXd& point) override = 0;

    bool has_lipschitz_constant() const override { return true; }
};

/**
 * @brief Base class of multiblock Taylor approximations
 */
class MultiblockTaylorApproximation : public MultiblockObjective {
public:
    /**
     * @brief Joint expansion point over all blocks of the enclosing problem
     */
    virtual const BlockPoint& point() const = 0;

    /**
     * @brief Blocks of the joint point this function depends on, in order
     */
    virtual const std::vector<int>& block_indices() const = 0;

    void recenter(const BlockPoint& points) override = 0;

    int num_blocks() const override { return static_cast<int>(block_indices().size()); }
};

// =============================================================================
// Single block
// =============================================================================

class FirstOrderTaylorApproximation : public TaylorApproximation {
public:
    /**
     * @param function Smooth function to approximate (must not be null)
     * @param point Expansion point
     * @param options Lipschitz constant to report
     */
    FirstOrderTaylorApproximation(std::shared_ptr<Objective> function,
                                  Eigen::VectorXd point,
                                  TaylorOptions options = TaylorOptions());

    double value(const Eigen::VectorXd& x) const override;

    /**
     * @brief grad f(a), independent of x
     */
    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override;

    double lipschitz_constant() const override { return options_.lipschitz_constant; }

    /**
     * @brief Reset the wrapped function, then drop f(a) and grad f(a)
     */
    void reset() override;

    void recenter(const Eigen::VectorXd& point) override;

    const Eigen::VectorXd& point() const override { return point_; }

    std::unique_ptr<Objective> clone() const override;

    int dimension() const override { return static_cast<int>(point_.size()); }

    const std::shared_ptr<Objective>& function() const { return function_; }

private:
    void precompute() const;

    std::shared_ptr<Objective> function_;
    Eigen::VectorXd point_;
    TaylorOptions options_;

    mutable std::optional<double> f_at_point_;
    mutable std::optional<Eigen::VectorXd> grad_at_point_;
};

// =============================================================================
// Multiblock
// =============================================================================

/**
 * @brief First-order Taylor approximation of a multiblock function
 *
 * The wrapped function takes the blocks listed in block_indices, in that
 * order. With a = (a_0, ..., a_{n-1}) the joint expansion point:
 *
 *   T(w) = f(a_{I_0}, a_{I_1}, ...) + sum_b <grad_b f, w_b - a_{I_b}>
 */
class MultiblockFirstOrderTaylorApproximation : public MultiblockTaylorApproximation {
public:
    /**
     * @param function Smooth multiblock function (must not be null)
     * @param point Joint expansion point
     * @param block_indices Blocks of `point` the function depends on
     * @throws StructureError if an index is negative or out of range
     */
    MultiblockFirstOrderTaylorApproximation(std::shared_ptr<MultiblockObjective> function,
                                            BlockPoint point,
                                            std::vector<int> block_indices,
                                            TaylorOptions options = TaylorOptions());

    /**
     * @param w One vector per entry of block_indices
     */
    double value(const BlockPoint& w) const override;

    /**
     * @brief Cached gradient of block `index`, a position in block_indices
     */
    Eigen::VectorXd gradient(const BlockPoint& w, int index) const override;

    double lipschitz_constant(const BlockPoint&, int) const override {
        return options_.lipschitz_constant;
    }

    void reset() override;

    void recenter(const BlockPoint& points) override;

    const BlockPoint& point() const override { return point_; }

    const std::vector<int>& block_indices() const override { return indices_; }

    std::unique_ptr<MultiblockObjective> clone() const override;

    /**
     * @brief Expansion point restricted to block_indices
     */
    BlockPoint local_point() const;

private:
    void precompute() const;

    std::shared_ptr<MultiblockObjective> function_;
    BlockPoint point_;
    std::vector<int> indices_;
    TaylorOptions options_;

    mutable std::optional<double> f_at_point_;
    mutable std::optional<std::vector<Eigen::VectorXd>> grad_at_point_;
};

} // namespace taylix

#endif // TAYLIX_TAYLOR_H
