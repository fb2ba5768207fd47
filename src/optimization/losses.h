/**
 * @file losses.h
 * @brief Taylix v1.0 - Smooth loss functions
 */
#ifndef TAYLIX_LOSSES_H
#define TAYLIX_LOSSES_H

#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <utility>
#include "multiblock.h"
#include "objective.h"

namespace taylix {

/**
 * @brief Least Squares Objective
 *
 * Minimizes: 0.5 * ||y - X*beta||^2
 */
class LeastSquaresObjective : public EfficientObjective {
public:
    Eigen::MatrixXd X;
    Eigen::VectorXd y;

    LeastSquaresObjective(Eigen::MatrixXd X_, Eigen::VectorXd y_);

    std::pair<double, Eigen::VectorXd>
    value_and_gradient(const Eigen::VectorXd& beta) const override;

    /**
     * @brief Largest eigenvalue of X'X
     */
    double lipschitz_constant() const override;
    bool has_lipschitz_constant() const override { return true; }

    int dimension() const override { return static_cast<int>(X.cols()); }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<LeastSquaresObjective>(*this);
    }
};

/**
 * @brief Negative cross-covariance between two blocks
 *
 *   f(w1, w2) = -<X1 w1, X2 w2> / (n - 1)
 *
 * Bilinear, hence not convex jointly; majorize-minimize schemes replace it
 * by its first-order Taylor approximation at each outer iteration.
 */
class CrossCovarianceLoss : public MultiblockObjective {
public:
    Eigen::MatrixXd X1;
    Eigen::MatrixXd X2;

    /**
     * @throws std::invalid_argument if X1 and X2 differ in rows or have fewer than 2
     */
    CrossCovarianceLoss(Eigen::MatrixXd X1_, Eigen::MatrixXd X2_);

    double value(const BlockPoint& w) const override;
    Eigen::VectorXd gradient(const BlockPoint& w, int index) const override;

    int num_blocks() const override { return 2; }

    std::unique_ptr<MultiblockObjective> clone() const override {
        return std::make_unique<CrossCovarianceLoss>(*this);
    }

private:
    Eigen::MatrixXd cross_;  // X1' X2 / (n - 1)
};

/**
 * @brief Adapts value/gradient callbacks to the Objective interface
 */
class FunctionObjective : public Objective {
public:
    using ValueFn = std::function<double(const Eigen::VectorXd&)>;
    using GradientFn = std::function<Eigen::VectorXd(const Eigen::VectorXd&)>;

    FunctionObjective(ValueFn f, GradientFn grad)
        : f_(std::move(f)), grad_(std::move(grad)) {}

    double value(const Eigen::VectorXd& x) const override { return f_(x); }
    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override { return grad_(x); }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<FunctionObjective>(*this);
    }

private:
    ValueFn f_;
    GradientFn grad_;
};

} // namespace taylix

#endif // TAYLIX_LOSSES_H
