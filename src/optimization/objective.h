/**
 * @file objective.h
 * @brief Taylix v1.0 - Differentiable Objective Interface
 *
 * Every function the Taylor engine can approximate (losses, penalties,
 * composites, surrogates) derives from this base.
 */
#ifndef TAYLIX_OBJECTIVE_H
#define TAYLIX_OBJECTIVE_H

#include <Eigen/Dense>
#include <utility>
#include <stdexcept>
#include <memory>
#include <variant>
#include <vector>

namespace taylix {

// =============================================================================
// Taylor state
// =============================================================================

/**
 * @brief State of a function that has not been replaced by a surrogate
 */
struct PlainFunction {};

/**
 * @brief Capture held by a single-block surrogate built by the engine
 */
struct TaylorWrapped {
    Eigen::VectorXd point;
    double value_at_point;
    Eigen::VectorXd gradient_at_point;
};

/**
 * @brief Capture held by a multiblock surrogate built by the engine
 *
 * point and gradient_at_point are laid out per block of the wrapped function.
 */
struct MultiblockTaylorWrapped {
    std::vector<Eigen::VectorXd> point;
    double value_at_point;
    std::vector<Eigen::VectorXd> gradient_at_point;
};

using TaylorState = std::variant<PlainFunction, TaylorWrapped>;
using MultiblockTaylorState = std::variant<PlainFunction, MultiblockTaylorWrapped>;

// =============================================================================
// Objective
// =============================================================================

/**
 * @brief Abstract base class for differentiable objective functions
 *
 * Usage:
 *   struct MyObjective : Objective {
 *       double value(const Eigen::VectorXd& x) const override { ... }
 *       Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override { ... }
 *       std::unique_ptr<Objective> clone() const override { ... }
 *   };
 */
class Objective {
public:
    virtual ~Objective() = default;

    /**
     * @brief Compute objective function value at x
     * @param x Parameter vector
     * @return Objective value (to be minimized)
     */
    virtual double value(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Compute gradient of objective at x
     * @param x Parameter vector
     * @return Gradient vector (same dimension as x)
     * @note Non-smooth functions return a subgradient
     */
    virtual Eigen::VectorXd gradient(const Eigen::VectorXd& x) const = 0;

    /**
     * @brief Deep copy, sharing no state with this object
     */
    virtual std::unique_ptr<Objective> clone() const = 0;

    /**
     * @brief Free any cached computations from previous use
     */
    virtual void reset() {}

    /**
     * @brief Move the expansion point of a Taylor surrogate
     * @throws std::logic_error if this objective has no expansion point
     */
    virtual void recenter(const Eigen::VectorXd& point) {
        (void)point;
        throw std::logic_error("recenter is not supported by this objective");
    }

    /**
     * @brief Lipschitz constant of the gradient (optional)
     * @throws std::runtime_error if not implemented
     */
    virtual double lipschitz_constant() const {
        throw std::runtime_error("Lipschitz constant not implemented for this objective");
    }

    virtual bool has_lipschitz_constant() const { return false; }

    /**
     * @brief Whether the engine already replaced this function by a surrogate
     */
    virtual TaylorState taylor_state() const { return PlainFunction{}; }

    /**
     * @brief Get the dimension of the parameter space
     */
    virtual int dimension() const { return -1; } // -1 means undefined/dynamic
};

/**
 * @brief Efficient objective that computes value and gradient together
 *
 * Many objectives (e.g., least squares) share computation between
 * value and gradient. This interface avoids redundant work.
 */
class EfficientObjective : public Objective {
public:
    /**
     * @brief Compute value and gradient in a single pass
     * @param x Parameter vector
     * @return Pair of (value, gradient)
     */
    virtual std::pair<double, Eigen::VectorXd>
    value_and_gradient(const Eigen::VectorXd& x) const = 0;

    // Default implementations delegate to value_and_gradient
    double value(const Eigen::VectorXd& x) const override {
        return value_and_gradient(x).first;
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return value_and_gradient(x).second;
    }
};

} // namespace taylix

#endif // TAYLIX_OBJECTIVE_H
