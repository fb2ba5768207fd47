/**
 * @file penalty.h
 * @brief Taylix v1.0 - Penalty terms for composite objectives
 *
 * Penalties are Objectives, so they can sit in any group of a
 * CompositeObjective. The Taylor engine never linearizes them.
 */
#ifndef TAYLIX_PENALTY_H
#define TAYLIX_PENALTY_H

#include <Eigen/Dense>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include "objective.h"
#include "optimization.h"

namespace taylix {

/**
 * @brief Abstract base class for regularization penalties
 *
 * prox() enables proximal gradient methods on the surrogate objectives.
 */
class Penalty : public Objective {
public:
    /**
     * @brief Proximal operator: prox_{step*g}(x) = argmin_z { 0.5||z-x||^2 + step*g(z) }
     */
    virtual Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const = 0;

    /**
     * @brief Check if this penalty is differentiable everywhere
     */
    virtual bool is_smooth() const = 0;
};

/**
 * @brief L1 (Lasso) penalty: lambda * ||x||_1
 */
class L1Penalty : public Penalty {
public:
    double lambda;

    explicit L1Penalty(double lam = 1.0) : lambda(lam) {}

    double value(const Eigen::VectorXd& x) const override {
        return lambda * x.lpNorm<1>();
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        // Subgradient, 0 at the kink
        return lambda * x.array().sign().matrix();
    }

    Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const override {
        Eigen::VectorXd result(x.size());
        for (int i = 0; i < x.size(); ++i) {
            result(i) = optimization::soft_threshold(x(i), lambda * step);
        }
        return result;
    }

    bool is_smooth() const override { return false; }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<L1Penalty>(*this);
    }
};

/**
 * @brief L2 (Ridge) penalty: 0.5 * lambda * ||x||_2^2
 */
class L2Penalty : public Penalty {
public:
    double lambda;

    explicit L2Penalty(double lam = 1.0) : lambda(lam) {}

    double value(const Eigen::VectorXd& x) const override {
        return 0.5 * lambda * x.squaredNorm();
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return lambda * x;
    }

    Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const override {
        return x / (1.0 + lambda * step);
    }

    bool is_smooth() const override { return true; }

    bool has_lipschitz_constant() const override { return true; }
    double lipschitz_constant() const override { return lambda; }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<L2Penalty>(*this);
    }
};

/**
 * @brief Elastic Net penalty: λ₁||x||₁ + ½λ₂||x||₂²
 *
 * prox: γ = 1 / (1 + step·λ₂), x_i = S_{step·λ₁·γ}(γ·v_i)
 */
class ElasticNetPenalty : public Penalty {
public:
    double lambda1; // L1 coefficient (sparsity)
    double lambda2; // L2 coefficient (grouping)

    ElasticNetPenalty(double l1 = 1.0, double l2 = 1.0)
        : lambda1(l1), lambda2(l2) {}

    double value(const Eigen::VectorXd& x) const override {
        return lambda1 * x.lpNorm<1>() + 0.5 * lambda2 * x.squaredNorm();
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return lambda2 * x + lambda1 * x.array().sign().matrix();
    }

    Eigen::VectorXd prox(const Eigen::VectorXd& x, double step) const override {
        const double gamma = 1.0 / (1.0 + lambda2 * step);
        const double tau = lambda1 * step * gamma;
        Eigen::VectorXd result(x.size());
        for (int i = 0; i < x.size(); ++i) {
            result(i) = optimization::soft_threshold(x(i) * gamma, tau);
        }
        return result;
    }

    bool is_smooth() const override { return lambda1 == 0.0; }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<ElasticNetPenalty>(*this);
    }
};

/**
 * @brief Factory function to create penalties
 * @param l1_ratio Mixing ratio for elastic net: 1.0 = pure L1, 0.0 = pure L2
 */
inline std::unique_ptr<Penalty> make_penalty(
    const std::string& type,
    double lambda = 1.0,
    double l1_ratio = 1.0
) {
    if (type == "l1" || type == "L1" || type == "lasso") {
        return std::make_unique<L1Penalty>(lambda);
    } else if (type == "l2" || type == "L2" || type == "ridge") {
        return std::make_unique<L2Penalty>(lambda);
    } else if (type == "elasticnet" || type == "elastic_net") {
        return std::make_unique<ElasticNetPenalty>(
            lambda * l1_ratio, lambda * (1.0 - l1_ratio));
    }
    throw std::invalid_argument("Unknown penalty type: " + type);
}

} // namespace taylix

#endif // TAYLIX_PENALTY_H
