/**
 * @file composite.h
 * @brief Taylix v1.0 - Composite objective: smooth losses + non-smooth penalties
 *
 *   F(x) = sum_k loss_k(x) + sum_k decoupled_k(x) + sum_k coupled_k(x)
 *
 * Only the losses form the smooth part. Both penalty groups are evaluated
 * exactly and are never linearized by the Taylor engine.
 */
#ifndef TAYLIX_COMPOSITE_H
#define TAYLIX_COMPOSITE_H

#include <Eigen/Dense>
#include <memory>
#include <vector>
#include "objective.h"

namespace taylix {

class CompositeObjective : public Objective {
public:
    using Entries = std::vector<std::shared_ptr<Objective>>;

    Entries losses;               // smooth terms
    Entries decoupled_penalties;  // non-smooth, separable over blocks
    Entries coupled_penalties;    // non-smooth, coupling coordinates

    CompositeObjective() = default;

    CompositeObjective(Entries losses_,
                       Entries decoupled_ = {},
                       Entries coupled_ = {})
        : losses(std::move(losses_)),
          decoupled_penalties(std::move(decoupled_)),
          coupled_penalties(std::move(coupled_)) {}

    double value(const Eigen::VectorXd& x) const override {
        return smooth_value(x) + non_smooth_value(x);
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return smooth_gradient(x) + non_smooth_gradient(x);
    }

    double smooth_value(const Eigen::VectorXd& x) const;
    Eigen::VectorXd smooth_gradient(const Eigen::VectorXd& x) const;

    double non_smooth_value(const Eigen::VectorXd& x) const;

    /**
     * @brief Sum of the penalty (sub)gradients
     */
    Eigen::VectorXd non_smooth_gradient(const Eigen::VectorXd& x) const;

    std::unique_ptr<Objective> clone() const override;

    void reset() override;

    /**
     * @brief Recenter every Taylor entry, nested composites included
     */
    void recenter(const Eigen::VectorXd& point) override;

    /**
     * @brief Visit the three entry groups in order: losses, decoupled, coupled
     */
    template <typename Visitor>
    void for_each_group(Visitor&& visit) {
        visit(losses);
        visit(decoupled_penalties);
        visit(coupled_penalties);
    }

    template <typename Visitor>
    void for_each_group(Visitor&& visit) const {
        visit(losses);
        visit(decoupled_penalties);
        visit(coupled_penalties);
    }
};

} // namespace taylix

#endif // TAYLIX_COMPOSITE_H
