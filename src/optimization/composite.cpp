/**
 * @file composite.cpp
 * @brief Implementation of CompositeObjective
 */
#include "composite.h"
#include "errors.h"
#include "taylor.h"
#include <string>

namespace taylix {

namespace {

const Objective& entry(const CompositeObjective::Entries& entries, size_t k) {
    if (!entries[k]) {
        throw StructureError("Null composite entry " + std::to_string(k));
    }
    return *entries[k];
}

double sum_values(const CompositeObjective::Entries& entries, const Eigen::VectorXd& x) {
    double val = 0.0;
    for (size_t k = 0; k < entries.size(); ++k) {
        val += entry(entries, k).value(x);
    }
    return val;
}

void add_gradients(const CompositeObjective::Entries& entries,
                   const Eigen::VectorXd& x,
                   Eigen::VectorXd& grad) {
    for (size_t k = 0; k < entries.size(); ++k) {
        grad += entry(entries, k).gradient(x);
    }
}

CompositeObjective::Entries clone_entries(const CompositeObjective::Entries& entries) {
    CompositeObjective::Entries copy;
    copy.reserve(entries.size());
    for (const auto& f : entries) {
        copy.push_back(f ? std::shared_ptr<Objective>(f->clone()) : nullptr);
    }
    return copy;
}

} // namespace

double CompositeObjective::smooth_value(const Eigen::VectorXd& x) const {
    return sum_values(losses, x);
}

Eigen::VectorXd CompositeObjective::smooth_gradient(const Eigen::VectorXd& x) const {
    Eigen::VectorXd grad = Eigen::VectorXd::Zero(x.size());
    add_gradients(losses, x, grad);
    return grad;
}

double CompositeObjective::non_smooth_value(const Eigen::VectorXd& x) const {
    return sum_values(decoupled_penalties, x) + sum_values(coupled_penalties, x);
}

Eigen::VectorXd CompositeObjective::non_smooth_gradient(const Eigen::VectorXd& x) const {
    Eigen::VectorXd grad = Eigen::VectorXd::Zero(x.size());
    add_gradients(decoupled_penalties, x, grad);
    add_gradients(coupled_penalties, x, grad);
    return grad;
}

std::unique_ptr<Objective> CompositeObjective::clone() const {
    return std::make_unique<CompositeObjective>(clone_entries(losses),
                                                clone_entries(decoupled_penalties),
                                                clone_entries(coupled_penalties));
}

void CompositeObjective::reset() {
    for_each_group([](Entries& entries) {
        for (auto& f : entries) {
            if (f) f->reset();
        }
    });
}

void CompositeObjective::recenter(const Eigen::VectorXd& point) {
    for_each_group([&point](Entries& entries) {
        for (auto& f : entries) {
            if (dynamic_cast<TaylorApproximation*>(f.get()) ||
                dynamic_cast<CompositeObjective*>(f.get())) {
                f->recenter(point);
            }
        }
    });
}

} // namespace taylix
