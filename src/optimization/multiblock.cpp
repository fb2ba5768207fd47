/**
 * @file multiblock.cpp
 * @brief Implementation of MultiblockCompositeObjective
 */
#include "multiblock.h"
#include "composite.h"
#include "errors.h"
#include "taylor.h"
#include <string>

namespace taylix {

namespace {

bool is_recenterable(const Objective* f) {
    return dynamic_cast<const TaylorApproximation*>(f) != nullptr ||
           dynamic_cast<const CompositeObjective*>(f) != nullptr;
}

bool is_recenterable(const MultiblockObjective* f) {
    return dynamic_cast<const MultiblockTaylorApproximation*>(f) != nullptr;
}

std::vector<MultiblockCompositeObjective::PenaltyEntries>
clone_penalties(const std::vector<MultiblockCompositeObjective::PenaltyEntries>& rows) {
    std::vector<MultiblockCompositeObjective::PenaltyEntries> copy(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        for (const auto& p : rows[i]) {
            copy[i].push_back(p ? std::shared_ptr<Objective>(p->clone()) : nullptr);
        }
    }
    return copy;
}

} // namespace

MultiblockCompositeObjective::MultiblockCompositeObjective(int n) {
    if (n < 1) {
        throw StructureError("A multiblock composite needs at least one block");
    }
    losses.assign(n, std::vector<LossEntries>(n));
    decoupled_penalties.assign(n, PenaltyEntries());
    coupled_penalties.assign(n, PenaltyEntries());
}

void MultiblockCompositeObjective::check_block(int i, const char* what) const {
    if (i < 0 || i >= num_blocks()) {
        throw StructureError(std::string(what) + ": block index " + std::to_string(i) +
                             " out of range for " + std::to_string(num_blocks()) + " blocks");
    }
}

void MultiblockCompositeObjective::add_loss(int i, int j, std::shared_ptr<MultiblockObjective> loss) {
    check_block(i, "add_loss");
    check_block(j, "add_loss");
    losses[i][j].push_back(std::move(loss));
}

void MultiblockCompositeObjective::add_decoupled_penalty(int i, std::shared_ptr<Objective> penalty) {
    check_block(i, "add_decoupled_penalty");
    decoupled_penalties[i].push_back(std::move(penalty));
}

void MultiblockCompositeObjective::add_coupled_penalty(int i, std::shared_ptr<Objective> penalty) {
    check_block(i, "add_coupled_penalty");
    coupled_penalties[i].push_back(std::move(penalty));
}

double MultiblockCompositeObjective::smooth_value(const BlockPoint& w) const {
    validate(w);
    double val = 0.0;
    for (size_t i = 0; i < losses.size(); ++i) {
        for (size_t j = 0; j < losses[i].size(); ++j) {
            for (const auto& f : losses[i][j]) {
                val += f->value({w[i], w[j]});
            }
        }
    }
    return val;
}

Eigen::VectorXd MultiblockCompositeObjective::smooth_gradient(const BlockPoint& w, int index) const {
    check_block(index, "gradient");
    validate(w);
    Eigen::VectorXd grad = Eigen::VectorXd::Zero(w[index].size());
    // Block `index` enters loss (i, j) as its first argument when i == index
    // and as its second when j == index; both apply on the diagonal.
    for (int j = 0; j < num_blocks(); ++j) {
        for (const auto& f : losses[index][j]) {
            grad += f->gradient({w[index], w[j]}, 0);
        }
    }
    for (int i = 0; i < num_blocks(); ++i) {
        for (const auto& f : losses[i][index]) {
            grad += f->gradient({w[i], w[index]}, 1);
        }
    }
    return grad;
}

double MultiblockCompositeObjective::non_smooth_value(const BlockPoint& w) const {
    validate(w);
    double val = 0.0;
    for (size_t i = 0; i < decoupled_penalties.size(); ++i) {
        for (const auto& p : decoupled_penalties[i]) val += p->value(w[i]);
        for (const auto& p : coupled_penalties[i]) val += p->value(w[i]);
    }
    return val;
}

Eigen::VectorXd MultiblockCompositeObjective::non_smooth_gradient(const BlockPoint& w, int index) const {
    check_block(index, "gradient");
    validate(w);
    Eigen::VectorXd grad = Eigen::VectorXd::Zero(w[index].size());
    for (const auto& p : decoupled_penalties[index]) grad += p->gradient(w[index]);
    for (const auto& p : coupled_penalties[index]) grad += p->gradient(w[index]);
    return grad;
}

double MultiblockCompositeObjective::value(const BlockPoint& w) const {
    return smooth_value(w) + non_smooth_value(w);
}

Eigen::VectorXd MultiblockCompositeObjective::gradient(const BlockPoint& w, int index) const {
    return smooth_gradient(w, index) + non_smooth_gradient(w, index);
}

std::unique_ptr<MultiblockObjective> MultiblockCompositeObjective::clone() const {
    auto copy = std::make_unique<MultiblockCompositeObjective>(num_blocks());
    for (size_t i = 0; i < losses.size(); ++i) {
        copy->losses[i].resize(losses[i].size());
        for (size_t j = 0; j < losses[i].size(); ++j) {
            for (const auto& f : losses[i][j]) {
                copy->losses[i][j].push_back(
                    f ? std::shared_ptr<MultiblockObjective>(f->clone()) : nullptr);
            }
        }
    }
    copy->decoupled_penalties = clone_penalties(decoupled_penalties);
    copy->coupled_penalties = clone_penalties(coupled_penalties);
    return copy;
}

void MultiblockCompositeObjective::reset() {
    for (auto& row : losses)
        for (auto& cell : row)
            for (auto& f : cell)
                if (f) f->reset();
    for (size_t i = 0; i < decoupled_penalties.size(); ++i) {
        for (auto& p : decoupled_penalties[i]) if (p) p->reset();
        for (auto& p : coupled_penalties[i]) if (p) p->reset();
    }
}

void MultiblockCompositeObjective::recenter(const BlockPoint& points) {
    validate(points);
    for (auto& row : losses) {
        for (auto& cell : row) {
            for (auto& f : cell) {
                if (is_recenterable(f.get())) f->recenter(points);
            }
        }
    }
    for (size_t i = 0; i < decoupled_penalties.size(); ++i) {
        for (auto& p : decoupled_penalties[i]) {
            if (is_recenterable(p.get())) p->recenter(points[i]);
        }
        for (auto& p : coupled_penalties[i]) {
            if (is_recenterable(p.get())) p->recenter(points[i]);
        }
    }
}

void MultiblockCompositeObjective::validate(const BlockPoint& points) const {
    const size_t n = losses.size();
    if (points.size() != n) {
        throw StructureError("Point has " + std::to_string(points.size()) +
                             " blocks, composite has " + std::to_string(n));
    }
    if (decoupled_penalties.size() != n || coupled_penalties.size() != n) {
        throw StructureError("Penalty lists must have one row per block");
    }
    for (size_t i = 0; i < n; ++i) {
        if (losses[i].size() != n) {
            throw StructureError("Loss row " + std::to_string(i) + " has " +
                                 std::to_string(losses[i].size()) + " columns, expected " +
                                 std::to_string(n));
        }
        for (size_t j = 0; j < n; ++j) {
            for (const auto& f : losses[i][j]) {
                if (!f) {
                    throw StructureError("Null loss at (" + std::to_string(i) + ", " +
                                         std::to_string(j) + ")");
                }
                if (f->num_blocks() != -1 && f->num_blocks() != 2) {
                    throw StructureError("Loss at (" + std::to_string(i) + ", " +
                                         std::to_string(j) + ") takes " +
                                         std::to_string(f->num_blocks()) +
                                         " blocks, expected a pairwise function");
                }
            }
        }
        for (const auto& p : decoupled_penalties[i]) {
            if (!p) throw StructureError("Null decoupled penalty on block " + std::to_string(i));
        }
        for (const auto& p : coupled_penalties[i]) {
            if (!p) throw StructureError("Null coupled penalty on block " + std::to_string(i));
        }
    }
}

} // namespace taylix
