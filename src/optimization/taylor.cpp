/**
 * @file taylor.cpp
 * @brief Implementation of the lazy first-order Taylor approximations
 */
#include "taylor.h"
#include "errors.h"
#include <stdexcept>
#include <string>

namespace taylix {

namespace {

void check_indices(const std::vector<int>& indices, size_t n_blocks) {
    if (indices.empty()) {
        throw StructureError("A multiblock Taylor approximation needs at least one block index");
    }
    for (int idx : indices) {
        if (idx < 0 || static_cast<size_t>(idx) >= n_blocks) {
            throw StructureError("Block index " + std::to_string(idx) +
                                 " out of range for a point with " +
                                 std::to_string(n_blocks) + " blocks");
        }
    }
}

} // namespace

void TaylorOptions::validate() const {
    if (!(lipschitz_constant > 0.0)) {
        throw std::invalid_argument("Lipschitz constant must be positive");
    }
}

// -----------------------------------------------------------------------------
// FirstOrderTaylorApproximation
// -----------------------------------------------------------------------------

FirstOrderTaylorApproximation::FirstOrderTaylorApproximation(
    std::shared_ptr<Objective> function,
    Eigen::VectorXd point,
    TaylorOptions options)
    : function_(std::move(function)), point_(std::move(point)), options_(options) {
    if (!function_) {
        throw std::invalid_argument("Taylor approximation of a null function");
    }
    options_.validate();
}

void FirstOrderTaylorApproximation::precompute() const {
    if (!f_at_point_) {
        f_at_point_ = function_->value(point_);
    }
    if (!grad_at_point_) {
        grad_at_point_ = function_->gradient(point_);
    }
}

double FirstOrderTaylorApproximation::value(const Eigen::VectorXd& x) const {
    precompute();
    return *f_at_point_ + grad_at_point_->dot(x - point_);
}

Eigen::VectorXd FirstOrderTaylorApproximation::gradient(const Eigen::VectorXd& x) const {
    (void)x;
    precompute();
    return *grad_at_point_;
}

void FirstOrderTaylorApproximation::reset() {
    function_->reset();
    f_at_point_.reset();
    grad_at_point_.reset();
}

void FirstOrderTaylorApproximation::recenter(const Eigen::VectorXd& point) {
    point_ = point;
    reset();
}

std::unique_ptr<Objective> FirstOrderTaylorApproximation::clone() const {
    return std::make_unique<FirstOrderTaylorApproximation>(
        std::shared_ptr<Objective>(function_->clone()), point_, options_);
}

// -----------------------------------------------------------------------------
// MultiblockFirstOrderTaylorApproximation
// -----------------------------------------------------------------------------

MultiblockFirstOrderTaylorApproximation::MultiblockFirstOrderTaylorApproximation(
    std::shared_ptr<MultiblockObjective> function,
    BlockPoint point,
    std::vector<int> block_indices,
    TaylorOptions options)
    : function_(std::move(function)),
      point_(std::move(point)),
      indices_(std::move(block_indices)),
      options_(options) {
    if (!function_) {
        throw std::invalid_argument("Taylor approximation of a null function");
    }
    options_.validate();
    check_indices(indices_, point_.size());
}

BlockPoint MultiblockFirstOrderTaylorApproximation::local_point() const {
    BlockPoint local;
    local.reserve(indices_.size());
    for (int idx : indices_) {
        local.push_back(point_[idx]);
    }
    return local;
}

void MultiblockFirstOrderTaylorApproximation::precompute() const {
    if (f_at_point_ && grad_at_point_) return;

    // The wrapped gradient is defined relative to the whole sub-tuple, so all
    // blocks are evaluated together.
    const BlockPoint local = local_point();
    if (!f_at_point_) {
        f_at_point_ = function_->value(local);
    }
    if (!grad_at_point_) {
        std::vector<Eigen::VectorXd> grads(indices_.size());
        for (size_t b = 0; b < indices_.size(); ++b) {
            grads[b] = function_->gradient(local, static_cast<int>(b));
        }
        grad_at_point_ = std::move(grads);
    }
}

double MultiblockFirstOrderTaylorApproximation::value(const BlockPoint& w) const {
    if (w.size() != indices_.size()) {
        throw StructureError("Expected " + std::to_string(indices_.size()) +
                             " blocks, got " + std::to_string(w.size()));
    }
    precompute();

    double f = *f_at_point_;
    for (size_t b = 0; b < indices_.size(); ++b) {
        f += (*grad_at_point_)[b].dot(w[b] - point_[indices_[b]]);
    }
    return f;
}

Eigen::VectorXd MultiblockFirstOrderTaylorApproximation::gradient(const BlockPoint& w, int index) const {
    (void)w;
    if (index < 0 || static_cast<size_t>(index) >= indices_.size()) {
        throw StructureError("Gradient requested for block " + std::to_string(index) +
                             " of a function over " + std::to_string(indices_.size()) +
                             " blocks");
    }
    precompute();
    return (*grad_at_point_)[index];
}

void MultiblockFirstOrderTaylorApproximation::reset() {
    function_->reset();
    f_at_point_.reset();
    grad_at_point_.reset();
}

void MultiblockFirstOrderTaylorApproximation::recenter(const BlockPoint& points) {
    check_indices(indices_, points.size());
    point_ = points;
    reset();
}

std::unique_ptr<MultiblockObjective> MultiblockFirstOrderTaylorApproximation::clone() const {
    return std::make_unique<MultiblockFirstOrderTaylorApproximation>(
        std::shared_ptr<MultiblockObjective>(function_->clone()), point_, indices_, options_);
}

} // namespace taylix
