/**
 * @file taylor_wrapper.cpp
 * @brief Implementation of the Taylor surrogates and the wrapping engine
 */
#include "taylor_wrapper.h"
#include "errors.h"
#include <iostream>
#include <string>
#include <variant>

namespace taylix {

namespace {

bool is_wrapped(const Objective& f) {
    return std::holds_alternative<TaylorWrapped>(f.taylor_state());
}

bool is_wrapped(const MultiblockObjective& f) {
    return std::holds_alternative<MultiblockTaylorWrapped>(f.taylor_state());
}

std::string join_indices(const std::vector<int>& indices) {
    std::string s = "{";
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(indices[i]);
    }
    return s + "}";
}

// -----------------------------------------------------------------------------
// Shapes the engine knows how to traverse
// -----------------------------------------------------------------------------

struct FlatComposite { CompositeObjective* function; };
struct PlainSingle { Objective* function; };
using SingleBlockShape = std::variant<FlatComposite, PlainSingle>;

struct MultiblockComposite { MultiblockCompositeObjective* function; };
struct PlainMultiblock { MultiblockObjective* function; };
using MultiblockShape = std::variant<MultiblockComposite, PlainMultiblock>;

SingleBlockShape classify(Objective* f) {
    if (auto* c = dynamic_cast<CompositeObjective*>(f)) return FlatComposite{c};
    return PlainSingle{f};
}

MultiblockShape classify(MultiblockObjective* f) {
    if (auto* c = dynamic_cast<MultiblockCompositeObjective*>(f)) return MultiblockComposite{c};
    return PlainMultiblock{f};
}

/**
 * @brief Replaces Taylor entries of a composite in place
 */
class EntryRewriter {
public:
    EntryRewriter(const TaylorOptions& options, bool verbose)
        : options_(options), verbose_(verbose) {}

    void rewrite(CompositeObjective& composite, const Eigen::VectorXd& point) {
        rewrite_group(composite.losses, "loss", point);
        rewrite_group(composite.decoupled_penalties, "decoupled penalty", point);
        rewrite_group(composite.coupled_penalties, "coupled penalty", point);
    }

    void rewrite(MultiblockCompositeObjective& composite, const BlockPoint& points) {
        composite.validate(points);
        const int n = composite.num_blocks();
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                for (auto& f : composite.losses[i][j]) {
                    auto* taylor = dynamic_cast<MultiblockTaylorApproximation*>(f.get());
                    if (!taylor) continue;
                    const std::vector<int> pair = {i, j};
                    if (taylor->block_indices() != pair) {
                        throw StructureError("Loss stored at " + join_indices(pair) +
                                             " approximates blocks " +
                                             join_indices(taylor->block_indices()));
                    }
                    f = FirstOrderTaylorWrapper::wrap_multiblock(f, points, pair, options_);
                    log("loss " + join_indices(pair));
                }
            }
        }
        for (int i = 0; i < n; ++i) {
            rewrite_group(composite.decoupled_penalties[i],
                          "decoupled penalty on block " + std::to_string(i), points[i]);
            rewrite_group(composite.coupled_penalties[i],
                          "coupled penalty on block " + std::to_string(i), points[i]);
        }
    }

    int count() const { return count_; }

private:
    void rewrite_group(CompositeObjective::Entries& entries,
                       const std::string& group,
                       const Eigen::VectorXd& point) {
        for (size_t k = 0; k < entries.size(); ++k) {
            auto& f = entries[k];
            if (!f) {
                throw StructureError("Null " + group + " entry " + std::to_string(k));
            }
            if (auto* nested = dynamic_cast<CompositeObjective*>(f.get())) {
                rewrite(*nested, point);
            } else if (dynamic_cast<TaylorApproximation*>(f.get())) {
                f = FirstOrderTaylorWrapper::wrap(f, point, options_);
                log(group + " " + std::to_string(k));
            }
        }
    }

    void log(const std::string& what) {
        ++count_;
        if (verbose_) {
            std::cout << "FirstOrderTaylorWrapper: linearized " << what << std::endl;
        }
    }

    TaylorOptions options_;
    bool verbose_;
    int count_ = 0;
};

} // namespace

// =============================================================================
// LinearizedObjective
// =============================================================================

LinearizedObjective::LinearizedObjective(std::shared_ptr<Objective> target,
                                         const Eigen::VectorXd& point,
                                         TaylorOptions options)
    : target_(std::move(target)), options_(options) {
    if (!target_) {
        throw std::invalid_argument("Cannot linearize a null function");
    }
    if (is_wrapped(*target_)) {
        throw DoubleWrapError();
    }
    options_.validate();
    composite_ = dynamic_cast<const CompositeObjective*>(target_.get());
    capture(point);
}

LinearizedObjective::LinearizedObjective(const LinearizedObjective& other)
    : TaylorApproximation(other),
      target_(other.target_->clone()),
      options_(other.options_),
      capture_(other.capture_) {
    composite_ = dynamic_cast<const CompositeObjective*>(target_.get());
}

void LinearizedObjective::capture(const Eigen::VectorXd& point) {
    const bool recenters = dynamic_cast<TaylorApproximation*>(target_.get()) || composite_;
    // Empty before the first capture
    const Eigen::VectorXd previous = capture_.point;
    if (recenters) {
        target_->recenter(point);
    }

    TaylorWrapped next;
    next.point = point;
    try {
        if (composite_) {
            next.value_at_point = composite_->smooth_value(point);
            next.gradient_at_point = composite_->smooth_gradient(point);
        } else {
            next.value_at_point = target_->value(point);
            next.gradient_at_point = target_->gradient(point);
        }
    } catch (...) {
        // Put the target back where the current capture was taken, then rethrow
        if (recenters && previous.size() > 0) {
            target_->recenter(previous);
        }
        throw;
    }
    capture_ = std::move(next);
}

double LinearizedObjective::value(const Eigen::VectorXd& x) const {
    double val = capture_.value_at_point + capture_.gradient_at_point.dot(x - capture_.point);

    // Penalties are added back exactly
    if (composite_) {
        val += composite_->non_smooth_value(x);
    }
    return val;
}

Eigen::VectorXd LinearizedObjective::gradient(const Eigen::VectorXd& x) const {
    if (composite_) {
        return capture_.gradient_at_point + composite_->non_smooth_gradient(x);
    }
    return capture_.gradient_at_point;
}

void LinearizedObjective::recenter(const Eigen::VectorXd& point) {
    capture(point);
}

std::unique_ptr<Objective> LinearizedObjective::clone() const {
    return std::unique_ptr<Objective>(new LinearizedObjective(*this));
}

// =============================================================================
// MultiblockLinearizedObjective
// =============================================================================

MultiblockLinearizedObjective::MultiblockLinearizedObjective(
    std::shared_ptr<MultiblockObjective> target,
    const BlockPoint& points,
    std::vector<int> block_indices,
    TaylorOptions options)
    : target_(std::move(target)), indices_(std::move(block_indices)), options_(options) {
    if (!target_) {
        throw std::invalid_argument("Cannot linearize a null function");
    }
    if (is_wrapped(*target_)) {
        throw DoubleWrapError();
    }
    options_.validate();
    if (indices_.empty()) {
        throw StructureError("A multiblock surrogate needs at least one block index");
    }
    const int arity = target_->num_blocks();
    if (arity != -1 && arity != static_cast<int>(indices_.size())) {
        throw StructureError("Function takes " + std::to_string(arity) + " blocks, " +
                             std::to_string(indices_.size()) + " block indices given");
    }
    if (auto* taylor = dynamic_cast<const MultiblockTaylorApproximation*>(target_.get())) {
        if (taylor->block_indices() != indices_) {
            throw StructureError("Taylor approximation over blocks " +
                                 join_indices(taylor->block_indices()) +
                                 " wrapped as blocks " + join_indices(indices_));
        }
    }
    composite_ = dynamic_cast<const MultiblockCompositeObjective*>(target_.get());
    capture(points);
}

MultiblockLinearizedObjective::MultiblockLinearizedObjective(const MultiblockLinearizedObjective& other)
    : MultiblockTaylorApproximation(other),
      target_(other.target_->clone()),
      points_(other.points_),
      indices_(other.indices_),
      options_(other.options_),
      capture_(other.capture_) {
    composite_ = dynamic_cast<const MultiblockCompositeObjective*>(target_.get());
}

void MultiblockLinearizedObjective::capture(const BlockPoint& points) {
    BlockPoint local;
    local.reserve(indices_.size());
    for (int idx : indices_) {
        if (idx < 0 || static_cast<size_t>(idx) >= points.size()) {
            throw StructureError("Block index " + std::to_string(idx) +
                                 " out of range for a point with " +
                                 std::to_string(points.size()) + " blocks");
        }
        local.push_back(points[idx]);
    }

    const bool taylor_target = dynamic_cast<MultiblockTaylorApproximation*>(target_.get()) != nullptr;
    // Both empty before the first capture
    const BlockPoint previous_points = points_;
    const BlockPoint previous_local = capture_.point;
    if (taylor_target) {
        target_->recenter(points);
    } else if (composite_) {
        target_->recenter(local);
    }

    std::vector<Eigen::VectorXd> grads(indices_.size());
    double val;
    try {
        if (composite_) {
            val = composite_->smooth_value(local);
            for (size_t b = 0; b < indices_.size(); ++b) {
                grads[b] = composite_->smooth_gradient(local, static_cast<int>(b));
            }
        } else {
            val = target_->value(local);
            for (size_t b = 0; b < indices_.size(); ++b) {
                grads[b] = target_->gradient(local, static_cast<int>(b));
            }
        }
    } catch (...) {
        if (taylor_target && !previous_points.empty()) {
            target_->recenter(previous_points);
        } else if (composite_ && !previous_local.empty()) {
            target_->recenter(previous_local);
        }
        throw;
    }

    points_ = points;
    capture_.point = std::move(local);
    capture_.value_at_point = val;
    capture_.gradient_at_point = std::move(grads);
}

double MultiblockLinearizedObjective::value(const BlockPoint& w) const {
    if (w.size() != indices_.size()) {
        throw StructureError("Expected " + std::to_string(indices_.size()) +
                             " blocks, got " + std::to_string(w.size()));
    }
    double val = capture_.value_at_point;
    for (size_t b = 0; b < indices_.size(); ++b) {
        val += capture_.gradient_at_point[b].dot(w[b] - capture_.point[b]);
    }
    if (composite_) {
        val += composite_->non_smooth_value(w);
    }
    return val;
}

Eigen::VectorXd MultiblockLinearizedObjective::gradient(const BlockPoint& w, int index) const {
    if (index < 0 || static_cast<size_t>(index) >= indices_.size()) {
        throw StructureError("Gradient requested for block " + std::to_string(index) +
                             " of a function over " + std::to_string(indices_.size()) +
                             " blocks");
    }
    if (composite_) {
        return capture_.gradient_at_point[index] + composite_->non_smooth_gradient(w, index);
    }
    return capture_.gradient_at_point[index];
}

void MultiblockLinearizedObjective::recenter(const BlockPoint& points) {
    capture(points);
}

std::unique_ptr<MultiblockObjective> MultiblockLinearizedObjective::clone() const {
    return std::unique_ptr<MultiblockObjective>(new MultiblockLinearizedObjective(*this));
}

// =============================================================================
// FirstOrderTaylorWrapper
// =============================================================================

TaylorOptions FirstOrderTaylorWrapper::options() const {
    TaylorOptions opts;
    opts.lipschitz_constant = lipschitz_constant;
    opts.validate();
    return opts;
}

std::unique_ptr<LinearizedObjective>
FirstOrderTaylorWrapper::wrap(std::shared_ptr<Objective> function,
                              const Eigen::VectorXd& point,
                              TaylorOptions options) {
    return std::make_unique<LinearizedObjective>(std::move(function), point, options);
}

std::unique_ptr<MultiblockLinearizedObjective>
FirstOrderTaylorWrapper::wrap_multiblock(std::shared_ptr<MultiblockObjective> function,
                                         const BlockPoint& points,
                                         std::vector<int> block_indices,
                                         TaylorOptions options) {
    return std::make_unique<MultiblockLinearizedObjective>(
        std::move(function), points, std::move(block_indices), options);
}

std::unique_ptr<Objective>
FirstOrderTaylorWrapper::operator()(const Objective& function, const Eigen::VectorXd& point) const {
    const TaylorOptions opts = options();
    std::unique_ptr<Objective> fun = function.clone();

    struct Visitor {
        std::unique_ptr<Objective>& fun;
        const Eigen::VectorXd& point;
        const TaylorOptions& opts;
        bool verbose;

        std::unique_ptr<Objective> operator()(FlatComposite shape) {
            EntryRewriter rewriter(opts, verbose);
            rewriter.rewrite(*shape.function, point);
            if (verbose) {
                std::cout << "FirstOrderTaylorWrapper: composite with "
                          << rewriter.count() << " linearized entries" << std::endl;
            }
            return std::move(fun);
        }

        std::unique_ptr<Objective> operator()(PlainSingle) {
            if (verbose) {
                std::cout << "FirstOrderTaylorWrapper: linearized single-block function"
                          << std::endl;
            }
            return FirstOrderTaylorWrapper::wrap(
                std::shared_ptr<Objective>(std::move(fun)), point, opts);
        }
    };

    return std::visit(Visitor{fun, point, opts, verbose}, classify(fun.get()));
}

std::unique_ptr<MultiblockObjective>
FirstOrderTaylorWrapper::operator()(const MultiblockObjective& function, const BlockPoint& points) const {
    const TaylorOptions opts = options();
    std::unique_ptr<MultiblockObjective> fun = function.clone();

    struct Visitor {
        std::unique_ptr<MultiblockObjective>& fun;
        const BlockPoint& points;
        const TaylorOptions& opts;
        bool verbose;

        std::unique_ptr<MultiblockObjective> operator()(MultiblockComposite shape) {
            EntryRewriter rewriter(opts, verbose);
            rewriter.rewrite(*shape.function, points);
            if (verbose) {
                std::cout << "FirstOrderTaylorWrapper: multiblock composite with "
                          << rewriter.count() << " linearized entries" << std::endl;
            }
            return std::move(fun);
        }

        std::unique_ptr<MultiblockObjective> operator()(PlainMultiblock shape) {
            // A Taylor approximation keeps its own block selection; anything
            // else takes every block of the joint point.
            std::vector<int> indices;
            if (auto* taylor = dynamic_cast<MultiblockTaylorApproximation*>(shape.function)) {
                indices = taylor->block_indices();
            } else {
                indices.resize(points.size());
                for (size_t i = 0; i < indices.size(); ++i) {
                    indices[i] = static_cast<int>(i);
                }
            }
            if (verbose) {
                std::cout << "FirstOrderTaylorWrapper: linearized multiblock function over "
                          << indices.size() << " blocks" << std::endl;
            }
            return FirstOrderTaylorWrapper::wrap_multiblock(
                std::shared_ptr<MultiblockObjective>(std::move(fun)),
                points, std::move(indices), opts);
        }
    };

    return std::visit(Visitor{fun, points, opts, verbose}, classify(fun.get()));
}

} // namespace taylix
