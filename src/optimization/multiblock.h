/**
 * @file multiblock.h
 * @brief Taylix v1.0 - Objectives over several coupled variable blocks
 *
 * A multiblock point is an ordered list of per-block vectors
 * w = (w_0, ..., w_{n-1}); gradients are taken one block at a time.
 */
#ifndef TAYLIX_MULTIBLOCK_H
#define TAYLIX_MULTIBLOCK_H

#include <Eigen/Dense>
#include <memory>
#include <stdexcept>
#include <vector>
#include "objective.h"

namespace taylix {

using BlockPoint = std::vector<Eigen::VectorXd>;

/**
 * @brief Abstract base class for differentiable multiblock functions
 */
class MultiblockObjective {
public:
    virtual ~MultiblockObjective() = default;

    /**
     * @brief Function value at the block tuple w
     */
    virtual double value(const BlockPoint& w) const = 0;

    /**
     * @brief Gradient with respect to block `index`, evaluated at w
     */
    virtual Eigen::VectorXd gradient(const BlockPoint& w, int index) const = 0;

    virtual std::unique_ptr<MultiblockObjective> clone() const = 0;

    /**
     * @brief Number of blocks the function takes, -1 if not fixed
     */
    virtual int num_blocks() const { return -1; }

    virtual void reset() {}

    /**
     * @brief Move the expansion point of a Taylor surrogate
     * @param points Joint point over all blocks of the enclosing problem
     * @throws std::logic_error if this function has no expansion point
     */
    virtual void recenter(const BlockPoint& points) {
        (void)points;
        throw std::logic_error("recenter is not supported by this multiblock function");
    }

    virtual double lipschitz_constant(const BlockPoint& w, int index) const {
        (void)w;
        (void)index;
        throw std::runtime_error("Lipschitz constant not implemented for this multiblock function");
    }

    virtual MultiblockTaylorState taylor_state() const { return PlainFunction{}; }
};

/**
 * @brief Composite of pairwise losses and per-block penalties
 *
 *   F(w) = sum_{i,j,k} losses[i][j][k]({w_i, w_j})
 *        + sum_{i,k} decoupled_penalties[i][k](w_i)
 *        + sum_{i,k} coupled_penalties[i][k](w_i)
 *
 * Losses form the smooth part; penalties are evaluated exactly.
 */
class MultiblockCompositeObjective : public MultiblockObjective {
public:
    using LossEntries = std::vector<std::shared_ptr<MultiblockObjective>>;
    using PenaltyEntries = std::vector<std::shared_ptr<Objective>>;

    std::vector<std::vector<LossEntries>> losses;       // [i][j][k]
    std::vector<PenaltyEntries> decoupled_penalties;    // [i][k]
    std::vector<PenaltyEntries> coupled_penalties;      // [i][k]

    /**
     * @brief Empty composite over n blocks
     */
    explicit MultiblockCompositeObjective(int n);

    /**
     * @brief Add a pairwise loss between blocks i and j
     */
    void add_loss(int i, int j, std::shared_ptr<MultiblockObjective> loss);

    void add_decoupled_penalty(int i, std::shared_ptr<Objective> penalty);
    void add_coupled_penalty(int i, std::shared_ptr<Objective> penalty);

    int num_blocks() const override { return static_cast<int>(losses.size()); }

    double value(const BlockPoint& w) const override;
    Eigen::VectorXd gradient(const BlockPoint& w, int index) const override;

    double smooth_value(const BlockPoint& w) const;
    Eigen::VectorXd smooth_gradient(const BlockPoint& w, int index) const;
    double non_smooth_value(const BlockPoint& w) const;
    Eigen::VectorXd non_smooth_gradient(const BlockPoint& w, int index) const;

    std::unique_ptr<MultiblockObjective> clone() const override;

    void reset() override;

    /**
     * @brief Recenter Taylor losses at `points`, Taylor penalties at points[i]
     */
    void recenter(const BlockPoint& points) override;

    /**
     * @brief Check the nesting against a point with one vector per block
     * @throws StructureError on a ragged layout, a loss that is not pairwise,
     *         a null entry, or a block count mismatch
     */
    void validate(const BlockPoint& points) const;

private:
    void check_block(int i, const char* what) const;
};

} // namespace taylix

#endif // TAYLIX_MULTIBLOCK_H
