/**
 * @file losses.cpp
 * @brief Implementation of the smooth loss functions
 */
#include "losses.h"
#include "errors.h"
#include <Eigen/Eigenvalues>
#include <stdexcept>
#include <string>

namespace taylix {

LeastSquaresObjective::LeastSquaresObjective(Eigen::MatrixXd X_, Eigen::VectorXd y_)
    : X(std::move(X_)), y(std::move(y_)) {
    if (X.rows() != y.size()) {
        throw std::invalid_argument("X and y must have the same number of rows");
    }
}

std::pair<double, Eigen::VectorXd>
LeastSquaresObjective::value_and_gradient(const Eigen::VectorXd& beta) const {
    Eigen::VectorXd residual = y - X * beta;
    double val = 0.5 * residual.squaredNorm();
    Eigen::VectorXd grad = -X.transpose() * residual;
    return {val, grad};
}

double LeastSquaresObjective::lipschitz_constant() const {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(X.transpose() * X,
                                                          Eigen::EigenvaluesOnly);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("Eigenvalue computation failed for X'X");
    }
    return solver.eigenvalues().maxCoeff();
}

CrossCovarianceLoss::CrossCovarianceLoss(Eigen::MatrixXd X1_, Eigen::MatrixXd X2_)
    : X1(std::move(X1_)), X2(std::move(X2_)) {
    if (X1.rows() != X2.rows()) {
        throw std::invalid_argument("Both blocks must have the same number of samples");
    }
    if (X1.rows() < 2) {
        throw std::invalid_argument("Cross-covariance needs at least two samples");
    }
    cross_ = X1.transpose() * X2 / static_cast<double>(X1.rows() - 1);
}

double CrossCovarianceLoss::value(const BlockPoint& w) const {
    if (w.size() != 2) {
        throw StructureError("Cross-covariance takes 2 blocks, got " + std::to_string(w.size()));
    }
    return -w[0].dot(cross_ * w[1]);
}

Eigen::VectorXd CrossCovarianceLoss::gradient(const BlockPoint& w, int index) const {
    if (w.size() != 2) {
        throw StructureError("Cross-covariance takes 2 blocks, got " + std::to_string(w.size()));
    }
    if (index == 0) return -cross_ * w[1];
    if (index == 1) return -cross_.transpose() * w[0];
    throw StructureError("Cross-covariance has no block " + std::to_string(index));
}

} // namespace taylix
