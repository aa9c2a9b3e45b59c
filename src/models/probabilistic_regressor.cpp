#include "tastecast/models/probabilistic_regressor.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace tastecast::models {

namespace {

// Linear interpolation between order statistics of an ascending sample.
double sortedQuantile(const std::vector<double> &sorted, double q) {
	const double position = q * static_cast<double>(sorted.size() - 1);
	const auto below = static_cast<std::size_t>(std::floor(position));
	const auto above = std::min(below + 1, sorted.size() - 1);
	const double fraction = position - static_cast<double>(below);
	return sorted[below] + (sorted[above] - sorted[below]) * fraction;
}

} // namespace

ProbabilisticRegressor::ProbabilisticRegressor(double default_penalty, std::vector<double> candidates,
                                               int cv_splits, std::uint64_t seed)
    : default_penalty_(default_penalty), candidates_(std::move(candidates)), cv_splits_(cv_splits), seed_(seed),
      selected_penalty_(default_penalty) {
	if (!std::isfinite(default_penalty_) || default_penalty_ < 0.0) {
		throw std::invalid_argument("Ridge penalty must be a non-negative number.");
	}
	for (double candidate : candidates_) {
		if (!std::isfinite(candidate) || candidate < 0.0) {
			throw std::invalid_argument("Penalty candidates must be non-negative numbers.");
		}
	}
	if (!candidates_.empty() && cv_splits_ < 2) {
		throw std::invalid_argument("Penalty search needs at least 2 CV splits.");
	}
}

void ProbabilisticRegressor::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() == 0) {
		throw std::invalid_argument("Cannot fit on an empty feature matrix.");
	}
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Feature rows and targets must have the same length.");
	}

	selected_penalty_ = default_penalty_;
	search_.reset();
	if (!candidates_.empty()) {
		if (X.rows() >= cv_splits_ + 1) {
			search_ = utils::CrossValidation::selectPenalty(
			    X, y, candidates_, cv_splits_,
			    [](double alpha) -> std::unique_ptr<IRegressor> { return RidgeRegressionBuilder().withAlpha(alpha).build(); });
			selected_penalty_ = search_->best_penalty;
		} else {
			TASTECAST_WARN("Only {} training rows; skipping penalty search and using alpha={}.", X.rows(),
			               default_penalty_);
		}
	}

	base_ = RidgeRegressionBuilder().withAlpha(selected_penalty_).build();
	base_->fit(X, y);

	const Eigen::VectorXd fitted = base_->predict(X);
	residuals_.resize(static_cast<std::size_t>(y.size()));
	for (Eigen::Index i = 0; i < y.size(); ++i) {
		residuals_[static_cast<std::size_t>(i)] = y(i) - fitted(i);
	}

	TASTECAST_INFO("ProbabilisticRidge fitted on {} rows (alpha={}).", X.rows(), selected_penalty_);
}

Eigen::VectorXd ProbabilisticRegressor::predict(const Eigen::MatrixXd &X) const {
	if (!isFitted()) {
		throw std::runtime_error("ProbabilisticRegressor must be fit before calling predict.");
	}
	return base_->predict(X);
}

PredictionInterval ProbabilisticRegressor::predictInterval(const Eigen::MatrixXd &X, double alpha,
                                                           int n_boot) const {
	if (!isFitted() || residuals_.empty()) {
		throw std::runtime_error("ProbabilisticRegressor must be fit before calling predictInterval.");
	}
	if (!(alpha > 0.0 && alpha < 1.0)) {
		throw std::invalid_argument("Interval alpha must be in (0, 1).");
	}
	if (n_boot < 1) {
		throw std::invalid_argument("Bootstrap sample count must be positive.");
	}

	const Eigen::VectorXd point = predict(X);
	const auto rows = static_cast<std::size_t>(point.size());
	const auto draws = static_cast<std::size_t>(n_boot);

	std::mt19937_64 rng(seed_);
	std::uniform_int_distribution<std::size_t> pick(0, residuals_.size() - 1);

	// simulations[row][draw]
	std::vector<std::vector<double>> simulations(rows, std::vector<double>(draws));
	for (std::size_t b = 0; b < draws; ++b) {
		for (std::size_t r = 0; r < rows; ++r) {
			simulations[r][b] = point(static_cast<Eigen::Index>(r)) + residuals_[pick(rng)];
		}
	}

	PredictionInterval interval;
	interval.lower.resize(point.size());
	interval.upper.resize(point.size());
	for (std::size_t r = 0; r < rows; ++r) {
		auto &outcomes = simulations[r];
		std::sort(outcomes.begin(), outcomes.end());
		interval.lower(static_cast<Eigen::Index>(r)) = sortedQuantile(outcomes, alpha / 2.0);
		interval.upper(static_cast<Eigen::Index>(r)) = sortedQuantile(outcomes, 1.0 - alpha / 2.0);
	}
	return interval;
}

ProbabilisticRegressorBuilder &ProbabilisticRegressorBuilder::withPenalty(double alpha) {
	penalty_ = alpha;
	return *this;
}

ProbabilisticRegressorBuilder &ProbabilisticRegressorBuilder::withPenaltyCandidates(std::vector<double> candidates) {
	candidates_ = std::move(candidates);
	return *this;
}

ProbabilisticRegressorBuilder &ProbabilisticRegressorBuilder::withCvSplits(int splits) {
	cv_splits_ = splits;
	return *this;
}

ProbabilisticRegressorBuilder &ProbabilisticRegressorBuilder::withSeed(std::uint64_t seed) {
	seed_ = seed;
	return *this;
}

std::unique_ptr<ProbabilisticRegressor> ProbabilisticRegressorBuilder::build() {
	TASTECAST_DEBUG("Building ProbabilisticRidge with {} penalty candidates, {} CV splits, seed {}.",
	                candidates_.size(), cv_splits_, seed_);
	return std::unique_ptr<ProbabilisticRegressor>(
	    new ProbabilisticRegressor(penalty_, candidates_, cv_splits_, seed_));
}

} // namespace tastecast::models
