#pragma once

#include "tastecast/models/iregressor.hpp"
#include "tastecast/models/ridge.hpp"
#include "tastecast/utils/cross_validation.hpp"
#include "tastecast/utils/logging.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace tastecast::models {

class ProbabilisticRegressorBuilder; // Forward declaration

/**
 * @class ProbabilisticRegressor
 * @brief Ridge point forecaster with residual-bootstrap prediction intervals.
 *
 * fit() optionally selects the ridge penalty by forward-chaining cross-validation,
 * refits on all rows and caches the in-sample residuals. predictInterval() adds
 * resampled residuals to the point predictions and reads the empirical quantiles
 * of the simulated outcomes.
 *
 * The bootstrap treats residuals as independent and identically distributed.
 * Daily demand errors are usually serially correlated, so the intervals are an
 * approximation and tend to be too narrow for multi-day horizons.
 */
class ProbabilisticRegressor final : public IIntervalRegressor {
public:
	friend class ProbabilisticRegressorBuilder;

	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override;
	PredictionInterval predictInterval(const Eigen::MatrixXd &X, double alpha = 0.05,
	                                   int n_boot = 500) const override;

	bool isFitted() const override {
		return base_ != nullptr && base_->isFitted();
	}

	std::string getName() const override {
		return "ProbabilisticRidge";
	}

	/// In-sample residuals (y - fitted) of the last fit.
	const std::vector<double> &residuals() const {
		return residuals_;
	}

	/// Penalty used by the fitted ridge model.
	double selectedPenalty() const {
		return selected_penalty_;
	}

	/// Cross-validation scores of the last penalty search, when one ran.
	const std::optional<utils::PenaltySearch> &penaltySearch() const {
		return search_;
	}

	std::uint64_t seed() const {
		return seed_;
	}

private:
	ProbabilisticRegressor(double default_penalty, std::vector<double> candidates, int cv_splits,
	                       std::uint64_t seed);

	double default_penalty_;
	std::vector<double> candidates_;
	int cv_splits_;
	std::uint64_t seed_;

	std::unique_ptr<RidgeRegression> base_;
	std::vector<double> residuals_;
	double selected_penalty_;
	std::optional<utils::PenaltySearch> search_;
};

/**
 * @class ProbabilisticRegressorBuilder
 * @brief A builder for fluently configuring and creating ProbabilisticRegressor models.
 */
class ProbabilisticRegressorBuilder {
public:
	/// Penalty used when no search runs (no candidates, or too few rows). Default 1.0.
	ProbabilisticRegressorBuilder &withPenalty(double alpha);

	/// Candidate penalties for cross-validated selection. Empty disables the search.
	ProbabilisticRegressorBuilder &withPenaltyCandidates(std::vector<double> candidates);

	/// Number of forward-chaining folds. Default 5.
	ProbabilisticRegressorBuilder &withCvSplits(int splits);

	/// Seed for the residual bootstrap. Every interval call restarts from it.
	ProbabilisticRegressorBuilder &withSeed(std::uint64_t seed);

	std::unique_ptr<ProbabilisticRegressor> build();

private:
	double penalty_ = 1.0;
	std::vector<double> candidates_ {0.1, 0.3, 1.0, 3.0, 10.0};
	int cv_splits_ = 5;
	std::uint64_t seed_ = 0;
};

} // namespace tastecast::models
