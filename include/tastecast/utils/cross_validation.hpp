#pragma once

#include "tastecast/models/iregressor.hpp"

#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <tuple>
#include <vector>

namespace tastecast::utils {

/**
 * @brief Results from a single CV fold
 */
struct CVFold {
	int fold_id = 0;
	int train_start = 0;  // Start index of training rows
	int train_end = 0;    // End index of training rows (exclusive)
	int test_start = 0;   // Start index of validation rows
	int test_end = 0;     // End index of validation rows (exclusive)
	double mae = 0.0;
};

/**
 * @brief Results from cross-validation
 */
struct CVResults {
	std::vector<CVFold> folds;

	/// Mean of the fold MAEs; NaN when every fold failed.
	double mean_mae = 0.0;
};

/// Outcome of a penalty search.
struct PenaltySearch {
	double best_penalty = 1.0;
	std::vector<double> penalties;
	std::vector<double> mean_mae;
};

/**
 * @brief Time-ordered cross-validation for feature-matrix regressors.
 *
 * Folds chain forward: each fold trains on every row before its validation
 * block, so validation data is always later than training data.
 */
class CrossValidation {
public:
	using RegressorFactory = std::function<std::unique_ptr<models::IRegressor>()>;
	using PenalizedFactory = std::function<std::unique_ptr<models::IRegressor>(double)>;

	/**
	 * @brief Generate forward-chaining fold indices
	 *
	 * With test_size = n_samples / (n_splits + 1), fold k validates on
	 * [n_samples - (n_splits - k) * test_size, + test_size) and trains on
	 * everything before it.
	 *
	 * @return Vector of (train_start, train_end, test_start, test_end) tuples
	 * @throws std::invalid_argument If n_splits < 2 or n_samples < n_splits + 1
	 */
	static std::vector<std::tuple<int, int, int, int>> generateFolds(int n_samples, int n_splits);

	/**
	 * @brief Scores a regressor with forward-chaining folds by validation MAE
	 *
	 * A fold whose fit fails is logged and excluded from the mean.
	 */
	static CVResults evaluate(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const RegressorFactory &factory,
	                          int n_splits);

	/**
	 * @brief Picks the penalty with the lowest mean validation MAE
	 *
	 * Candidates are tried in order; the first one wins ties.
	 */
	static PenaltySearch selectPenalty(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                   const std::vector<double> &candidates, int n_splits,
	                                   const PenalizedFactory &factory);
};

} // namespace tastecast::utils
