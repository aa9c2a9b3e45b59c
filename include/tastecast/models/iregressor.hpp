#pragma once

#include "tastecast/utils/metrics.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace tastecast::models {

/**
 * @class IRegressor
 * @brief An interface for point demand regressors over a feature matrix.
 *
 * Rows of the feature matrix are days, columns are the features produced by
 * features::FeatureBuilder in features::featureNames() order.
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * @brief Fits the model.
	 * @param X Feature matrix, one row per observation.
	 * @param y Observed demand aligned with the rows of @p X.
	 */
	virtual void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) = 0;

	/**
	 * @brief Point predictions for each row of @p X.
	 * @throws std::runtime_error If called before fit.
	 */
	virtual Eigen::VectorXd predict(const Eigen::MatrixXd &X) const = 0;

	virtual bool isFitted() const = 0;

	/**
	 * @brief Gets the name of the regressor.
	 */
	virtual std::string getName() const = 0;

	/**
	 * @brief Evaluates accuracy metrics of the predictions for @p X against @p y.
	 * @param train Targets the model was fitted on; scales MASE with period @p m when given.
	 */
	virtual utils::AccuracyMetrics score(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                     const Eigen::VectorXd &train = Eigen::VectorXd(),
	                                     std::size_t m = 1) const {
		const Eigen::VectorXd predicted = predict(X);
		const std::vector<double> actual(y.data(), y.data() + y.size());
		const std::vector<double> fitted(predicted.data(), predicted.data() + predicted.size());
		const std::vector<double> history(train.data(), train.data() + train.size());
		return utils::Metrics::evaluate(actual, fitted, history, m);
	}
};

/// Elementwise prediction interval bounds.
struct PredictionInterval {
	Eigen::VectorXd lower;
	Eigen::VectorXd upper;
};

/**
 * @class IIntervalRegressor
 * @brief A regressor that can also estimate central prediction intervals.
 */
class IIntervalRegressor : public IRegressor {
public:
	/**
	 * @brief Central (1 - alpha) prediction interval for each row of @p X.
	 * @param alpha Total tail probability, in (0, 1).
	 * @param n_boot Number of simulated outcomes per row.
	 * @throws std::runtime_error If called before fit.
	 */
	virtual PredictionInterval predictInterval(const Eigen::MatrixXd &X, double alpha = 0.05,
	                                           int n_boot = 500) const = 0;
};

} // namespace tastecast::models
