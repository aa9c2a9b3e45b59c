#pragma once

#include "tastecast/models/iregressor.hpp"
#include "tastecast/transform/standard_scaler.hpp"
#include "tastecast/utils/logging.hpp"

#include <Eigen/Dense>
#include <memory>

namespace tastecast::models {

class RidgeRegressionBuilder; // Forward declaration

/**
 * @class RidgeRegression
 * @brief L2-penalized linear regression on standardized features.
 *
 * Features are standardized with the training mean and population standard
 * deviation; the intercept is not penalized.
 */
class RidgeRegression final : public IRegressor {
public:
	friend class RidgeRegressionBuilder;

	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override;

	bool isFitted() const override {
		return is_fitted_;
	}

	std::string getName() const override {
		return "Ridge";
	}

	double penalty() const {
		return alpha_;
	}

	/// Coefficients on the standardized scale.
	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}

	double intercept() const {
		return intercept_;
	}

private:
	explicit RidgeRegression(double alpha);

	double alpha_;
	transform::StandardScaler scaler_;
	Eigen::VectorXd coefficients_;
	double intercept_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @class RidgeRegressionBuilder
 * @brief A builder for fluently configuring and creating RidgeRegression models.
 */
class RidgeRegressionBuilder {
public:
	/**
	 * @brief Sets the L2 penalty strength.
	 * @param alpha Non-negative penalty.
	 */
	RidgeRegressionBuilder &withAlpha(double alpha);

	std::unique_ptr<RidgeRegression> build();

private:
	double alpha_ = 1.0;
};

} // namespace tastecast::models
