#include "tastecast/models/ridge.hpp"

#include <cmath>
#include <stdexcept>

namespace tastecast::models {

RidgeRegression::RidgeRegression(double alpha) : alpha_(alpha) {
	if (!std::isfinite(alpha_) || alpha_ < 0.0) {
		throw std::invalid_argument("Ridge penalty must be a non-negative number.");
	}
}

void RidgeRegression::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() == 0) {
		throw std::invalid_argument("Cannot fit Ridge on an empty feature matrix.");
	}
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Feature rows and targets must have the same length.");
	}

	const Eigen::MatrixXd Z = scaler_.fitTransform(X);
	const double y_mean = y.mean();
	const Eigen::VectorXd centered = y.array() - y_mean;

	Eigen::MatrixXd gram = Z.transpose() * Z;
	gram.diagonal().array() += alpha_;
	coefficients_ = gram.ldlt().solve(Z.transpose() * centered);
	// Standardized columns have zero mean, so the intercept is the target mean
	intercept_ = y_mean;
	is_fitted_ = true;

	TASTECAST_DEBUG("Ridge fitted on {} rows x {} features (alpha={}).", X.rows(), X.cols(), alpha_);
}

Eigen::VectorXd RidgeRegression::predict(const Eigen::MatrixXd &X) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	const Eigen::MatrixXd Z = scaler_.transform(X);
	Eigen::VectorXd result = Z * coefficients_;
	result.array() += intercept_;
	return result;
}

RidgeRegressionBuilder &RidgeRegressionBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

std::unique_ptr<RidgeRegression> RidgeRegressionBuilder::build() {
	return std::unique_ptr<RidgeRegression>(new RidgeRegression(alpha_));
}

} // namespace tastecast::models
