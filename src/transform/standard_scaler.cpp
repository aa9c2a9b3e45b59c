#include "tastecast/transform/standard_scaler.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace tastecast::transform {

StandardScaleParams StandardScaleParams::fromData(const Eigen::MatrixXd &data) {
	if (data.rows() == 0) {
		throw std::invalid_argument("Cannot compute scaling parameters from an empty matrix.");
	}

	StandardScaleParams params;
	params.mean = data.colwise().mean();
	params.scale.resize(data.cols());

	const Eigen::MatrixXd centered = data.rowwise() - params.mean;
	for (Eigen::Index c = 0; c < data.cols(); ++c) {
		const double variance = centered.col(c).squaredNorm() / static_cast<double>(data.rows());
		const double std_dev = std::sqrt(variance);
		// Constant column: leave it centered rather than dividing by zero
		params.scale(c) = std_dev < std::numeric_limits<double>::epsilon() ? 1.0 : std_dev;
	}
	return params;
}

StandardScaler &StandardScaler::withParameters(StandardScaleParams params) {
	params_ = std::move(params);
	return *this;
}

void StandardScaler::fit(const Eigen::MatrixXd &data) {
	params_ = StandardScaleParams::fromData(data);
}

Eigen::MatrixXd StandardScaler::transform(const Eigen::MatrixXd &data) const {
	ensureParams();
	if (data.cols() != params_->mean.size()) {
		throw std::invalid_argument("Column count does not match the fitted scaler.");
	}
	Eigen::MatrixXd result = data.rowwise() - params_->mean;
	result.array().rowwise() /= params_->scale.array();
	return result;
}

Eigen::MatrixXd StandardScaler::fitTransform(const Eigen::MatrixXd &data) {
	fit(data);
	return transform(data);
}

const StandardScaleParams &StandardScaler::parameters() const {
	ensureParams();
	return *params_;
}

void StandardScaler::ensureParams() const {
	if (!params_.has_value()) {
		throw std::runtime_error("StandardScaler must be fitted before transform");
	}
}

} // namespace tastecast::transform
