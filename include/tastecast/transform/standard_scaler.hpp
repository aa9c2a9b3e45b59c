#pragma once

#include <Eigen/Dense>
#include <optional>

namespace tastecast::transform {

struct StandardScaleParams {
	Eigen::RowVectorXd mean;
	Eigen::RowVectorXd scale;

	/// Column means and population standard deviations; zero-variance columns get scale 1.
	static StandardScaleParams fromData(const Eigen::MatrixXd &data);
};

/**
 * @class StandardScaler
 * @brief Column-wise standardization of a feature matrix.
 */
class StandardScaler final {
public:
	StandardScaler() = default;

	StandardScaler &withParameters(StandardScaleParams params);

	void fit(const Eigen::MatrixXd &data);
	Eigen::MatrixXd transform(const Eigen::MatrixXd &data) const;
	Eigen::MatrixXd fitTransform(const Eigen::MatrixXd &data);

	[[nodiscard]] bool isFitted() const noexcept {
		return params_.has_value();
	}

	const StandardScaleParams &parameters() const;

private:
	void ensureParams() const;

	std::optional<StandardScaleParams> params_;
};

} // namespace tastecast::transform
