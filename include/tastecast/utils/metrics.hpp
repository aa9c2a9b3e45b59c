#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tastecast::utils {

struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::optional<double> mape;
	std::optional<double> smape;
	std::optional<double> mase;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);
	static std::optional<double> smape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Mean absolute scaled error against a seasonal naive forecast of the training data.
	 *
	 * The scale is the mean absolute m-step difference of @p train. When that scale is zero the
	 * unscaled MAE is returned.
	 */
	static double mase(const std::vector<double> &actual, const std::vector<double> &predicted,
	                   const std::vector<double> &train, std::size_t m = 1);

	/// Computes all metrics at once; MASE is only filled when @p train is long enough.
	static AccuracyMetrics evaluate(const std::vector<double> &actual, const std::vector<double> &predicted,
	                                const std::vector<double> &train = {}, std::size_t m = 1);
};

} // namespace tastecast::utils
