#include "tastecast/utils/metrics.hpp"
#include <numeric>

namespace tastecast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	size_t count = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double denom = std::abs(actual[i]);
		if (denom > std::numeric_limits<double>::epsilon()) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++count;
		}
	}
	if (count == 0)
		return std::nullopt;
	return (sum / static_cast<double>(count)) * 100.0;
}

std::optional<double> Metrics::smape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	size_t count = 0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double denom = (std::abs(actual[i]) + std::abs(predicted[i])) / 2.0;
		if (denom > std::numeric_limits<double>::epsilon()) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++count;
		}
	}
	if (count == 0)
		return std::nullopt;
	return (sum / static_cast<double>(count)) * 100.0;
}

double Metrics::mase(const std::vector<double> &actual, const std::vector<double> &predicted,
                     const std::vector<double> &train, std::size_t m) {
	const double mae_forecast = mae(actual, predicted);
	if (m == 0 || train.size() <= m) {
		throw std::invalid_argument("Training series must be longer than the seasonal period for MASE.");
	}

	double scale = 0.0;
	for (size_t i = m; i < train.size(); ++i) {
		scale += std::abs(train[i] - train[i - m]);
	}
	scale /= static_cast<double>(train.size() - m);

	if (scale < std::numeric_limits<double>::epsilon()) {
		return mae_forecast;
	}
	return mae_forecast / scale;
}

AccuracyMetrics Metrics::evaluate(const std::vector<double> &actual, const std::vector<double> &predicted,
                                  const std::vector<double> &train, std::size_t m) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = mae(actual, predicted);
	metrics.rmse = rmse(actual, predicted);
	metrics.mape = mape(actual, predicted);
	metrics.smape = smape(actual, predicted);
	if (m > 0 && train.size() > m) {
		metrics.mase = mase(actual, predicted, train, m);
	}
	return metrics;
}

} // namespace tastecast::utils
