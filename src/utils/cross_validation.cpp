#include "tastecast/utils/cross_validation.hpp"
#include "tastecast/utils/logging.hpp"
#include "tastecast/utils/metrics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace tastecast::utils {

std::vector<std::tuple<int, int, int, int>> CrossValidation::generateFolds(int n_samples, int n_splits) {
	if (n_splits < 2) {
		throw std::invalid_argument("Cross-validation needs at least 2 splits.");
	}
	if (n_samples < n_splits + 1) {
		throw std::invalid_argument(
			"Too few samples for cross-validation. Need at least n_splits + 1 samples."
		);
	}

	const int test_size = n_samples / (n_splits + 1);
	std::vector<std::tuple<int, int, int, int>> folds;
	folds.reserve(static_cast<std::size_t>(n_splits));

	for (int k = 0; k < n_splits; ++k) {
		const int test_start = n_samples - (n_splits - k) * test_size;
		folds.emplace_back(0, test_start, test_start, test_start + test_size);
	}
	return folds;
}

CVResults CrossValidation::evaluate(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                    const RegressorFactory &factory, int n_splits) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Feature rows and targets must have the same length.");
	}
	const auto fold_indices = generateFolds(static_cast<int>(X.rows()), n_splits);

	CVResults results;
	results.folds.reserve(fold_indices.size());

	double mae_sum = 0.0;
	int succeeded = 0;
	int fold_id = 0;
	for (const auto &[train_start, train_end, test_start, test_end] : fold_indices) {
		CVFold fold;
		fold.fold_id = fold_id++;
		fold.train_start = train_start;
		fold.train_end = train_end;
		fold.test_start = test_start;
		fold.test_end = test_end;

		const Eigen::MatrixXd X_train = X.middleRows(train_start, train_end - train_start);
		const Eigen::VectorXd y_train = y.segment(train_start, train_end - train_start);
		const Eigen::MatrixXd X_test = X.middleRows(test_start, test_end - test_start);
		const Eigen::VectorXd y_test = y.segment(test_start, test_end - test_start);

		auto model = factory();
		try {
			model->fit(X_train, y_train);
			const Eigen::VectorXd predicted = model->predict(X_test);
			const std::vector<double> actual(y_test.data(), y_test.data() + y_test.size());
			const std::vector<double> forecast(predicted.data(), predicted.data() + predicted.size());
			fold.mae = Metrics::mae(actual, forecast);
			mae_sum += fold.mae;
			++succeeded;
		} catch (const std::exception &e) {
			TASTECAST_WARN("CV fold {} failed: {}", fold.fold_id, e.what());
			fold.mae = std::numeric_limits<double>::quiet_NaN();
		}

		results.folds.push_back(fold);
	}

	results.mean_mae = succeeded > 0 ? mae_sum / static_cast<double>(succeeded)
	                                 : std::numeric_limits<double>::quiet_NaN();
	return results;
}

PenaltySearch CrossValidation::selectPenalty(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                             const std::vector<double> &candidates, int n_splits,
                                             const PenalizedFactory &factory) {
	if (candidates.empty()) {
		throw std::invalid_argument("Penalty search needs at least one candidate.");
	}

	PenaltySearch search;
	search.penalties = candidates;
	search.mean_mae.reserve(candidates.size());
	search.best_penalty = candidates.front();

	double best_mae = std::numeric_limits<double>::infinity();
	for (double penalty : candidates) {
		const auto results = evaluate(X, y, [&factory, penalty]() { return factory(penalty); }, n_splits);
		search.mean_mae.push_back(results.mean_mae);
		TASTECAST_DEBUG("Penalty {} -> mean validation MAE {:.4f}", penalty, results.mean_mae);
		if (!std::isnan(results.mean_mae) && results.mean_mae < best_mae) {
			best_mae = results.mean_mae;
			search.best_penalty = penalty;
		}
	}
	return search;
}

} // namespace tastecast::utils
