#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace perfshift::core {

/**
 * @class DistanceMatrix
 * @brief A symmetric square matrix of pairwise distances between series points.
 *
 * Backed by a dense column-major Eigen matrix so that the row and column
 * partial sums needed by the Q sweep are contiguous block reductions. The
 * class enforces a square, symmetric shape with a zero diagonal at
 * construction time.
 */
class DistanceMatrix {
public:
	using Matrix = Eigen::MatrixXd;

	DistanceMatrix() = default;

	/**
	 * @brief Construct a distance matrix from a square matrix.
	 * @throws std::invalid_argument if the matrix is not square, not symmetric
	 *         or has a non-zero diagonal.
	 */
	explicit DistanceMatrix(Matrix data) : matrix_(std::move(data)) {
		validate();
	}

	/**
	 * @brief Build D[i][j] = |series[i] - series[j]|.
	 */
	static DistanceMatrix absoluteDifferences(const std::vector<double> &series) {
		const auto n = static_cast<Eigen::Index>(series.size());
		const Eigen::Map<const Eigen::VectorXd> values(series.data(), n);
		DistanceMatrix result;
		result.matrix_ = (values.replicate(1, n) - values.transpose().replicate(n, 1)).cwiseAbs();
		return result;
	}

	/**
	 * @brief Returns the number of rows/columns in the matrix.
	 */
	std::size_t size() const noexcept {
		return static_cast<std::size_t>(matrix_.rows());
	}

	bool empty() const noexcept {
		return matrix_.size() == 0;
	}

	/**
	 * @brief Element access without bounds checking.
	 */
	double operator()(std::size_t row, std::size_t col) const {
		return matrix_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
	}

	/**
	 * @brief Bounds-checked element access.
	 * @throws std::out_of_range for an index outside the matrix.
	 */
	double at(std::size_t row, std::size_t col) const {
		if (row >= size() || col >= size()) {
			throw std::out_of_range("distance matrix index out of range");
		}
		return (*this)(row, col);
	}

	/**
	 * @brief Sum of D[row][col] for col in [begin, end).
	 */
	double rowSum(std::size_t row, std::size_t begin, std::size_t end) const {
		if (end <= begin) {
			return 0.0;
		}
		return matrix_.row(static_cast<Eigen::Index>(row))
		    .segment(static_cast<Eigen::Index>(begin), static_cast<Eigen::Index>(end - begin))
		    .sum();
	}

	/**
	 * @brief Sum of D[row][col] for row in [begin, end).
	 */
	double columnSum(std::size_t col, std::size_t begin, std::size_t end) const {
		if (end <= begin) {
			return 0.0;
		}
		return matrix_.col(static_cast<Eigen::Index>(col))
		    .segment(static_cast<Eigen::Index>(begin), static_cast<Eigen::Index>(end - begin))
		    .sum();
	}

	/**
	 * @brief Sum of D[i][j] for i in [row_begin, row_end), j in [col_begin, col_end).
	 */
	double blockSum(std::size_t row_begin, std::size_t row_end, std::size_t col_begin, std::size_t col_end) const {
		if (row_end <= row_begin || col_end <= col_begin) {
			return 0.0;
		}
		return matrix_
		    .block(static_cast<Eigen::Index>(row_begin), static_cast<Eigen::Index>(col_begin),
		           static_cast<Eigen::Index>(row_end - row_begin), static_cast<Eigen::Index>(col_end - col_begin))
		    .sum();
	}

	/**
	 * @brief Returns the underlying matrix by const reference.
	 */
	const Matrix &data() const noexcept {
		return matrix_;
	}

private:
	void validate() const {
		if (matrix_.rows() != matrix_.cols()) {
			throw std::invalid_argument("distance matrix must be square");
		}
		if (matrix_.size() == 0) {
			return;
		}
		if (!matrix_.isApprox(matrix_.transpose())) {
			throw std::invalid_argument("distance matrix must be symmetric");
		}
		if ((matrix_.array() < 0.0).any()) {
			throw std::invalid_argument("distance matrix must be non-negative");
		}
		if (!matrix_.diagonal().isZero()) {
			throw std::invalid_argument("distance matrix must have a zero diagonal");
		}
	}

	Matrix matrix_;
};

} // namespace perfshift::core
