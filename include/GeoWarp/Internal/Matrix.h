#pragma once

/**
 * @file Matrix.h
 * @brief Small dense matrix library for GeoWarp
 *
 * This module provides:
 * - Fixed-size vectors: Vec<N> (Vec3 for weights and affine terms)
 * - Dynamic-size vectors: VecX
 * - Dynamic-size matrices: MatX
 *
 * Used by:
 * - Solver.h (linear equation solving)
 * - AffineEstimation.h (normal equations)
 * - ThinPlateSpline.h (kernel system)
 *
 * Design principles:
 * - Row-major storage
 * - Double precision only
 * - Out-of-range segments throw OutOfRangeException
 */

#include <GeoWarp/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>
#include <vector>

namespace Geo::Warp::Internal {

// =============================================================================
// Fixed-Size Vector: Vec<N>
// =============================================================================

/**
 * @brief Fixed-size vector template
 * @tparam N Vector dimension
 */
template<int N>
class Vec {
    static_assert(N >= 1 && N <= 16, "Vec dimension must be between 1 and 16");

public:
    /// Zero vector
    Vec() {
        std::fill(data_, data_ + N, 0.0);
    }

    /// Missing trailing components are zero, extra values are ignored
    Vec(std::initializer_list<double> init) {
        std::fill(data_, data_ + N, 0.0);
        int i = 0;
        for (auto val : init) {
            if (i >= N) break;
            data_[i++] = val;
        }
    }

    double& operator[](int i) { return data_[i]; }
    const double& operator[](int i) const { return data_[i]; }

    double Min() const { return *std::min_element(data_, data_ + N); }
    double Sum() const {
        double s = 0.0;
        for (int i = 0; i < N; ++i) s += data_[i];
        return s;
    }

private:
    double data_[N];
};

using Vec3 = Vec<3>;

// =============================================================================
// Dynamic-Size Vector: VecX
// =============================================================================

/**
 * @brief Dynamic-size vector
 */
class VecX {
public:
    VecX() = default;

    explicit VecX(int size) : data_(size > 0 ? static_cast<size_t>(size) : 0, 0.0) {}

    VecX(std::initializer_list<double> init) : data_(init) {}

    double& operator[](int i) { return data_[static_cast<size_t>(i)]; }
    const double& operator[](int i) const { return data_[static_cast<size_t>(i)]; }

    int Size() const { return static_cast<int>(data_.size()); }

    /// True if every element is finite
    bool IsFinite() const {
        for (double v : data_) {
            if (!std::isfinite(v)) return false;
        }
        return true;
    }

    /// Copy of elements [start, start + length)
    VecX Segment(int start, int length) const {
        if (start < 0 || length < 0 || start + length > Size()) {
            throw OutOfRangeException("VecX segment out of range");
        }
        VecX result(length);
        std::copy(data_.begin() + start, data_.begin() + start + length, result.data_.begin());
        return result;
    }

private:
    std::vector<double> data_;
};

// =============================================================================
// Dynamic-Size Matrix: MatX
// =============================================================================

/**
 * @brief Dynamic-size matrix, row-major, zero-initialized
 */
class MatX {
public:
    MatX() = default;

    MatX(int rows, int cols) {
        if (rows > 0 && cols > 0) {
            rows_ = rows;
            cols_ = cols;
            data_.assign(static_cast<size_t>(rows) * static_cast<size_t>(cols), 0.0);
        }
    }

    double& operator()(int row, int col) { return data_[Index(row, col)]; }
    const double& operator()(int row, int col) const { return data_[Index(row, col)]; }

    /// Largest absolute element (0 for an empty matrix)
    double MaxAbs() const {
        double m = 0.0;
        for (double v : data_) m = std::max(m, std::abs(v));
        return m;
    }

    int Rows() const { return rows_; }
    int Cols() const { return cols_; }
    bool Empty() const { return data_.empty(); }
    bool IsSquare() const { return rows_ == cols_; }

    /// Exchange two rows in place
    void SwapRows(int r1, int r2) {
        for (int j = 0; j < cols_; ++j) {
            std::swap(data_[Index(r1, j)], data_[Index(r2, j)]);
        }
    }

private:
    size_t Index(int row, int col) const {
        return static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col);
    }

    int rows_ = 0;
    int cols_ = 0;
    std::vector<double> data_;
};

} // namespace Geo::Warp::Internal
