/**
 * @file Solver.cpp
 * @brief Packed LU decomposition and checked solves
 */

#include <GeoWarp/Internal/Solver.h>
#include <GeoWarp/Core/Exception.h>
#include <GeoWarp/Core/Log.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Geo::Warp::Internal {

// =============================================================================
// LU Decomposition
// =============================================================================

bool LU_DecomposeInPlace(MatX& A, std::vector<int>& P, double threshold, int* singularColumn) {
    const int n = A.Rows();
    if (n != A.Cols()) {
        throw InvalidArgumentException("LU_DecomposeInPlace: matrix must be square");
    }

    P.resize(n);
    for (int i = 0; i < n; ++i) {
        P[i] = i;
    }

    for (int k = 0; k < n; ++k) {
        int pivot = k;
        for (int i = k + 1; i < n; ++i) {
            if (std::abs(A(i, k)) > std::abs(A(pivot, k))) {
                pivot = i;
            }
        }

        // NaN pivots fail too
        if (!(std::abs(A(pivot, k)) > threshold)) {
            if (singularColumn) {
                *singularColumn = k;
            }
            return false;
        }

        if (pivot != k) {
            A.SwapRows(k, pivot);
            std::swap(P[k], P[pivot]);
        }

        const double diag = A(k, k);
        for (int i = k + 1; i < n; ++i) {
            double factor = A(i, k) / diag;
            A(i, k) = factor;
            if (factor == 0.0) continue;
            for (int j = k + 1; j < n; ++j) {
                A(i, j) -= factor * A(k, j);
            }
        }
    }
    return true;
}

LUResult LU_Decompose(const MatX& A, double threshold) {
    LUResult result;
    if (!A.IsSquare()) {
        return result;
    }

    result.LU = A;
    result.valid = LU_DecomposeInPlace(result.LU, result.P, threshold, &result.singularColumn);
    return result;
}

// =============================================================================
// Linear System Solvers
// =============================================================================

VecX SolveFromLU(const LUResult& lu, const VecX& b) {
    if (!lu.valid) {
        throw InvalidArgumentException("SolveFromLU: decomposition is not valid");
    }
    const int n = lu.LU.Rows();
    if (b.Size() != n) {
        throw InvalidArgumentException("SolveFromLU: dimension mismatch");
    }

    // Ly = Pb, unit diagonal
    VecX x(n);
    for (int i = 0; i < n; ++i) {
        double sum = b[lu.P[i]];
        for (int j = 0; j < i; ++j) {
            sum -= lu.LU(i, j) * x[j];
        }
        x[i] = sum;
    }

    // Ux = y
    for (int i = n - 1; i >= 0; --i) {
        double sum = x[i];
        for (int j = i + 1; j < n; ++j) {
            sum -= lu.LU(i, j) * x[j];
        }
        x[i] = sum / lu.LU(i, i);
    }
    return x;
}

std::optional<VecX> TrySolveLU(const MatX& A, const VecX& b, double relativeThreshold) {
    auto solutions = TrySolveLU(A, std::vector<VecX>{b}, relativeThreshold);
    if (!solutions) {
        return std::nullopt;
    }
    return std::move(solutions->front());
}

std::optional<std::vector<VecX>> TrySolveLU(const MatX& A, const std::vector<VecX>& rhs,
                                            double relativeThreshold) {
    if (!A.IsSquare() || A.Empty()) {
        return std::nullopt;
    }
    for (const auto& b : rhs) {
        if (b.Size() != A.Rows()) {
            throw InvalidArgumentException("TrySolveLU: dimension mismatch");
        }
    }

    double threshold = relativeThreshold * std::max(1.0, A.MaxAbs());
    LUResult lu = LU_Decompose(A, threshold);
    if (!lu.valid) {
        Log::Get()->debug("Solver: near-singular {}x{} matrix at column {}",
                          A.Rows(), A.Cols(), lu.singularColumn);
        return std::nullopt;
    }

    std::vector<VecX> solutions;
    solutions.reserve(rhs.size());
    for (const auto& b : rhs) {
        VecX x = SolveFromLU(lu, b);
        if (!x.IsFinite()) {
            Log::Get()->debug("Solver: non-finite solution for {}x{} system", A.Rows(), A.Cols());
            return std::nullopt;
        }
        solutions.push_back(std::move(x));
    }
    return solutions;
}

} // namespace Geo::Warp::Internal
