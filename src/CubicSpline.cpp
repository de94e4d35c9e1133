#include "CubicSpline.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace HAZCON {

CubicSpline::CubicSpline(const std::vector<double>& x, const std::vector<double>& y)
    : x_(x), y_(y) {
    if (x_.size() != y_.size()) {
        throw std::invalid_argument("CubicSpline: x and y sizes differ");
    }
    if (x_.size() < 4) {
        throw std::invalid_argument("CubicSpline: at least 4 points required");
    }
    for (size_t i = 1; i < x_.size(); ++i) {
        if (!(x_[i] > x_[i - 1])) {
            throw std::invalid_argument("CubicSpline: abscissae must be strictly increasing");
        }
    }
    solveSecondDerivatives();
}

void CubicSpline::solveSecondDerivatives() {
    const size_t n = x_.size();
    std::vector<double> h(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        h[i] = x_[i + 1] - x_[i];
    }

    // Dense system A * m = rhs; small n, so plain Gaussian elimination
    std::vector<std::vector<double>> A(n, std::vector<double>(n, 0.0));
    std::vector<double> rhs(n, 0.0);

    // Not-a-knot at x_1: m''' continuous
    A[0][0] = h[1];
    A[0][1] = -(h[0] + h[1]);
    A[0][2] = h[0];

    for (size_t i = 1; i + 1 < n; ++i) {
        A[i][i - 1] = h[i - 1];
        A[i][i] = 2.0 * (h[i - 1] + h[i]);
        A[i][i + 1] = h[i];
        rhs[i] = 6.0 * ((y_[i + 1] - y_[i]) / h[i] - (y_[i] - y_[i - 1]) / h[i - 1]);
    }

    // Not-a-knot at x_{n-2}
    A[n - 1][n - 3] = h[n - 2];
    A[n - 1][n - 2] = -(h[n - 3] + h[n - 2]);
    A[n - 1][n - 1] = h[n - 3];

    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        for (size_t r = col + 1; r < n; ++r) {
            if (std::fabs(A[r][col]) > std::fabs(A[pivot][col])) pivot = r;
        }
        if (std::fabs(A[pivot][col]) < 1e-300) {
            throw std::runtime_error("CubicSpline: singular system");
        }
        std::swap(A[col], A[pivot]);
        std::swap(rhs[col], rhs[pivot]);

        for (size_t r = col + 1; r < n; ++r) {
            double factor = A[r][col] / A[col][col];
            if (factor == 0.0) continue;
            for (size_t c = col; c < n; ++c) {
                A[r][c] -= factor * A[col][c];
            }
            rhs[r] -= factor * rhs[col];
        }
    }

    m_.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double sum = rhs[i];
        for (size_t c = i + 1; c < n; ++c) {
            sum -= A[i][c] * m_[c];
        }
        m_[i] = sum / A[i][i];
    }
}

size_t CubicSpline::findInterval(double x) const {
    if (x <= x_.front()) return 0;
    if (x >= x_.back()) return x_.size() - 2;
    auto it = std::upper_bound(x_.begin(), x_.end(), x);
    return static_cast<size_t>(it - x_.begin()) - 1;
}

double CubicSpline::evaluate(double x) const {
    size_t i = findInterval(x);
    double h = x_[i + 1] - x_[i];
    double a = x_[i + 1] - x;
    double b = x - x_[i];

    return m_[i] * a * a * a / (6.0 * h) +
           m_[i + 1] * b * b * b / (6.0 * h) +
           (y_[i] / h - m_[i] * h / 6.0) * a +
           (y_[i + 1] / h - m_[i + 1] * h / 6.0) * b;
}

double CubicSpline::derivative(double x) const {
    size_t i = findInterval(x);
    double h = x_[i + 1] - x_[i];
    double a = x_[i + 1] - x;
    double b = x - x_[i];

    return -m_[i] * a * a / (2.0 * h) +
           m_[i + 1] * b * b / (2.0 * h) +
           (y_[i + 1] - y_[i]) / h -
           (m_[i + 1] - m_[i]) * h / 6.0;
}

} // namespace HAZCON
