#ifndef CUBIC_SPLINE_HPP
#define CUBIC_SPLINE_HPP

#include <cstddef>
#include <vector>

namespace HAZCON {

/**
 * @brief Interpolating cubic spline with not-a-knot end conditions
 *
 * The third derivative is continuous across the second and the
 * second-to-last knot, which makes the spline identical to an
 * interpolating B-spline whose interior knots are the data abscissae
 * without the first and last interior ones. Outside the data range the
 * end polynomials are extended.
 */
class CubicSpline {
public:
    /**
     * @param x Abscissae, strictly increasing, at least four of them
     * @param y Ordinates, same length as x
     * @throws std::invalid_argument on size mismatch, too few points or
     *         non-increasing abscissae
     */
    CubicSpline(const std::vector<double>& x, const std::vector<double>& y);

    double operator()(double x) const { return evaluate(x); }
    double evaluate(double x) const;

    /// First derivative
    double derivative(double x) const;

    double minX() const { return x_.front(); }
    double maxX() const { return x_.back(); }

    const std::vector<double>& knots() const { return x_; }
    const std::vector<double>& values() const { return y_; }

private:
    void solveSecondDerivatives();
    std::size_t findInterval(double x) const;

    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> m_;   // Second derivatives at the knots
};

} // namespace HAZCON

#endif // CUBIC_SPLINE_HPP
