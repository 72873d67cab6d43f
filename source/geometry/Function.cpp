#include <svfmesh/geometry/Function.hpp>
#include <svfmesh/geometry/Errors.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace svfmesh {
namespace geometry {

LinearInterpolant::LinearInterpolant(std::vector<glm::dvec2> knots)
    : m_knots(std::move(knots)) {
    if (m_knots.size() < 2) {
        throw InvalidParameterError("LinearInterpolant: at least two knots are required");
    }
    for (size_t i = 1; i < m_knots.size(); ++i) {
        if (!(m_knots[i - 1].x < m_knots[i].x)) {
            throw InvalidParameterError("LinearInterpolant: knot x values must be strictly increasing");
        }
    }
}

double LinearInterpolant::operator()(double x) const {
    if (x <= m_knots.front().x) return m_knots.front().y;
    if (x >= m_knots.back().x) return m_knots.back().y;

    // Первый узел, строго правее x
    auto it = std::upper_bound(m_knots.begin(), m_knots.end(), x,
                               [](double value, const glm::dvec2& k) { return value < k.x; });
    const glm::dvec2& b = *it;
    const glm::dvec2& a = *(it - 1);
    double t = (x - a.x) / (b.x - a.x);
    return a.y + (b.y - a.y) * t;
}

Function constant(double value) {
    return [value](double) { return value; };
}

Function circle(double radius) {
    double r2 = radius * radius;
    return [r2](double x) { return std::sqrt(r2 - x * x); };
}

Function squircle(double radius) {
    double r4 = radius * radius * radius * radius;
    return [r4](double x) { return std::pow(r4 - x * x * x * x, 0.25); };
}

} // namespace geometry
} // namespace svfmesh
