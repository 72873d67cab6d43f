#pragma once

#include <functional>
#include <vector>

#include <glm/glm.hpp>

namespace svfmesh {
namespace geometry {

// Функция одной переменной. Подходит любой callable: лямбда с захватом,
// свободная функция, интерполянт по таблице.
// Функция обязана быть чистой: от этого зависит детерминированность выборки.
using Function = std::function<double(double)>;

// Кусочно-линейная функция по таблице узлов (x, y).
// x узлов строго возрастают; вне таблицы значение держится на крайнем узле.
class LinearInterpolant {
public:
    explicit LinearInterpolant(std::vector<glm::dvec2> knots);

    double operator()(double x) const;

    const std::vector<glm::dvec2>& knots() const { return m_knots; }

private:
    std::vector<glm::dvec2> m_knots;
};

// Готовые профили
Function constant(double value);
Function circle(double radius);   // sqrt(r^2 - x^2)
Function squircle(double radius); // (r^4 - x^4)^(1/4)

} // namespace geometry
} // namespace svfmesh
