#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "Function.hpp"

namespace svfmesh {
namespace geometry {

// Шаг конечной разности для оценки производной.
constexpr double kSlopeStep = 1e-6;

// Точка выборки: y = f(x), slope = atan(f'(x)).
struct SamplePoint {
    double x;
    double y;
    double slope;
};

// Результат выборки кольца.
struct SampledRing {
    std::vector<SamplePoint> points;
    // Сколько первых точек относятся к верхней половине (все, если без отражения).
    size_t upperCount = 0;
    // Максимум f по вставленным серединам (для нормировки UV).
    double maxY = 0.0;
};

// Стратегия уточнения: из двух граничных точек доводит последовательность до
// targetCount точек, каждый раз деля интервал с наибольшим перепадом наклона.
// Все реализации обязаны выдавать одинаковую последовательность.
class Refiner {
public:
    virtual ~Refiner() = default;

    // points на входе содержит ровно две точки (start, end).
    // Возвращает максимум f по вставленным точкам (не меньше 0).
    virtual double refine(const Function& f, std::vector<SamplePoint>& points,
                          uint32_t targetCount) const = 0;
};

// Полный перебор интервалов на каждой итерации: O(n^2).
// Для типичных бюджетов (десятки точек) этого достаточно.
class GreedyRefiner : public Refiner {
public:
    double refine(const Function& f, std::vector<SamplePoint>& points,
                  uint32_t targetCount) const override;
};

// Очередь с приоритетом по интервалам: O(n log n), результат совпадает с GreedyRefiner.
class QueueRefiner : public Refiner {
public:
    double refine(const Function& f, std::vector<SamplePoint>& points,
                  uint32_t targetCount) const override;
};

SamplePoint samplePoint(const Function& f, double x);

// Адаптивная выборка кривой f на [xStart, xEnd].
// Бросает InvalidRangeError при xStart >= xEnd и InvalidParameterError при vertexCount < 3.
// При mirror = true к верхней половине добавляется отраженная нижняя
// (2 * vertexCount - k точек, k - число граничных точек с f(x) == 0).
SampledRing sampleRing(const Function& f, double xStart, double xEnd,
                       uint32_t vertexCount, bool mirror);
SampledRing sampleRing(const Function& f, double xStart, double xEnd,
                       uint32_t vertexCount, bool mirror, const Refiner& refiner);

// Выборка открытой кривой (профиль высоты): те же правила, но достаточно двух точек,
// тогда остаются только концы отрезка. Бросает InvalidParameterError при vertexCount < 2.
SampledRing sampleCurve(const Function& f, double xStart, double xEnd, uint32_t vertexCount);
SampledRing sampleCurve(const Function& f, double xStart, double xEnd,
                        uint32_t vertexCount, const Refiner& refiner);

// Дописывает к верхней половине нижнюю (отражение по y = 0, обратный порядок).
// Граничная точка пропускается, только если значение функции в ней равно нулю.
void mirrorRing(std::vector<SamplePoint>& upper);

} // namespace geometry
} // namespace svfmesh
