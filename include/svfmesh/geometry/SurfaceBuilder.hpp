#pragma once

#include <vector>
#include <cstdint>

#include "Vertex.hpp"
#include "RingSampler.hpp"

namespace svfmesh {
namespace geometry {

// Готовые буферы: список треугольников, индексы - позиции в vertices.
struct MeshData {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
};

enum class NormalMode {
    Blended,      // смесь нормалей двух профилей (быстро, приближенно)
    AreaWeighted, // пересчет по граням после построения
};

struct SurfaceOptions {
    // Высоты полюсов, если кольцо высоты не передано (плоский случай).
    double heightStart = 0.0;
    double heightEnd = 0.0;
    NormalMode normalMode = NormalMode::Blended;
    // UV по исходному профилю, а не по масштабированному слою (для текстур на крышках).
    bool correctUvByLayerRadius = false;
};

// Строит поверхность из кольца профиля и кольца высоты.
//
// Раскладка вершин: 0 - нижний полюс, затем layerCount колец по profile.points.size()
// вершин, последняя - верхний полюс.
//
// layerCount == 1 или relativeHeight == 0: плоский многоугольник (кольцо высоты может
// быть пустым). Иначе слоистое тело: кольцо высоты (sampleCurve) должно содержать ровно
// layerCount точек, каждая дает высоту relativeHeight * x и радиальный масштаб y.
//
// Нормали слоистого тела в режиме Blended - эвристика (2/3 горизонтальной нормали
// профиля + вертикальная составляющая профиля высоты), а не точная нормаль поверхности.
//
// Обход треугольников снаружи против часовой стрелки для всех групп индексов.
MeshData buildSurface(const SampledRing& profile, const SampledRing& height,
                      float relativeHeight, uint32_t layerCount,
                      const SurfaceOptions& options = SurfaceOptions());

// Новая копия меша с нормалями, усредненными по площадям прилежащих граней.
MeshData recomputeNormals(const MeshData& mesh);

} // namespace geometry
} // namespace svfmesh
