#pragma once

#include <cstdint>

#include "FunctionMesh.hpp"

namespace svfmesh {
namespace geometry {
namespace presets {

// Для круглых профилей segments - число вершин в кольце (четное, >= 4).

// Плоский круг радиуса radius в плоскости XZ.
FunctionMeshSettings makeDisk(float radius = 0.5f, uint32_t segments = 32);

// Плоский прямоугольник width x length (земля, дорога).
FunctionMeshSettings makeGround(float width = 1.0f, float length = 1.0f);

// Цилиндр с плоскими крышками, центр в начале координат.
FunctionMeshSettings makeCylinder(float radius = 0.5f, float height = 1.0f,
                                  uint32_t segments = 32, uint32_t layers = 2);

FunctionMeshSettings makeSphere(float radius = 0.5f, uint32_t segments = 36, uint32_t stacks = 18);

// Сквиркл-блоб: x^4 + z^4 = r^4 в сечении, такой же профиль по высоте.
FunctionMeshSettings makeSquircleBlob(float size = 0.5f, uint32_t segments = 32, uint32_t stacks = 18);

} // namespace presets
} // namespace geometry
} // namespace svfmesh
