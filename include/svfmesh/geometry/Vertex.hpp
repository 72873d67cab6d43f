#pragma once

// GLM для математических типов
#include <glm/glm.hpp>

namespace svfmesh {
namespace geometry {

// Одна вершина итогового буфера.
// Раскладка плотная (8 float), буфер можно копировать в GPU как есть.
struct Vertex {
    glm::vec3 position; // Координаты вершины
    glm::vec3 normal;   // Нормаль (для сплошных тел - приближенная, см. SurfaceBuilder)
    glm::vec2 uv;       // Текстурные координаты
};

} // namespace geometry
} // namespace svfmesh
