#pragma once

#include <vector>
#include <cstdint>

#include "Function.hpp"
#include "SurfaceBuilder.hpp"
#include "Vertex.hpp"

namespace svfmesh {
namespace geometry {

enum class RefinerKind {
    Greedy, // O(n^2), по умолчанию
    Queue,  // O(n log n), та же выборка
};

// Параметры генерации. Значения по умолчанию дают закругленный "кубик" 18x18.
struct FunctionMeshSettings {
    // Верхняя половина сечения; нижняя получается отражением по оси x.
    Function profile = constant(1.0);
    double profileStart = -1.0;
    double profileEnd = 1.0;
    // Точек на верхнюю половину, не меньше 3.
    uint32_t profileVertices = 18;
    bool mirrorProfile = true;

    // Профиль высоты: x - высота слоя, f(x) - радиальный масштаб слоя.
    // heightStart == heightEnd означает плоскую фигуру.
    Function height = constant(1.0);
    double heightStart = -1.0;
    double heightEnd = 1.0;
    uint32_t layerCount = 18;

    // 0 - плоская фигура, 1 - полная высота.
    float relativeHeight = 1.0f;

    NormalMode normalMode = NormalMode::Blended;
    bool correctUvByLayerRadius = false;
    RefinerKind refiner = RefinerKind::Greedy;
};

// Проверяет все параметры до начала выборки.
// InvalidRangeError - неверная область, InvalidParameterError - остальное.
void validate(const FunctionMeshSettings& settings);

// Слоистое тело (true) или плоский многоугольник (false).
bool isLayered(const FunctionMeshSettings& settings);

// Меш, построенный по функциям. Буферы готовы к копированию в вершинный/индексный буфер GPU.
class FunctionMesh {
public:
    explicit FunctionMesh(const FunctionMeshSettings& settings = FunctionMeshSettings());

    const void* getVerticesData() const;
    size_t getVerticesSizeInBytes() const;
    uint32_t getVertexCount() const;

    const void* getIndicesData() const;
    size_t getIndicesSizeInBytes() const;
    uint32_t getIndexCount() const;

    const std::vector<Vertex>& vertices() const { return m_vertices; }
    const std::vector<uint32_t>& indices() const { return m_indices; }

    // Отдает буферы потребителю, объект остается пустым.
    MeshData release();

private:
    std::vector<Vertex> m_vertices;
    std::vector<uint32_t> m_indices;
};

} // namespace geometry
} // namespace svfmesh
