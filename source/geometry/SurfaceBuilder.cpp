#include <svfmesh/geometry/SurfaceBuilder.hpp>
#include <svfmesh/geometry/Errors.hpp>
#include <svfmesh/util/Log.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <string>

namespace svfmesh {
namespace geometry {

namespace {

// Точка кольца в плоскости XZ
struct RingVertex {
    double x;
    double z;
    double slope;
    double side; // +1 верхняя половина, -1 отраженная
};

// Удвоенная ориентированная площадь в координатах (x, z).
// Отрицательная - обход против часовой стрелки при взгляде сверху (+Y).
double signedArea(const std::vector<RingVertex>& ring) {
    double area = 0.0;
    for (size_t i = 0; i < ring.size(); ++i) {
        const RingVertex& a = ring[i];
        const RingVertex& b = ring[(i + 1) % ring.size()];
        area += a.x * b.z - b.x * a.z;
    }
    return area;
}

std::vector<RingVertex> orientedRing(const SampledRing& profile) {
    std::vector<RingVertex> ring;
    ring.reserve(profile.points.size());
    for (size_t i = 0; i < profile.points.size(); ++i) {
        const SamplePoint& p = profile.points[i];
        ring.push_back({p.x, p.y, p.slope, i < profile.upperCount ? 1.0 : -1.0});
    }
    // По часовой стрелке: левая нормаль к направлению обхода смотрит внутрь
    if (signedArea(ring) > 0.0) {
        log::info("buildSurface: profile ring is clockwise, reversing it");
        std::reverse(ring.begin(), ring.end());
        for (RingVertex& p : ring) {
            p.side = -p.side;
        }
    }
    return ring;
}

glm::dvec3 horizontalNormal(const RingVertex& p) {
    return p.side * glm::normalize(glm::dvec3(-std::tan(p.slope), 0.0, 1.0));
}

} // namespace

MeshData buildSurface(const SampledRing& profile, const SampledRing& height,
                      float relativeHeight, uint32_t layerCount,
                      const SurfaceOptions& options) {
    if (layerCount == 0) {
        throw InvalidParameterError("buildSurface: layer count must be at least 1");
    }
    if (!(relativeHeight >= 0.0f && relativeHeight <= 1.0f)) {
        throw InvalidParameterError("buildSurface: relative height must lie in [0, 1], got "
                                    + std::to_string(relativeHeight));
    }
    if (profile.points.size() < 3 || profile.upperCount < 2
        || profile.upperCount > profile.points.size()) {
        throw InvalidParameterError("buildSurface: profile ring needs at least 3 points and a valid upper half");
    }

    const bool layered = layerCount > 1 && relativeHeight > 0.0f;
    // Кольцо высоты выбирается вызывающим с числом точек, равным числу слоев
    assert(!layered || height.points.size() == layerCount);

    const uint32_t layers = layered ? layerCount : 1;
    const double rh = relativeHeight;

    // Для UV: ширина по x исходной области и половина высоты по z
    const double xStart = profile.points.front().x;
    const double width = profile.points[profile.upperCount - 1].x - xStart;
    const double maxY = profile.maxY > 0.0 ? profile.maxY : 1.0;

    double poleBottom, poleTop;
    if (!height.points.empty()) {
        poleBottom = rh * height.points.front().x;
        poleTop = rh * height.points.back().x;
    } else {
        poleBottom = rh * options.heightStart;
        poleTop = rh * options.heightEnd;
    }
    const bool coincidentPoles = poleBottom == poleTop;

    const std::vector<RingVertex> ring = orientedRing(profile);
    const uint32_t amount = static_cast<uint32_t>(ring.size());

    MeshData mesh;
    mesh.vertices.reserve(static_cast<size_t>(amount) * layers + 2);

    auto uvFor = [&](double x, double z) {
        return glm::vec2(static_cast<float>((x - xStart) / width),
                         static_cast<float>((z + maxY) / (maxY * 2.0)));
    };

    mesh.vertices.push_back({{0.0f, static_cast<float>(poleBottom), 0.0f}, {0.0f, -1.0f, 0.0f}, {0.5f, 0.5f}});

    if (!layered) {
        const float y = static_cast<float>((poleBottom + poleTop) / 2.0);
        for (const RingVertex& p : ring) {
            glm::vec3 normal(0.0f, 1.0f, 0.0f);
            if (!coincidentPoles) {
                normal = glm::vec3(horizontalNormal(p));
            }
            mesh.vertices.push_back({{static_cast<float>(p.x), y, static_cast<float>(p.z)},
                                     normal, uvFor(p.x, p.z)});
        }
    } else {
        for (const SamplePoint& h : height.points) {
            const glm::dvec3 normalVertical =
                glm::normalize(glm::dvec3(1.0, -std::tan(h.slope), 1.0));
            const double y = rh * h.x;
            for (const RingVertex& p : ring) {
                const double x = p.x * h.y;
                const double z = p.z * h.y;

                // Горизонтальная нормаль ослаблена до 2/3, вертикальная берется как есть
                const glm::dvec3 normalHorizontal = horizontalNormal(p);
                const glm::dvec3 blended(normalHorizontal.x / 3.0 * 2.0,
                                         normalVertical.y,
                                         normalHorizontal.z / 3.0 * 2.0);

                glm::vec2 uv = options.correctUvByLayerRadius ? uvFor(p.x, p.z) : uvFor(x, z);
                mesh.vertices.push_back({{static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)},
                                         glm::vec3(glm::normalize(blended)), uv});
            }
        }
    }

    const uint32_t topPole = static_cast<uint32_t>(mesh.vertices.size());
    mesh.vertices.push_back({{0.0f, static_cast<float>(poleTop), 0.0f}, {0.0f, 1.0f, 0.0f}, {0.5f, 0.5f}});

    auto ringIndex = [amount](uint32_t layer, uint32_t i) { return layer * amount + i + 1; };

    const bool bottomCap = layered || !coincidentPoles;
    size_t triangles = static_cast<size_t>(amount) * (bottomCap ? 2 : 1)
                     + static_cast<size_t>(amount) * 2 * (layers - 1);
    mesh.indices.reserve(triangles * 3);

    // Нижняя крышка
    if (bottomCap) {
        for (uint32_t i = 0; i < amount; ++i) {
            uint32_t next = (i + 1) % amount;
            mesh.indices.insert(mesh.indices.end(), {ringIndex(0, next), ringIndex(0, i), 0u});
        }
    }

    // Боковые стенки: квад (bl, br, tr, tl) -> два треугольника.
    // Последний сегмент замыкается на первую вершину слоя.
    for (uint32_t layer = 1; layer < layers; ++layer) {
        for (uint32_t i = 0; i < amount; ++i) {
            uint32_t next = (i + 1) % amount;
            uint32_t tl = ringIndex(layer, i);
            uint32_t tr = ringIndex(layer, next);
            uint32_t bl = ringIndex(layer - 1, i);
            uint32_t br = ringIndex(layer - 1, next);
            mesh.indices.insert(mesh.indices.end(), {br, tr, tl});
            mesh.indices.insert(mesh.indices.end(), {bl, br, tl});
        }
    }

    // Верхняя крышка
    for (uint32_t i = 0; i < amount; ++i) {
        uint32_t next = (i + 1) % amount;
        mesh.indices.insert(mesh.indices.end(), {ringIndex(layers - 1, i), ringIndex(layers - 1, next), topPole});
    }

    if (options.normalMode == NormalMode::AreaWeighted) {
        return recomputeNormals(mesh);
    }
    return mesh;
}

MeshData recomputeNormals(const MeshData& mesh) {
    MeshData result = mesh;
    std::vector<glm::vec3> accumulated(result.vertices.size(), glm::vec3(0.0f));

    for (size_t t = 0; t + 2 < result.indices.size(); t += 3) {
        uint32_t a = result.indices[t];
        uint32_t b = result.indices[t + 1];
        uint32_t c = result.indices[t + 2];
        const glm::vec3& pa = result.vertices[a].position;
        // Длина векторного произведения = удвоенная площадь, отсюда вес по площади
        glm::vec3 faceNormal = glm::cross(result.vertices[b].position - pa,
                                          result.vertices[c].position - pa);
        accumulated[a] += faceNormal;
        accumulated[b] += faceNormal;
        accumulated[c] += faceNormal;
    }

    for (size_t i = 0; i < result.vertices.size(); ++i) {
        float length = glm::length(accumulated[i]);
        // Вершины только с вырожденными гранями сохраняют прежнюю нормаль
        if (length > 0.0f) {
            result.vertices[i].normal = accumulated[i] / length;
        }
    }
    return result;
}

} // namespace geometry
} // namespace svfmesh
