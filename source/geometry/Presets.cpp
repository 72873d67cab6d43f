#include <svfmesh/geometry/Presets.hpp>

#include <cmath>

namespace svfmesh {
namespace geometry {
namespace presets {

namespace {

// Концы круглого профиля лежат на оси и не дублируются: 2n - 2 = segments
uint32_t halfRing(uint32_t segments) {
    return segments / 2 + 1;
}

FunctionMeshSettings flat(FunctionMeshSettings settings) {
    settings.heightStart = 0.0;
    settings.heightEnd = 0.0;
    settings.layerCount = 1;
    settings.relativeHeight = 0.0f;
    return settings;
}

} // namespace

FunctionMeshSettings makeDisk(float radius, uint32_t segments) {
    FunctionMeshSettings settings;
    settings.profile = circle(radius);
    settings.profileStart = -radius;
    settings.profileEnd = radius;
    settings.profileVertices = halfRing(segments);
    return flat(settings);
}

FunctionMeshSettings makeGround(float width, float length) {
    FunctionMeshSettings settings;
    settings.profile = constant(length / 2.0);
    settings.profileStart = -width / 2.0;
    settings.profileEnd = width / 2.0;
    // Постоянная функция: углы + середины сторон
    settings.profileVertices = 3;
    return flat(settings);
}

FunctionMeshSettings makeCylinder(float radius, float height, uint32_t segments, uint32_t layers) {
    FunctionMeshSettings settings;
    settings.profile = circle(radius);
    settings.profileStart = -radius;
    settings.profileEnd = radius;
    settings.profileVertices = halfRing(segments);
    settings.height = constant(1.0);
    settings.heightStart = -height / 2.0;
    settings.heightEnd = height / 2.0;
    settings.layerCount = layers;
    settings.relativeHeight = 1.0f;
    return settings;
}

FunctionMeshSettings makeSphere(float radius, uint32_t segments, uint32_t stacks) {
    FunctionMeshSettings settings;
    settings.profile = circle(radius);
    settings.profileStart = -radius;
    settings.profileEnd = radius;
    settings.profileVertices = halfRing(segments);
    // Масштаб слоя на высоте y: sqrt(1 - (y / r)^2)
    double r = radius;
    settings.height = [r](double y) { return std::sqrt(1.0 - (y / r) * (y / r)); };
    settings.heightStart = -radius;
    settings.heightEnd = radius;
    settings.layerCount = stacks;
    return settings;
}

FunctionMeshSettings makeSquircleBlob(float size, uint32_t segments, uint32_t stacks) {
    FunctionMeshSettings settings;
    settings.profile = squircle(size);
    settings.profileStart = -size;
    settings.profileEnd = size;
    settings.profileVertices = halfRing(segments);
    double s = size;
    settings.height = [s](double y) {
        double t = y / s;
        return std::pow(1.0 - t * t * t * t, 0.25);
    };
    settings.heightStart = -size;
    settings.heightEnd = size;
    settings.layerCount = stacks;
    return settings;
}

} // namespace presets
} // namespace geometry
} // namespace svfmesh
