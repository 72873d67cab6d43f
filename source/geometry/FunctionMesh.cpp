#include <svfmesh/geometry/FunctionMesh.hpp>
#include <svfmesh/geometry/Errors.hpp>
#include <svfmesh/geometry/RingSampler.hpp>
#include <svfmesh/util/Log.hpp>

#include <sstream>
#include <string>
#include <utility>

namespace svfmesh {
namespace geometry {

namespace {

const Refiner& refinerFor(RefinerKind kind) {
    static const GreedyRefiner greedy;
    static const QueueRefiner queue;
    return kind == RefinerKind::Queue ? static_cast<const Refiner&>(queue) : greedy;
}

} // namespace

bool isLayered(const FunctionMeshSettings& settings) {
    return settings.layerCount > 1
        && settings.relativeHeight > 0.0f
        && settings.heightStart < settings.heightEnd;
}

void validate(const FunctionMeshSettings& s) {
    if (!s.profile) {
        throw InvalidParameterError("profile function is not set");
    }
    if (!(s.profileStart < s.profileEnd)) {
        std::ostringstream ss;
        ss << "profile range [" << s.profileStart << ", " << s.profileEnd << "] is empty";
        throw InvalidRangeError(ss.str());
    }
    if (s.profileVertices < 3) {
        throw InvalidParameterError("profile needs at least 3 vertices, got " + std::to_string(s.profileVertices));
    }
    if (s.heightStart > s.heightEnd) {
        std::ostringstream ss;
        ss << "height range [" << s.heightStart << ", " << s.heightEnd << "] is reversed";
        throw InvalidRangeError(ss.str());
    }
    if (s.layerCount == 0) {
        throw InvalidParameterError("layer count must be at least 1");
    }
    if (!(s.relativeHeight >= 0.0f && s.relativeHeight <= 1.0f)) {
        throw InvalidParameterError("relative height must lie in [0, 1], got " + std::to_string(s.relativeHeight));
    }
    if (isLayered(s) && !s.height) {
        throw InvalidParameterError("height function is not set");
    }
}

FunctionMesh::FunctionMesh(const FunctionMeshSettings& settings) {
    validate(settings);

    const Refiner& refiner = refinerFor(settings.refiner);
    SampledRing profile = sampleRing(settings.profile, settings.profileStart, settings.profileEnd,
                                     settings.profileVertices, settings.mirrorProfile, refiner);

    SampledRing height;
    uint32_t layers = 1;
    if (isLayered(settings)) {
        layers = settings.layerCount;
        height = sampleCurve(settings.height, settings.heightStart, settings.heightEnd,
                             layers, refiner);
    }

    SurfaceOptions options;
    options.heightStart = settings.heightStart;
    options.heightEnd = settings.heightEnd;
    options.normalMode = settings.normalMode;
    options.correctUvByLayerRadius = settings.correctUvByLayerRadius;

    MeshData mesh = buildSurface(profile, height, settings.relativeHeight, layers, options);
    m_vertices = std::move(mesh.vertices);
    m_indices = std::move(mesh.indices);

    log::info("FunctionMesh: " + std::to_string(m_vertices.size()) + " vertices, "
              + std::to_string(m_indices.size() / 3) + " triangles, "
              + std::to_string(layers) + (layers == 1 ? " layer" : " layers"));
}

const void* FunctionMesh::getVerticesData() const { return m_vertices.data(); }
size_t FunctionMesh::getVerticesSizeInBytes() const { return m_vertices.size() * sizeof(Vertex); }
uint32_t FunctionMesh::getVertexCount() const { return static_cast<uint32_t>(m_vertices.size()); }
const void* FunctionMesh::getIndicesData() const { return m_indices.data(); }
size_t FunctionMesh::getIndicesSizeInBytes() const { return m_indices.size() * sizeof(uint32_t); }
uint32_t FunctionMesh::getIndexCount() const { return static_cast<uint32_t>(m_indices.size()); }

MeshData FunctionMesh::release() {
    MeshData mesh;
    mesh.vertices = std::move(m_vertices);
    mesh.indices = std::move(m_indices);
    m_vertices.clear();
    m_indices.clear();
    return mesh;
}

} // namespace geometry
} // namespace svfmesh
