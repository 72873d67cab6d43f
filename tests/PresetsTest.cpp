#include <svfmesh/geometry/Presets.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using namespace svfmesh::geometry;

namespace {

double signedVolume(const FunctionMesh& mesh) {
    double volume = 0.0;
    const auto& v = mesh.vertices();
    const auto& idx = mesh.indices();
    for (size_t t = 0; t < idx.size(); t += 3) {
        glm::dvec3 a(v[idx[t]].position), b(v[idx[t + 1]].position), c(v[idx[t + 2]].position);
        volume += glm::dot(a, glm::cross(b, c)) / 6.0;
    }
    return volume;
}

const double kPi = 3.14159265358979323846;

} // namespace

TEST(Presets, DiskIsFlatFan) {
    FunctionMesh disk(presets::makeDisk(0.5f, 32));
    EXPECT_EQ(disk.getVertexCount(), 34u);
    EXPECT_EQ(disk.getIndexCount(), 32u * 3u);
    for (const Vertex& v : disk.vertices()) {
        EXPECT_EQ(v.position.y, 0.0f);
        EXPECT_LE(glm::length(v.position), 0.5f + 1e-6f);
    }
}

TEST(Presets, GroundCoversRectangle) {
    FunctionMesh ground(presets::makeGround(2.0f, 4.0f));
    EXPECT_EQ(ground.getVertexCount(), 8u);
    EXPECT_EQ(ground.getIndexCount(), 6u * 3u);

    float minX = 0, maxX = 0, minZ = 0, maxZ = 0;
    const auto& vertices = ground.vertices();
    // 0 - нижний полюс, его нормаль смотрит вниз
    for (size_t i = 1; i < vertices.size(); ++i) {
        const Vertex& v = vertices[i];
        minX = std::min(minX, v.position.x);
        maxX = std::max(maxX, v.position.x);
        minZ = std::min(minZ, v.position.z);
        maxZ = std::max(maxZ, v.position.z);
        EXPECT_EQ(v.normal, glm::vec3(0.0f, 1.0f, 0.0f));
    }
    EXPECT_FLOAT_EQ(minX, -1.0f);
    EXPECT_FLOAT_EQ(maxX, 1.0f);
    EXPECT_FLOAT_EQ(minZ, -2.0f);
    EXPECT_FLOAT_EQ(maxZ, 2.0f);
}

TEST(Presets, CylinderRingsLieOnRadius) {
    FunctionMesh cylinder(presets::makeCylinder(0.5f, 2.0f, 16, 3));
    EXPECT_EQ(cylinder.getVertexCount(), 3u * 16u + 2u);

    const auto& v = cylinder.vertices();
    for (size_t i = 1; i + 1 < v.size(); ++i) {
        float radius = std::sqrt(v[i].position.x * v[i].position.x + v[i].position.z * v[i].position.z);
        EXPECT_NEAR(radius, 0.5f, 1e-5f);
        EXPECT_GE(v[i].position.y, -1.0f);
        EXPECT_LE(v[i].position.y, 1.0f);
    }
    double volume = signedVolume(cylinder);
    EXPECT_GT(volume, 0.8 * kPi * 0.25 * 2.0);
    EXPECT_LE(volume, kPi * 0.25 * 2.0);
}

TEST(Presets, CylinderDefaultsToTwoRings) {
    FunctionMesh cylinder(presets::makeCylinder(0.5f, 1.0f, 16));
    EXPECT_EQ(cylinder.getVertexCount(), 2u * 16u + 2u);
    EXPECT_EQ(cylinder.getIndexCount() / 3, 4u * 16u);
}

TEST(Presets, SphereVerticesLieOnSurface) {
    FunctionMesh sphere(presets::makeSphere(1.0f, 36, 18));
    for (const Vertex& v : sphere.vertices()) {
        EXPECT_NEAR(glm::length(v.position), 1.0f, 1e-4f);
    }
    EXPECT_FLOAT_EQ(sphere.vertices().front().position.y, -1.0f);
    EXPECT_FLOAT_EQ(sphere.vertices().back().position.y, 1.0f);

    double volume = signedVolume(sphere);
    EXPECT_GT(volume, 0.7 * 4.0 / 3.0 * kPi);
    EXPECT_LE(volume, 4.0 / 3.0 * kPi);
}

TEST(Presets, SphereNormalsPointOutwardOnAverage) {
    FunctionMesh sphere(presets::makeSphere(1.0f, 24, 12));
    for (const Vertex& v : sphere.vertices()) {
        if (glm::length(v.position) < 0.5f) continue;
        EXPECT_GT(glm::dot(v.normal, v.position), 0.0f);
    }
}

TEST(Presets, SquircleBlobFitsItsBox) {
    FunctionMesh blob(presets::makeSquircleBlob(0.5f, 32, 12));
    for (const Vertex& v : blob.vertices()) {
        EXPECT_LE(std::abs(v.position.x), 0.5f + 1e-5f);
        EXPECT_LE(std::abs(v.position.y), 0.5f + 1e-5f);
        EXPECT_LE(std::abs(v.position.z), 0.5f + 1e-5f);
    }
    EXPECT_GT(signedVolume(blob), 0.0);
}
