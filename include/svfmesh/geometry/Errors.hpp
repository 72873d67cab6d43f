#pragma once

#include <stdexcept>
#include <string>

namespace svfmesh {
namespace geometry {

// Область определения задана неверно (start >= end).
class InvalidRangeError : public std::invalid_argument {
public:
    explicit InvalidRangeError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Количество вершин/слоев меньше минимума, относительная высота вне [0, 1] и т.п.
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace geometry
} // namespace svfmesh
