#ifndef KINSCENE_GEOMETRY_SHAPE_H_
#define KINSCENE_GEOMETRY_SHAPE_H_

#include <iosfwd>
#include <string>
#include <variant>

#include <Eigen/Core>

namespace kinscene {
namespace geometry {

enum class ShapeType
{
  Box,
  Cylinder,
  Sphere,
  Capsule,
  Mesh,
};

// clang-format off
/*
| ShapeType | Dimensions             | Symmetry axis | Notes                                        |
|-----------|------------------------|---------------|----------------------------------------------|
| Box       | half_extents (x, y, z) | -             | centered on its frame                        |
| Cylinder  | radius, half_length    | local Z       | centered on its frame                        |
| Sphere    | radius                 | -             |                                              |
| Capsule   | radius, half_length    | local Z       | half_length excludes the hemispherical caps  |
| Mesh      | filename, scale        | -             | visual only, never a collision primitive     |
*/
// clang-format on

struct Box
{
  Eigen::Vector3d half_extents = Eigen::Vector3d::Zero();
};

struct Cylinder
{
  double radius = 0.0;
  double half_length = 0.0;
};

struct Sphere
{
  double radius = 0.0;
};

struct Capsule
{
  double radius = 0.0;
  double half_length = 0.0;
};

struct Mesh
{
  std::string filename;  // passed through untouched to the asset loader
  Eigen::Vector3d scale{ 1, 1, 1 };
};

// Shapes a collider may be built from.
using Primitive = std::variant<Box, Cylinder, Sphere, Capsule>;

// Anything a description may author (collision or visual).
using Geometry = std::variant<Box, Cylinder, Sphere, Capsule, Mesh>;

ShapeType shapeType(const Primitive& primitive);
ShapeType shapeType(const Geometry& geometry);

// True when every dimension is finite and strictly positive.
bool hasValidDimensions(const Primitive& primitive);

double volume(const Primitive& primitive);

ShapeType shapeTypeFromString(const std::string& str);
std::string shapeTypeToString(ShapeType type);

// Printers --------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, ShapeType type);
std::ostream& operator<<(std::ostream& os, const Primitive& primitive);
std::ostream& operator<<(std::ostream& os, const Geometry& geometry);

}  // namespace geometry
}  // namespace kinscene

#endif  // KINSCENE_GEOMETRY_SHAPE_H_
