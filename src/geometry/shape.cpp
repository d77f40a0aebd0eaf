#include <kinscene/geometry/shape.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace kinscene {
namespace geometry {

namespace {

template <class>
inline constexpr bool always_false_v = false;

bool positiveFinite(double v)
{
  return std::isfinite(v) && v > 0.0;
}

void printVec(std::ostream& os, const Eigen::Vector3d& v)
{
  os << "[" << v.x() << ", " << v.y() << ", " << v.z() << "]";
}

}  // namespace

ShapeType shapeType(const Primitive& primitive)
{
  return std::visit(
      [](const auto& s) -> ShapeType {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Box>)
          return ShapeType::Box;
        else if constexpr (std::is_same_v<T, Cylinder>)
          return ShapeType::Cylinder;
        else if constexpr (std::is_same_v<T, Sphere>)
          return ShapeType::Sphere;
        else if constexpr (std::is_same_v<T, Capsule>)
          return ShapeType::Capsule;
        else
          static_assert(always_false_v<T>, "unhandled primitive");
      },
      primitive);
}

ShapeType shapeType(const Geometry& geometry)
{
  return std::visit(
      [](const auto& s) -> ShapeType {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Mesh>)
          return ShapeType::Mesh;
        else
          return shapeType(Primitive(s));
      },
      geometry);
}

bool hasValidDimensions(const Primitive& primitive)
{
  return std::visit(
      [](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Box>)
          return positiveFinite(s.half_extents.x()) && positiveFinite(s.half_extents.y()) &&
                 positiveFinite(s.half_extents.z());
        else if constexpr (std::is_same_v<T, Cylinder> || std::is_same_v<T, Capsule>)
          return positiveFinite(s.radius) && positiveFinite(s.half_length);
        else if constexpr (std::is_same_v<T, Sphere>)
          return positiveFinite(s.radius);
        else
          static_assert(always_false_v<T>, "unhandled primitive");
      },
      primitive);
}

double volume(const Primitive& primitive)
{
  return std::visit(
      [](const auto& s) -> double {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Box>)
          return 8.0 * s.half_extents.x() * s.half_extents.y() * s.half_extents.z();
        else if constexpr (std::is_same_v<T, Cylinder>)
          return M_PI * s.radius * s.radius * 2.0 * s.half_length;
        else if constexpr (std::is_same_v<T, Sphere>)
          return 4.0 / 3.0 * M_PI * s.radius * s.radius * s.radius;
        else if constexpr (std::is_same_v<T, Capsule>)
          return M_PI * s.radius * s.radius * (2.0 * s.half_length + 4.0 / 3.0 * s.radius);
        else
          static_assert(always_false_v<T>, "unhandled primitive");
      },
      primitive);
}

ShapeType shapeTypeFromString(const std::string& str)
{
  std::string lower = str;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

  if (lower == "box")
    return ShapeType::Box;
  if (lower == "cylinder")
    return ShapeType::Cylinder;
  if (lower == "sphere")
    return ShapeType::Sphere;
  if (lower == "capsule")
    return ShapeType::Capsule;
  if (lower == "mesh")
    return ShapeType::Mesh;
  throw std::runtime_error("Unknown ShapeType: " + str);
}

std::string shapeTypeToString(ShapeType type)
{
  switch (type)
  {
    case ShapeType::Box:
      return "Box";
    case ShapeType::Cylinder:
      return "Cylinder";
    case ShapeType::Sphere:
      return "Sphere";
    case ShapeType::Capsule:
      return "Capsule";
    case ShapeType::Mesh:
      return "Mesh";
    default:
      return "Unknown";
  }
}

std::ostream& operator<<(std::ostream& os, ShapeType type)
{
  return os << shapeTypeToString(type);
}

std::ostream& operator<<(std::ostream& os, const Primitive& primitive)
{
  std::visit(
      [&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Box>)
        {
          os << "Box{ half_extents=";
          printVec(os, s.half_extents);
          os << " }";
        }
        else if constexpr (std::is_same_v<T, Cylinder>)
          os << "Cylinder{ radius=" << s.radius << ", half_length=" << s.half_length << " }";
        else if constexpr (std::is_same_v<T, Sphere>)
          os << "Sphere{ radius=" << s.radius << " }";
        else if constexpr (std::is_same_v<T, Capsule>)
          os << "Capsule{ radius=" << s.radius << ", half_length=" << s.half_length << " }";
        else
          static_assert(always_false_v<T>, "unhandled primitive");
      },
      primitive);
  return os;
}

std::ostream& operator<<(std::ostream& os, const Geometry& geometry)
{
  std::visit(
      [&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Mesh>)
        {
          os << "Mesh{ filename=\"" << s.filename << "\", scale=";
          printVec(os, s.scale);
          os << " }";
        }
        else
          os << Primitive(s);
      },
      geometry);
  return os;
}

}  // namespace geometry
}  // namespace kinscene
