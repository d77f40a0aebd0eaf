#include <kinscene/physics/collider.h>

#include <kinscene/errors.h>
#include <kinscene/geometry/frame.h>

#include <ostream>
#include <sstream>
#include <type_traits>
#include <variant>

namespace kinscene {
namespace physics {

namespace {

template <class>
inline constexpr bool always_false_v = false;

std::string describe(const components::CollisionPrimitive& p, std::size_t index)
{
  std::ostringstream os;
  os << "collision[" << index << "]";
  if (!p.name.empty())
    os << " '" << p.name << "'";
  return os.str();
}

geometry::Primitive toPrimitive(const components::CollisionPrimitive& p, std::size_t index,
                                const std::string& link_name)
{
  return std::visit(
      [&](const auto& g) -> geometry::Primitive {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, geometry::Mesh>)
          throw CompileError(CompileErrorKind::UnsupportedGeometry, link_name,
                             describe(p, index) + " is a mesh ('" + g.filename +
                                 "'); meshes are visual-only, use box/cylinder/sphere/capsule for collision");
        else if constexpr (std::is_same_v<T, geometry::Box> || std::is_same_v<T, geometry::Cylinder> ||
                           std::is_same_v<T, geometry::Sphere> || std::is_same_v<T, geometry::Capsule>)
          return g;
        else
          static_assert(always_false_v<T>, "unhandled geometry");
      },
      p.geometry);
}

}  // namespace

std::optional<CompoundShape> compileCollider(const std::vector<components::CollisionPrimitive>& primitives,
                                             const std::string& link_name)
{
  if (primitives.empty())
    return std::nullopt;

  CompoundShape compound;
  compound.shapes.reserve(primitives.size());

  for (std::size_t i = 0; i < primitives.size(); ++i)
  {
    const auto& p = primitives[i];

    geometry::Primitive shape = toPrimitive(p, i, link_name);
    if (!geometry::hasValidDimensions(shape))
    {
      std::ostringstream os;
      os << describe(p, i) << " has non-positive or non-finite dimensions: " << shape;
      throw CompileError(CompileErrorKind::UnsupportedGeometry, link_name, os.str());
    }

    if (!geometry::isFinite(p.origin))
      throw CompileError(CompileErrorKind::InvalidOrigin, link_name, describe(p, i) + " has a non-finite origin");

    compound.shapes.push_back(SubShape{ geometry::compose(p.origin), std::move(shape) });
  }

  return compound;
}

std::ostream& operator<<(std::ostream& os, const CompoundShape& shape)
{
  os << "CompoundShape{ " << shape.shapes.size() << " shape(s) }\n";
  for (std::size_t i = 0; i < shape.shapes.size(); ++i)
    os << "  [" << i << "] " << shape.shapes[i].shape << " @ " << shape.shapes[i].local << "\n";
  return os;
}

}  // namespace physics
}  // namespace kinscene
