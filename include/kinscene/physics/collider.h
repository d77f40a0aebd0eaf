#ifndef KINSCENE_PHYSICS_COLLIDER_H_
#define KINSCENE_PHYSICS_COLLIDER_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <kinscene/components/link.h>
#include <kinscene/geometry/shape.h>
#include <kinscene/geometry/transform.h>

namespace kinscene {
namespace physics {

struct SubShape
{
  geometry::ResolvedFrame local;  // pose of the primitive in the link frame
  geometry::Primitive shape;
};

// Union of primitives rigidly attached to one body.
struct CompoundShape
{
  std::vector<SubShape> shapes;

  std::size_t size() const
  {
    return shapes.size();
  }
};

/**
 * Compile the collision primitives of one link into a compound shape.
 *
 * Returns std::nullopt for an empty list (the body exists but has no collision response).
 * Order is preserved: shapes[i] comes from primitives[i].
 *
 * @throws CompileError UnsupportedGeometry for Mesh primitives or invalid dimensions,
 *         InvalidOrigin for non-finite origins; both name `link_name`.
 */
std::optional<CompoundShape> compileCollider(const std::vector<components::CollisionPrimitive>& primitives,
                                             const std::string& link_name);

std::ostream& operator<<(std::ostream& os, const CompoundShape& shape);

}  // namespace physics
}  // namespace kinscene

#endif  // KINSCENE_PHYSICS_COLLIDER_H_
