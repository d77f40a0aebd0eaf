#ifndef KINSCENE_PHYSICS_COLLISION_GROUPS_H_
#define KINSCENE_PHYSICS_COLLISION_GROUPS_H_

#include <cstdint>
#include <iosfwd>

namespace kinscene {
namespace physics {

// clang-format off
/*
| Role         | memberships | filter                     |
|--------------|-------------|----------------------------|
| environment  | ENVIRONMENT | ALL                        |
| robot link   | ROBOT_BODY  | ENVIRONMENT | FREE_OBJECT  |
| free object  | FREE_OBJECT | ALL                        |

Links of a robot never collide with each other; everything else does.
*/
// clang-format on

enum class BodyRole
{
  ENVIRONMENT,
  ROBOT_BODY,
  FREE_OBJECT,
};

struct CollisionGroups
{
  static constexpr std::uint32_t ENVIRONMENT = 1u << 0;
  static constexpr std::uint32_t ROBOT_BODY = 1u << 1;
  static constexpr std::uint32_t FREE_OBJECT = 1u << 2;
  static constexpr std::uint32_t ALL = 0xFFFFFFFFu;
  static constexpr std::uint32_t NONE = 0u;

  std::uint32_t memberships = NONE;
  std::uint32_t filter = NONE;
};

CollisionGroups collisionGroupsFor(BodyRole role);

// Symmetric: each side's memberships must intersect the other side's filter.
bool canInteract(const CollisionGroups& a, const CollisionGroups& b);

const char* bodyRoleToString(BodyRole role);

std::ostream& operator<<(std::ostream& os, BodyRole role);
std::ostream& operator<<(std::ostream& os, const CollisionGroups& groups);

}  // namespace physics
}  // namespace kinscene

#endif  // KINSCENE_PHYSICS_COLLISION_GROUPS_H_
