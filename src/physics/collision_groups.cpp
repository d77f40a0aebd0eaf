#include <kinscene/physics/collision_groups.h>

#include <iomanip>
#include <ostream>

namespace kinscene {
namespace physics {

CollisionGroups collisionGroupsFor(BodyRole role)
{
  switch (role)
  {
    case BodyRole::ENVIRONMENT:
      return { CollisionGroups::ENVIRONMENT, CollisionGroups::ALL };
    case BodyRole::ROBOT_BODY:
      return { CollisionGroups::ROBOT_BODY, CollisionGroups::ENVIRONMENT | CollisionGroups::FREE_OBJECT };
    case BodyRole::FREE_OBJECT:
      return { CollisionGroups::FREE_OBJECT, CollisionGroups::ALL };
  }
  return {};
}

bool canInteract(const CollisionGroups& a, const CollisionGroups& b)
{
  return (a.memberships & b.filter) != 0 && (b.memberships & a.filter) != 0;
}

const char* bodyRoleToString(BodyRole role)
{
  switch (role)
  {
    case BodyRole::ENVIRONMENT:
      return "environment";
    case BodyRole::ROBOT_BODY:
      return "robot-body";
    case BodyRole::FREE_OBJECT:
      return "free-object";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, BodyRole role)
{
  return os << bodyRoleToString(role);
}

std::ostream& operator<<(std::ostream& os, const CollisionGroups& groups)
{
  const auto flags = os.flags();
  os << "CollisionGroups{ memberships=0x" << std::hex << groups.memberships << ", filter=0x" << groups.filter
     << " }";
  os.flags(flags);
  return os;
}

}  // namespace physics
}  // namespace kinscene
