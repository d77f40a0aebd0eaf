#include <kinscene/errors.h>
#include <kinscene/physics/collider.h>
#include <kinscene/physics/collision_groups.h>

#include <limits>

#include <gtest/gtest.h>

using namespace kinscene;
using namespace kinscene::physics;

namespace {

components::CollisionPrimitive primitive(const geometry::Geometry& g,
                                         const Eigen::Vector3d& xyz = Eigen::Vector3d::Zero())
{
  components::CollisionPrimitive p;
  p.origin.xyz = xyz;
  p.geometry = g;
  return p;
}

}  // namespace

TEST(Collider, EmptyListHasNoCollider)
{
  EXPECT_FALSE(compileCollider({}, "base").has_value());
}

TEST(Collider, OneSubShapePerPrimitiveInOrder)
{
  std::vector<components::CollisionPrimitive> primitives{
    primitive(geometry::Box{ Eigen::Vector3d(0.1, 0.2, 0.3) }, Eigen::Vector3d(0, 0, 0.5)),
    primitive(geometry::Cylinder{ 0.05, 0.1 }),
    primitive(geometry::Sphere{ 0.04 }, Eigen::Vector3d(1, 0, 0)),
  };

  auto compound = compileCollider(primitives, "torso");
  ASSERT_TRUE(compound.has_value());
  ASSERT_EQ(3u, compound->size());

  EXPECT_EQ(geometry::ShapeType::Box, geometry::shapeType(compound->shapes[0].shape));
  EXPECT_EQ(geometry::ShapeType::Cylinder, geometry::shapeType(compound->shapes[1].shape));
  EXPECT_EQ(geometry::ShapeType::Sphere, geometry::shapeType(compound->shapes[2].shape));

  EXPECT_TRUE(compound->shapes[0].local.translation().isApprox(Eigen::Vector3d(0, 0, 0.5)));
  EXPECT_TRUE(compound->shapes[2].local.translation().isApprox(Eigen::Vector3d(1, 0, 0)));

  // half extents are kept as given
  const auto& box = std::get<geometry::Box>(compound->shapes[0].shape);
  EXPECT_TRUE(box.half_extents.isApprox(Eigen::Vector3d(0.1, 0.2, 0.3)));
}

TEST(Collider, MeshIsUnsupported)
{
  std::vector<components::CollisionPrimitive> primitives{
    primitive(geometry::Sphere{ 0.04 }),
    primitive(geometry::Mesh{ "package://nao/meshes/HeadPitch.dae" }),
  };

  try
  {
    compileCollider(primitives, "Head");
    FAIL() << "expected CompileError";
  }
  catch (const CompileError& e)
  {
    EXPECT_EQ(CompileErrorKind::UnsupportedGeometry, e.kind());
    EXPECT_EQ("Head", e.entity());
  }
}

TEST(Collider, InvalidDimensionsAreUnsupported)
{
  try
  {
    compileCollider({ primitive(geometry::Box{ Eigen::Vector3d(0.1, 0.0, 0.1) }) }, "foot");
    FAIL() << "expected CompileError";
  }
  catch (const CompileError& e)
  {
    EXPECT_EQ(CompileErrorKind::UnsupportedGeometry, e.kind());
  }

  EXPECT_THROW(compileCollider({ primitive(geometry::Sphere{ -1.0 }) }, "foot"), CompileError);
}

TEST(Collider, NonFiniteOriginIsRejected)
{
  auto p = primitive(geometry::Sphere{ 0.1 });
  p.origin.rpy.x() = std::numeric_limits<double>::quiet_NaN();

  try
  {
    compileCollider({ p }, "hand");
    FAIL() << "expected CompileError";
  }
  catch (const CompileError& e)
  {
    EXPECT_EQ(CompileErrorKind::InvalidOrigin, e.kind());
    EXPECT_EQ("hand", e.entity());
  }
}

TEST(CollisionGroups, RobotLinksIgnoreEachOther)
{
  const auto env = collisionGroupsFor(BodyRole::ENVIRONMENT);
  const auto robot = collisionGroupsFor(BodyRole::ROBOT_BODY);
  const auto free_object = collisionGroupsFor(BodyRole::FREE_OBJECT);

  EXPECT_FALSE(canInteract(robot, robot));
  EXPECT_TRUE(canInteract(robot, env));
  EXPECT_TRUE(canInteract(env, robot));
  EXPECT_TRUE(canInteract(robot, free_object));
  EXPECT_TRUE(canInteract(free_object, env));
  EXPECT_TRUE(canInteract(free_object, free_object));

  EXPECT_EQ(CollisionGroups::ROBOT_BODY, robot.memberships);
  EXPECT_EQ(CollisionGroups::ENVIRONMENT | CollisionGroups::FREE_OBJECT, robot.filter);
}

TEST(CollisionGroups, RoleNames)
{
  EXPECT_STREQ("environment", bodyRoleToString(BodyRole::ENVIRONMENT));
  EXPECT_STREQ("robot-body", bodyRoleToString(BodyRole::ROBOT_BODY));
  EXPECT_STREQ("free-object", bodyRoleToString(BodyRole::FREE_OBJECT));
}

int main(int argc, char** argv)
{
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
