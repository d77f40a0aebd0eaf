#include <kinscene/errors.h>
#include <kinscene/scene/scene_compiler.h>

#include <limits>
#include <sstream>

#include <gtest/gtest.h>

using namespace kinscene;
using namespace kinscene::scene;
using components::JointType;

constexpr double POSITION_EPSILON = 1e-09;

namespace {

components::JointDescriptor makeJoint(const std::string& name, JointType type, const std::string& parent,
                                      const std::string& child, const Eigen::Vector3d& xyz,
                                      const Eigen::Vector3d& rpy = Eigen::Vector3d::Zero())
{
  components::JointDescriptor joint;
  joint.name = name;
  joint.type = type;
  joint.parent_link = parent;
  joint.child_link = child;
  joint.origin.xyz = xyz;
  joint.origin.rpy = rpy;
  if (components::jointTypeRequiresAxis(type))
    joint.axis = Eigen::Vector3d(0, 0, 1);
  return joint;
}

// torso -> Neck(yaw) -> Head -> camera, torso -> LShoulder(continuous) -> LArm
components::RobotDescription makeRobot()
{
  components::RobotDescription robot;
  robot.name = "mini";

  components::LinkDescriptor torso;
  torso.name = "torso";
  components::InertialProperties inertial;
  inertial.mass = 1.05;
  inertial.origin.xyz = Eigen::Vector3d(-0.004, 0.0, 0.043);
  inertial.origin.rpy = Eigen::Vector3d(0.0, 0.0, M_PI_2);
  inertial.inertia_tensor = components::inertiaTensorFromEntries(1.0, 0.0, 0.0, 2.0, 0.0, 3.0);
  torso.inertial = inertial;
  torso.collisions.push_back({ "chest", geometry::Origin{}, geometry::Box{ Eigen::Vector3d(0.05, 0.07, 0.1) } });
  components::VisualMaterial grey{ "grey", components::Color{ 0.5, 0.5, 0.5, 1.0 }, "" };
  torso.visuals.push_back(
      { "torso_mesh", geometry::Origin{}, geometry::Mesh{ "package://mini/meshes/Torso.dae" }, grey });
  robot.links.push_back(torso);

  components::LinkDescriptor head;
  head.name = "Head";
  head.collisions.push_back({ "", geometry::Origin{}, geometry::Sphere{ 0.06 } });
  robot.links.push_back(head);

  components::LinkDescriptor camera;
  camera.name = "camera";
  robot.links.push_back(camera);

  components::LinkDescriptor arm;
  arm.name = "LArm";
  arm.collisions.push_back({ "", geometry::Origin{}, geometry::Cylinder{ 0.02, 0.05 } });
  robot.links.push_back(arm);

  robot.joints.push_back(
      makeJoint("HeadYaw", JointType::REVOLUTE, "torso", "Head", Eigen::Vector3d(0, 0, 0.126),
                Eigen::Vector3d(0, 0, M_PI_2)));
  robot.joints.push_back(makeJoint("CameraFixed", JointType::FIXED, "Head", "camera", Eigen::Vector3d(0.1, 0, 0)));
  robot.joints.push_back(
      makeJoint("LShoulder", JointType::CONTINUOUS, "torso", "LArm", Eigen::Vector3d(0, 0.098, 0.1)));
  return robot;
}

CompileOptions quietOptions(std::ostream* diagnostics = nullptr)
{
  CompileOptions options;
  options.diagnostics = diagnostics;
  return options;
}

template <class F>
CompileError expectCompileError(F&& f)
{
  try
  {
    f();
  }
  catch (const CompileError& e)
  {
    return e;
  }
  ADD_FAILURE() << "expected CompileError";
  return CompileError(CompileErrorKind::DuplicateLink, "", "not thrown");
}

}  // namespace

TEST(SceneCompiler, LinksAndJoints)
{
  SceneGraph scene = compileScene(makeRobot(), quietOptions());

  EXPECT_EQ("mini", scene.name());
  ASSERT_EQ(4u, scene.links().size());
  ASSERT_EQ(3u, scene.joints().size());
  ASSERT_EQ(1u, scene.roots().size());
  EXPECT_EQ("torso", scene.link(scene.roots()[0]).name);
  EXPECT_TRUE(scene.bodies().empty());

  const CompiledLink* head = scene.findLink("Head");
  ASSERT_NE(nullptr, head);
  ASSERT_TRUE(head->parent.has_value());
  EXPECT_EQ("torso", scene.link(*head->parent).name);
  ASSERT_TRUE(head->parent_joint.has_value());
  EXPECT_EQ("HeadYaw", scene.joint(*head->parent_joint).name);

  const CompiledJoint* yaw = scene.findJoint("HeadYaw");
  ASSERT_NE(nullptr, yaw);
  EXPECT_EQ(head->id, yaw->child);
  EXPECT_EQ(JointType::REVOLUTE, yaw->type);
  ASSERT_TRUE(yaw->constraint.has_value());
  EXPECT_EQ(1, yaw->constraint->rotationalDof());
  EXPECT_TRUE(yaw->constraint->parent_anchor.translation().isApprox(Eigen::Vector3d(0, 0, 0.126)));

  EXPECT_EQ(nullptr, scene.findLink("RArm"));
  EXPECT_EQ(nullptr, scene.findJoint("RShoulder"));
  EXPECT_THROW(scene.link(99), std::out_of_range);
  EXPECT_THROW(scene.joint(99), std::out_of_range);
}

TEST(SceneCompiler, RestPosesComposeRootToLeaf)
{
  SceneGraph scene = compileScene(makeRobot(), quietOptions());

  const auto& torso = *scene.findLink("torso");
  EXPECT_TRUE(torso.rest_pose.isApprox(geometry::ResolvedFrame::Identity()));

  const auto& head = *scene.findLink("Head");
  EXPECT_TRUE(head.pose_in_parent.translation().isApprox(Eigen::Vector3d(0, 0, 0.126)));

  // camera sits 0.1 along the Head x axis, which the yaw turned onto torso y
  const Eigen::Vector3d camera = scene.findLink("camera")->rest_pose.translation();
  EXPECT_NEAR(0.0, camera.x(), POSITION_EPSILON);
  EXPECT_NEAR(0.1, camera.y(), POSITION_EPSILON);
  EXPECT_NEAR(0.126, camera.z(), POSITION_EPSILON);
}

TEST(SceneCompiler, LinkPhysics)
{
  SceneGraph scene = compileScene(makeRobot(), quietOptions());

  const auto& torso = *scene.findLink("torso");
  ASSERT_TRUE(torso.collider.has_value());
  EXPECT_EQ(1u, torso.collider->size());
  ASSERT_TRUE(torso.mass_properties.has_value());
  EXPECT_NEAR(1.05, torso.mass_properties->mass, POSITION_EPSILON);
  EXPECT_TRUE(torso.mass_properties->local_center_of_mass.isApprox(Eigen::Vector3d(-0.004, 0.0, 0.043)));

  // the inertial frame is yawed a quarter turn: xx and yy swap in the link frame
  const Eigen::Matrix3d I_link = physics::reconstructInertiaTensor(*torso.mass_properties);
  const Eigen::Matrix3d expected = Eigen::Vector3d(2.0, 1.0, 3.0).asDiagonal();
  EXPECT_TRUE(I_link.isApprox(expected, 1e-9));

  // no inertial, no mass properties; no collisions, no collider
  const auto& camera = *scene.findLink("camera");
  EXPECT_FALSE(camera.mass_properties.has_value());
  EXPECT_FALSE(camera.collider.has_value());

  for (const auto& link : scene.links())
  {
    EXPECT_EQ(physics::CollisionGroups::ROBOT_BODY, link.groups.memberships);
    EXPECT_FALSE(physics::canInteract(link.groups, link.groups));
  }
}

TEST(SceneCompiler, VisualsArePassedThrough)
{
  SceneGraph scene = compileScene(makeRobot(), quietOptions());

  const auto& torso = *scene.findLink("torso");
  ASSERT_EQ(1u, torso.visuals.size());
  EXPECT_EQ("torso_mesh", torso.visuals[0].name);
  ASSERT_TRUE(std::holds_alternative<geometry::Mesh>(torso.visuals[0].geometry));
  EXPECT_EQ("package://mini/meshes/Torso.dae", std::get<geometry::Mesh>(torso.visuals[0].geometry).filename);
  ASSERT_TRUE(torso.visuals[0].material.has_value());
  ASSERT_TRUE(torso.visuals[0].material->color.has_value());
  EXPECT_NEAR(0.5, torso.visuals[0].material->color->r, POSITION_EPSILON);
}

TEST(SceneCompiler, ContinuousJointWithoutEngineSupport)
{
  std::ostringstream diagnostics;
  CompileOptions options = quietOptions(&diagnostics);
  options.unbounded_revolute_supported = false;

  SceneGraph scene = compileScene(makeRobot(), options);

  const CompiledJoint* shoulder = scene.findJoint("LShoulder");
  ASSERT_NE(nullptr, shoulder);
  EXPECT_FALSE(shoulder->constraint.has_value());

  // the tree is unchanged
  EXPECT_EQ("torso", scene.link(*scene.findLink("LArm")->parent).name);
  EXPECT_NE(std::string::npos, diagnostics.str().find("LShoulder"));
}

TEST(SceneCompiler, StructuralErrors)
{
  auto robot = makeRobot();
  robot.joints.push_back(makeJoint("loop", JointType::FIXED, "camera", "torso", Eigen::Vector3d::Zero()));

  auto e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::CyclicKinematics, e.kind());

  robot = makeRobot();
  robot.joints[1].child_link = "Camera";
  e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::UnknownLinkReference, e.kind());
  EXPECT_EQ("CameraFixed", e.entity());
}

TEST(SceneCompiler, LinkErrors)
{
  auto robot = makeRobot();
  robot.links[3].collisions.push_back({ "", geometry::Origin{}, geometry::Mesh{ "arm.stl" } });
  auto e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::UnsupportedGeometry, e.kind());
  EXPECT_EQ("LArm", e.entity());

  robot = makeRobot();
  robot.links[0].inertial->inertia_tensor = Eigen::Vector3d(0, 0, 1).asDiagonal();
  e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::InvalidInertiaTensor, e.kind());
  EXPECT_EQ("torso", e.entity());

  robot = makeRobot();
  robot.links[0].visuals[0].origin.xyz.z() = std::numeric_limits<double>::infinity();
  e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::InvalidOrigin, e.kind());
  EXPECT_EQ("torso", e.entity());
}

TEST(SceneCompiler, JointErrors)
{
  auto robot = makeRobot();
  robot.joints[0].axis.reset();
  auto e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::MissingAxis, e.kind());
  EXPECT_EQ("HeadYaw", e.entity());

  robot = makeRobot();
  robot.joints[1].type = JointType::FLOATING;
  e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::UnsupportedJointKind, e.kind());
  EXPECT_EQ("CameraFixed", e.entity());

  robot = makeRobot();
  robot.joints[2].origin.rpy.x() = std::numeric_limits<double>::quiet_NaN();
  e = expectCompileError([&] { compileScene(robot, quietOptions()); });
  EXPECT_EQ(CompileErrorKind::InvalidOrigin, e.kind());
  EXPECT_EQ("LShoulder", e.entity());
}

int main(int argc, char** argv)
{
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
