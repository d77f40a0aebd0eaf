#include <kinscene/errors.h>
#include <kinscene/geometry/frame.h>
#include <kinscene/kinematics/joint_constraint.h>

#include <limits>
#include <sstream>

#include <gtest/gtest.h>

using namespace kinscene;
using namespace kinscene::kinematics;
using components::JointType;

constexpr double AXIS_EPSILON = 1e-12;

namespace {

geometry::ResolvedFrame anchor()
{
  geometry::Origin origin;
  origin.xyz = Eigen::Vector3d(0.0, 0.098, 0.1);
  origin.rpy = Eigen::Vector3d(0.0, 0.0, M_PI_2);
  return geometry::compose(origin);
}

CompileOptions quietOptions(std::ostream* diagnostics = nullptr)
{
  CompileOptions options;
  options.diagnostics = diagnostics;
  return options;
}

}  // namespace

TEST(JointConstraint, RevoluteFreesOneRotation)
{
  auto spec = mapJointConstraint("HeadYaw", JointType::REVOLUTE, Eigen::Vector3d(0, 0, 2), anchor(), quietOptions());
  ASSERT_TRUE(spec.has_value());

  EXPECT_EQ(JointType::REVOLUTE, spec->kind);
  EXPECT_EQ(1, spec->dof());
  EXPECT_EQ(1, spec->rotationalDof());
  EXPECT_EQ(0, spec->translationalDof());
  EXPECT_TRUE(spec->bounded);

  // normalized
  ASSERT_TRUE(spec->axis.has_value());
  EXPECT_NEAR(1.0, spec->axis->z(), AXIS_EPSILON);
  EXPECT_TRUE(spec->free_dofs[0].axis.isApprox(Eigen::Vector3d::UnitZ()));

  EXPECT_TRUE(spec->parent_anchor.isApprox(anchor()));
  EXPECT_TRUE(spec->child_anchor.isApprox(geometry::ResolvedFrame::Identity()));
}

TEST(JointConstraint, PrismaticFreesOneTranslation)
{
  auto spec = mapJointConstraint("slider", JointType::PRISMATIC, Eigen::Vector3d(1, 1, 0), anchor(), quietOptions());
  ASSERT_TRUE(spec.has_value());

  EXPECT_EQ(1, spec->dof());
  EXPECT_EQ(1, spec->translationalDof());
  EXPECT_EQ(DofType::TRANSLATIONAL, spec->free_dofs[0].type);
  EXPECT_NEAR(1.0, spec->free_dofs[0].axis.norm(), AXIS_EPSILON);
  EXPECT_NEAR(M_SQRT1_2, spec->free_dofs[0].axis.x(), AXIS_EPSILON);
}

TEST(JointConstraint, FixedLocksEverything)
{
  // axis is ignored
  auto spec = mapJointConstraint("weld", JointType::FIXED, std::nullopt, anchor(), quietOptions());
  ASSERT_TRUE(spec.has_value());

  EXPECT_EQ(0, spec->dof());
  EXPECT_FALSE(spec->axis.has_value());
  EXPECT_TRUE(spec->parent_anchor.isApprox(anchor()));
}

TEST(JointConstraint, SphericalFreesThreeRotations)
{
  auto spec = mapJointConstraint("hip", JointType::SPHERICAL, std::nullopt, anchor(), quietOptions());
  ASSERT_TRUE(spec.has_value());

  EXPECT_EQ(3, spec->dof());
  EXPECT_EQ(3, spec->rotationalDof());
  EXPECT_TRUE(spec->free_dofs[0].axis.isApprox(Eigen::Vector3d::UnitX()));
  EXPECT_TRUE(spec->free_dofs[1].axis.isApprox(Eigen::Vector3d::UnitY()));
  EXPECT_TRUE(spec->free_dofs[2].axis.isApprox(Eigen::Vector3d::UnitZ()));
}

TEST(JointConstraint, ContinuousIsUnbounded)
{
  auto spec = mapJointConstraint("wheel", JointType::CONTINUOUS, Eigen::Vector3d(0, 1, 0), anchor(), quietOptions());
  ASSERT_TRUE(spec.has_value());

  EXPECT_EQ(1, spec->rotationalDof());
  EXPECT_FALSE(spec->bounded);
}

TEST(JointConstraint, ContinuousWithoutEngineSupport)
{
  std::ostringstream diagnostics;
  CompileOptions options = quietOptions(&diagnostics);
  options.unbounded_revolute_supported = false;

  auto spec = mapJointConstraint("wheel", JointType::CONTINUOUS, Eigen::Vector3d(0, 1, 0), anchor(), options);
  EXPECT_FALSE(spec.has_value());
  EXPECT_NE(std::string::npos, diagnostics.str().find("wheel"));

  // the axis is still validated
  EXPECT_THROW(mapJointConstraint("wheel", JointType::CONTINUOUS, std::nullopt, anchor(), options), CompileError);
}

TEST(JointConstraint, UnsupportedKinds)
{
  for (JointType type : { JointType::PLANAR, JointType::FLOATING })
  {
    try
    {
      mapJointConstraint("free", type, Eigen::Vector3d(0, 0, 1), anchor(), quietOptions());
      FAIL() << "expected CompileError";
    }
    catch (const CompileError& e)
    {
      EXPECT_EQ(CompileErrorKind::UnsupportedJointKind, e.kind());
      EXPECT_EQ("free", e.entity());
    }
  }
}

TEST(JointConstraint, MissingAxis)
{
  const std::optional<Eigen::Vector3d> bad_axes[] = {
    std::nullopt,
    Eigen::Vector3d(0, 0, 0),
    Eigen::Vector3d(std::numeric_limits<double>::quiet_NaN(), 0, 1),
  };

  for (JointType type : { JointType::REVOLUTE, JointType::PRISMATIC, JointType::CONTINUOUS })
  {
    for (const auto& axis : bad_axes)
    {
      try
      {
        mapJointConstraint("LElbowRoll", type, axis, anchor(), quietOptions());
        FAIL() << "expected CompileError";
      }
      catch (const CompileError& e)
      {
        EXPECT_EQ(CompileErrorKind::MissingAxis, e.kind());
        EXPECT_EQ("LElbowRoll", e.entity());
      }
    }
  }
}

int main(int argc, char** argv)
{
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
