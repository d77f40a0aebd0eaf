#include <kinscene/scene/environment.h>

#include <kinscene/errors.h>

#include <string>
#include <unordered_set>

namespace kinscene {
namespace scene {

namespace {

physics::CompoundShape single(const geometry::Primitive& primitive, const std::string& body_name)
{
  if (!geometry::hasValidDimensions(primitive))
    throw CompileError(CompileErrorKind::UnsupportedGeometry, body_name, "field dimensions must be positive");

  physics::CompoundShape shape;
  shape.shapes.push_back(physics::SubShape{ geometry::ResolvedFrame::Identity(), primitive });
  return shape;
}

}  // namespace

std::vector<CompiledBody> compileField(const FieldDimensions& dims)
{
  std::vector<CompiledBody> bodies;

  CompiledBody field;
  field.name = "field";
  field.role = physics::BodyRole::ENVIRONMENT;
  field.motion = BodyMotion::STATIC;
  field.pose = geometry::ResolvedFrame(Eigen::Vector3d(0.0, 0.0, kFieldHeight), Eigen::Quaterniond::Identity());
  const Eigen::Vector3d ground_half((dims.length + 2.0 * dims.border_strip_width) / 2.0,
                                    (dims.width + 2.0 * dims.border_strip_width) / 2.0, kFieldThickness / 2.0);
  field.collider = single(geometry::Box{ ground_half }, field.name);
  field.groups = physics::collisionGroupsFor(field.role);
  bodies.push_back(std::move(field));

  CompiledBody ball;
  ball.name = "ball";
  ball.role = physics::BodyRole::FREE_OBJECT;
  ball.motion = BodyMotion::DYNAMIC;
  ball.pose = geometry::ResolvedFrame(Eigen::Vector3d(0.0, 0.0, kBallDropHeight), Eigen::Quaterniond::Identity());
  ball.collider = single(geometry::Sphere{ dims.ball_radius }, ball.name);
  ball.groups = physics::collisionGroupsFor(ball.role);
  ball.restitution = kBallRestitution;
  bodies.push_back(std::move(ball));

  return bodies;
}

void addEnvironment(SceneGraph& scene, const std::vector<CompiledBody>& bodies)
{
  // Validate every name first so a clash leaves the scene untouched.
  std::unordered_set<std::string> names;
  for (const auto& body : bodies)
  {
    if (scene.findLink(body.name) || scene.findBody(body.name) || !names.insert(body.name).second)
      throw CompileError(CompileErrorKind::DuplicateLink, body.name,
                         "body name clashes with an existing link or body");
  }

  for (const auto& body : bodies)
    scene.addBody(body);
}

}  // namespace scene
}  // namespace kinscene
