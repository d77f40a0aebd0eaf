#ifndef KINSCENE_SCENE_ENVIRONMENT_H_
#define KINSCENE_SCENE_ENVIRONMENT_H_

#include <vector>

#include <kinscene/scene/scene_graph.h>

namespace kinscene {
namespace scene {

// Soccer field the robot is placed on. All lengths in meters.
struct FieldDimensions
{
  double ball_radius = 0.05;
  double length = 9.0;
  double width = 6.0;
  double line_width = 0.05;
  double penalty_marker_size = 0.1;
  double goal_box_area_length = 0.6;
  double goal_box_area_width = 2.2;
  double penalty_area_length = 1.65;
  double penalty_area_width = 4.0;
  double penalty_marker_distance = 1.3;
  double center_circle_diameter = 1.5;
  double border_strip_width = 0.7;
  double goal_inner_width = 1.5;
  double goal_post_diameter = 0.1;
  double goal_depth = 0.5;
};

constexpr double kFieldThickness = 0.02;  // full thickness of the ground slab
constexpr double kFieldHeight = -1.0;     // z of the ground slab center
constexpr double kBallDropHeight = 4.0;   // z of the ball center
constexpr double kBallRestitution = 0.7;

/**
 * Bodies of the field scene:
 *   - "field": static ground slab covering the field plus its border strip (environment group)
 *   - "ball":  dynamic sphere dropped above the center spot (free-object group)
 *
 * @throws CompileError UnsupportedGeometry when a dimension is not positive.
 */
std::vector<CompiledBody> compileField(const FieldDimensions& dims = {});

/// Append bodies to a compiled robot scene.
/// @throws CompileError DuplicateLink on a name clash.
void addEnvironment(SceneGraph& scene, const std::vector<CompiledBody>& bodies);

}  // namespace scene
}  // namespace kinscene

#endif  // KINSCENE_SCENE_ENVIRONMENT_H_
