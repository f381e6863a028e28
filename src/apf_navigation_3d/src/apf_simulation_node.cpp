#include <rclcpp/rclcpp.hpp>

#include <geometry_msgs/msg/pose_stamped.hpp>
#include <geometry_msgs/msg/twist_stamped.hpp>
#include <sensor_msgs/msg/point_cloud2.hpp>
#include <visualization_msgs/msg/marker.hpp>

/* -------- APF core includes -------- */
#include "apf_navigation_3d/apf_errors.hpp"
#include "apf_navigation_3d/apf_simulation.hpp"
#include "apf_navigation_3d/cloud_publisher.hpp"
#include "apf_navigation_3d/obstacle_cloud.hpp"
#include "apf_navigation_3d/telemetry_recorder.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/* ============================================================
 * ApfSimulationNode
 * ============================================================
 * Responsibilities:
 *  - Load or generate the fine obstacle cloud
 *  - Voxelize it once and publish the grid as PointCloud2
 *  - Run the APF simulation on a wall timer
 *  - Publish per step:
 *      • vehicle pose (ENU)
 *      • active obstacle points
 *      • repulsive force arrow
 *      • velocity setpoint
 *  - Accept new goals on /goal
 */

class ApfSimulationNode : public rclcpp::Node
{
public:
  ApfSimulationNode()
  : Node("apf_simulation")
  {
    RCLCPP_INFO(get_logger(),
      "===============================");
    RCLCPP_INFO(get_logger(),
      " ApfSimulationNode starting ");
    RCLCPP_INFO(get_logger(),
      "===============================");

    /* ---------- Parameters ---------- */

    ApfConfig config;
    config.voxel_size = declare_parameter("voxel_size", config.voxel_size);
    config.influence_radius =
      declare_parameter("influence_radius", config.influence_radius);
    config.repulsive_gain =
      declare_parameter("repulsive_gain", config.repulsive_gain);
    config.policy = parseInjectionPolicy(
      declare_parameter<std::string>("injection_policy", "V"));
    config.limits.max_velocity =
      declare_parameter("max_velocity", config.limits.max_velocity);
    config.limits.min_thrust =
      declare_parameter("min_thrust", config.limits.min_thrust);
    config.limits.max_thrust =
      declare_parameter("max_thrust", config.limits.max_thrust);
    config.limits.max_tilt_deg =
      declare_parameter("max_tilt_deg", config.limits.max_tilt_deg);
    config.time_step = declare_parameter("time_step", config.time_step);
    config.validate();

    VehicleParams params;
    params.mass = declare_parameter("vehicle_mass", params.mass);
    params.drag = declare_parameter("vehicle_drag", params.drag);

    max_steps_ = declare_parameter("max_steps", 20000);
    steps_per_tick_ = declare_parameter("steps_per_tick", 10);
    const int tick_period_ms = declare_parameter("tick_period_ms", 50);

    frame_id_ = declare_parameter<std::string>("frame_id", "map");

    const auto initial_position = toPoint(
      declare_parameter<std::vector<double>>(
        "initial_position", {-4.0, -4.0, 2.0}), "initial_position");

    const auto waypoints = toPoints(
      declare_parameter<std::vector<double>>(
        "waypoints", {4.0, 4.0, 2.0}), "waypoints");

    const double arrival_distance =
      declare_parameter("arrival_distance", 0.5);

    const std::string telemetry_csv =
      declare_parameter<std::string>("telemetry_csv", "");

    RCLCPP_INFO(get_logger(),
      "Policy %s, voxel %.2f m, influence radius %.2f m, gain %.2f",
      toString(config.policy), config.voxel_size,
      config.influence_radius, config.repulsive_gain);

    /* ---------- Publishers ---------- */

    voxel_pub_ = create_publisher<sensor_msgs::msg::PointCloud2>(
      "/apf/voxel_cloud", rclcpp::QoS(1).transient_local());

    active_pub_ = create_publisher<sensor_msgs::msg::PointCloud2>(
      "/apf/active_points", 10);

    force_pub_ = create_publisher<visualization_msgs::msg::Marker>(
      "/apf/repulsive_force", 10);

    vel_sp_pub_ = create_publisher<geometry_msgs::msg::TwistStamped>(
      "/apf/velocity_setpoint", 10);

    pose_pub_ = create_publisher<geometry_msgs::msg::PoseStamped>(
      "/vehicle_pose_enu", rclcpp::QoS(10).reliable().durability_volatile());

    RCLCPP_INFO(get_logger(), "Publishers created:");
    RCLCPP_INFO(get_logger(), "  • /apf/voxel_cloud");
    RCLCPP_INFO(get_logger(), "  • /apf/active_points");
    RCLCPP_INFO(get_logger(), "  • /apf/repulsive_force");
    RCLCPP_INFO(get_logger(), "  • /apf/velocity_setpoint");
    RCLCPP_INFO(get_logger(), "  • /vehicle_pose_enu");

    /* ---------- Subscribers ---------- */

    goal_sub_ = create_subscription<geometry_msgs::msg::PoseStamped>(
      "/goal", 10,
      std::bind(&ApfSimulationNode::goalCb, this, std::placeholders::_1));

    RCLCPP_INFO(get_logger(), "Subscribers created:");
    RCLCPP_INFO(get_logger(), "  • /goal");

    /* ---------- Environment ---------- */

    RCLCPP_INFO(get_logger(), "Building obstacle environment...");
    const ObstacleCloud cloud = loadEnvironment();

    auto grid = std::make_shared<const VoxelGrid>(
      VoxelGrid::build(cloud, config.voxel_size));

    RCLCPP_INFO(get_logger(),
      "Voxelized %zu fine points into %zu voxels",
      cloud.size(), grid->size());

    /* ---------- Simulation ---------- */

    sim_ = std::make_unique<ApfSimulation>(
      config, grid,
      std::make_unique<PointMassDynamics>(params, initial_position),
      std::make_unique<CascadedPositionController>(params, config.limits),
      WaypointTracker(waypoints, arrival_distance));

    if (!telemetry_csv.empty()) {
      recorder_ = std::make_unique<TelemetryRecorder>(telemetry_csv);
      RCLCPP_INFO(get_logger(), "Recording telemetry to %s",
        telemetry_csv.c_str());
    }

    /* ---------- Map visualization ---------- */

    CloudPublisher::publish(grid->points(), voxel_pub_, frame_id_, now());
    RCLCPP_INFO(get_logger(),
      "Voxel grid published as PointCloud2");

    /* ---------- Timer ---------- */

    wall_start_ = std::chrono::steady_clock::now();
    timer_ = create_wall_timer(
      std::chrono::milliseconds(tick_period_ms),
      std::bind(&ApfSimulationNode::tick, this));

    RCLCPP_INFO(get_logger(),
      "Simulation running: %ld steps per %d ms tick",
      steps_per_tick_, tick_period_ms);
  }

private:
  /* ============================================================
   * Environment loading
   * ============================================================
   */
  ObstacleCloud loadEnvironment()
  {
    const std::string environment =
      declare_parameter<std::string>("environment", "wall");
    const double resolution = declare_parameter("cloud_resolution", 0.05);

    if (environment == "file") {
      const std::string path = declare_parameter<std::string>("cloud_file", "");
      RCLCPP_INFO(get_logger(), "Loading cloud from %s", path.c_str());
      return ObstacleCloudLoader::loadXyz(path);
    }

    if (environment == "boxes") {
      const int seed = declare_parameter("random_seed", 42);
      return ObstacleCloudGenerator::randomBoxes(
        declare_parameter("box_count", 20),
        declare_parameter("box_extent", 10.0),
        1.0, 4.0, resolution, static_cast<std::uint32_t>(seed));
    }

    if (environment == "wall") {
      return ObstacleCloudGenerator::wall(-2.5, 2.5, 0.0, 0.0, 5.0, resolution);
    }

    throw InvalidConfiguration(
      "unknown environment '" + environment + "' (expected wall, boxes or file)");
  }

  /* ============================================================
   * Timer callback (simulation loop)
   * ============================================================
   * Runs steps_per_tick_ fixed steps and publishes the last one.
   */
  void tick()
  {
    if (done_) return;

    StepTelemetry last;
    bool stepped = false;

    try {
      for (int64_t i = 0; i < steps_per_tick_; ++i)
      {
        if (sim_->finished() ||
            static_cast<int64_t>(sim_->stepIndex()) >= max_steps_) {
          break;
        }

        last = sim_->step();
        stepped = true;
        if (recorder_) recorder_->record(last);
      }
    } catch (const SimulationDivergence &e) {
      RCLCPP_ERROR(get_logger(),
        "Simulation diverged at step %zu: %s", e.step(), e.what());
      finish(false);
      return;
    }

    if (stepped) publishStep(last);

    RCLCPP_INFO_THROTTLE(
      get_logger(), *get_clock(), 2000,
      "t=%.2f s  pos [%.2f %.2f %.2f]  active %zu  |F_rep| %.3f",
      sim_->state().time,
      sim_->state().position.x(),
      sim_->state().position.y(),
      sim_->state().position.z(),
      last.active_points.size(),
      last.repulsive_force.norm());

    if (sim_->finished()) {
      RCLCPP_WARN(get_logger(), "Final waypoint reached");
      finish(true);
    } else if (static_cast<int64_t>(sim_->stepIndex()) >= max_steps_) {
      RCLCPP_WARN(get_logger(), "Step limit %ld reached", max_steps_);
      finish(false);
    }
  }

  /* ============================================================
   * Run summary
   * ============================================================
   */
  void finish(bool goal_reached)
  {
    done_ = true;
    if (recorder_) recorder_->flush();

    const double wall = std::chrono::duration<double>(
      std::chrono::steady_clock::now() - wall_start_).count();
    const double sim_time = sim_->state().time;

    RCLCPP_INFO(get_logger(),
      "Simulated %.2f s in %.2f s (%.2fx) over %zu steps, goal %s",
      sim_time, wall, wall > 0.0 ? sim_time / wall : 0.0,
      sim_->stepIndex(), goal_reached ? "reached" : "not reached");
  }

  /* ============================================================
   * Goal callback → replace remaining waypoints
   * ============================================================
   */
  void goalCb(const geometry_msgs::msg::PoseStamped::SharedPtr msg)
  {
    if (sim_->diverged()) {
      RCLCPP_ERROR(get_logger(),
        "Run diverged, goal ignored; restart the node to fly again");
      return;
    }

    const Eigen::Vector3d goal(
      msg->pose.position.x,
      msg->pose.position.y,
      msg->pose.position.z);

    sim_->setPath({goal});

    RCLCPP_WARN(get_logger(),
      "New goal received at [%.2f %.2f %.2f]",
      goal.x(), goal.y(), goal.z());

    if (done_ && static_cast<int64_t>(sim_->stepIndex()) < max_steps_) {
      done_ = false;
      RCLCPP_INFO(get_logger(), "Simulation resumed");
    }
  }

  /* ============================================================
   * Step telemetry publishers
   * ============================================================
   */
  void publishStep(const StepTelemetry &t)
  {
    const rclcpp::Time stamp = now();

    /* ---------- Pose ---------- */
    geometry_msgs::msg::PoseStamped pose;
    pose.header.frame_id = frame_id_;
    pose.header.stamp = stamp;
    pose.pose.position.x = t.state.position.x();
    pose.pose.position.y = t.state.position.y();
    pose.pose.position.z = t.state.position.z();
    pose.pose.orientation.w = t.state.attitude.w();
    pose.pose.orientation.x = t.state.attitude.x();
    pose.pose.orientation.y = t.state.attitude.y();
    pose.pose.orientation.z = t.state.attitude.z();
    pose_pub_->publish(pose);

    /* ---------- Active points ---------- */
    CloudPublisher::publish(t.active_points, active_pub_, frame_id_, stamp);

    /* ---------- Velocity setpoint ---------- */
    geometry_msgs::msg::TwistStamped vel;
    vel.header = pose.header;
    vel.twist.linear.x = t.velocity_setpoint.x();
    vel.twist.linear.y = t.velocity_setpoint.y();
    vel.twist.linear.z = t.velocity_setpoint.z();
    vel_sp_pub_->publish(vel);

    /* ---------- Repulsive force arrow ---------- */
    visualization_msgs::msg::Marker arrow;
    arrow.header = pose.header;
    arrow.ns = "repulsive_force";
    arrow.id = 0;
    arrow.type = visualization_msgs::msg::Marker::ARROW;

    if (t.repulsive_force.isZero()) {
      arrow.action = visualization_msgs::msg::Marker::DELETE;
    } else {
      arrow.action = visualization_msgs::msg::Marker::ADD;

      geometry_msgs::msg::Point start = pose.pose.position;
      geometry_msgs::msg::Point end;
      end.x = start.x + t.repulsive_force.x();
      end.y = start.y + t.repulsive_force.y();
      end.z = start.z + t.repulsive_force.z();
      arrow.points = {start, end};

      /* Shaft diameter, head diameter, head length */
      arrow.scale.x = 0.05;
      arrow.scale.y = 0.1;
      arrow.scale.z = 0.1;

      arrow.color.r = 1.0;
      arrow.color.a = 1.0;
    }
    force_pub_->publish(arrow);
  }

  /* ============================================================
   * Parameter helpers
   * ============================================================
   */
  static Eigen::Vector3d toPoint(const std::vector<double> &v,
                                 const std::string &name)
  {
    if (v.size() != 3) {
      throw InvalidConfiguration(name + " must have 3 elements");
    }
    return {v[0], v[1], v[2]};
  }

  static std::vector<Eigen::Vector3d> toPoints(const std::vector<double> &v,
                                               const std::string &name)
  {
    if (v.size() % 3 != 0) {
      throw InvalidConfiguration(
        name + " must be a flat list of x y z triples");
    }

    std::vector<Eigen::Vector3d> points;
    for (size_t i = 0; i < v.size(); i += 3) {
      points.emplace_back(v[i], v[i + 1], v[i + 2]);
    }
    return points;
  }

  /* ============================================================
   * Members
   * ============================================================
   */

  std::unique_ptr<ApfSimulation> sim_;
  std::unique_ptr<TelemetryRecorder> recorder_;

  int64_t max_steps_ = 0;
  int64_t steps_per_tick_ = 1;
  std::string frame_id_;

  bool done_ = false;
  std::chrono::steady_clock::time_point wall_start_;

  rclcpp::Publisher<sensor_msgs::msg::PointCloud2>::SharedPtr voxel_pub_;
  rclcpp::Publisher<sensor_msgs::msg::PointCloud2>::SharedPtr active_pub_;
  rclcpp::Publisher<visualization_msgs::msg::Marker>::SharedPtr force_pub_;
  rclcpp::Publisher<geometry_msgs::msg::TwistStamped>::SharedPtr vel_sp_pub_;
  rclcpp::Publisher<geometry_msgs::msg::PoseStamped>::SharedPtr pose_pub_;

  rclcpp::Subscription<geometry_msgs::msg::PoseStamped>::SharedPtr goal_sub_;

  rclcpp::TimerBase::SharedPtr timer_;
};

/* ============================================================
 * main
 * ============================================================
 */
int main(int argc, char **argv)
{
  rclcpp::init(argc, argv);

  std::shared_ptr<ApfSimulationNode> node;
  try {
    node = std::make_shared<ApfSimulationNode>();
  } catch (const InvalidConfiguration &e) {
    RCLCPP_FATAL(rclcpp::get_logger("apf_simulation"),
      "Invalid configuration: %s", e.what());
    rclcpp::shutdown();
    return 1;
  } catch (const std::exception &e) {
    RCLCPP_FATAL(rclcpp::get_logger("apf_simulation"),
      "Setup failed: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::spin(node);
  rclcpp::shutdown();
  return 0;
}
