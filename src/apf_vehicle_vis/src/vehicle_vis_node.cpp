#include <rclcpp/rclcpp.hpp>

#include <geometry_msgs/msg/pose_stamped.hpp>
#include <nav_msgs/msg/path.hpp>
#include <visualization_msgs/msg/marker.hpp>

#include <cmath>
#include <cstdint>
#include <string>

using geometry_msgs::msg::PoseStamped;
using nav_msgs::msg::Path;
using visualization_msgs::msg::Marker;

/* ============================================================
 * VehicleVis Node
 * ============================================================
 * - Subscribes to the simulated vehicle pose (ENU)
 * - Publishes:
 *     • visualization_msgs/Marker (quadrotor body)
 *     • nav_msgs/Path (flown trajectory)
 */

class VehicleVis : public rclcpp::Node
{
public:
  VehicleVis()
  : Node("apf_vehicle_vis")
  {
    /* Trail decimation: keep a pose only after this much travel */
    min_trail_spacing_ = declare_parameter("min_trail_spacing", 0.05);
    max_trail_length_ = declare_parameter("max_trail_length", 5000);
    body_scale_ = declare_parameter("body_scale", 0.5);

    /* Vehicle pose subscriber */
    pose_sub_ = create_subscription<PoseStamped>(
      "/vehicle_pose_enu",
      rclcpp::QoS(10).reliable().durability_volatile(),
      std::bind(&VehicleVis::poseCb, this, std::placeholders::_1));

    /* Marker publisher for drone visualization */
    marker_pub_ = create_publisher<Marker>(
      "/drone_marker", 10);

    /* Flown trajectory */
    path_pub_ = create_publisher<Path>(
      "/apf/trajectory", 10);

    RCLCPP_INFO(get_logger(),
      "apf_vehicle_vis node started");
    RCLCPP_INFO(get_logger(),
      "Subscribing to /vehicle_pose_enu");
    RCLCPP_INFO(get_logger(),
      "Publishing:");
    RCLCPP_INFO(get_logger(),
      "  • /drone_marker (RViz marker)");
    RCLCPP_INFO(get_logger(),
      "  • /apf/trajectory (Path)");
  }

private:
  /* ============================================================
   * Pose callback
   * ============================================================
   */
  void poseCb(const PoseStamped::SharedPtr msg)
  {
    publishMarker(*msg);
    appendTrail(*msg);

    /* Throttled debug info */
    RCLCPP_DEBUG_THROTTLE(
      get_logger(), *get_clock(), 2000,
      "ENU Pose: [x=%.2f y=%.2f z=%.2f]",
      msg->pose.position.x,
      msg->pose.position.y,
      msg->pose.position.z);
  }

  /* ============================================================
   * Trajectory publisher
   * ============================================================
   */
  void appendTrail(const PoseStamped &pose)
  {
    if (!trail_.poses.empty()) {
      const auto &last = trail_.poses.back().pose.position;
      const double dx = pose.pose.position.x - last.x;
      const double dy = pose.pose.position.y - last.y;
      const double dz = pose.pose.position.z - last.z;

      if (std::sqrt(dx*dx + dy*dy + dz*dz) < min_trail_spacing_) return;
    }

    trail_.header = pose.header;
    trail_.poses.push_back(pose);

    if (static_cast<int64_t>(trail_.poses.size()) > max_trail_length_) {
      trail_.poses.erase(trail_.poses.begin());
    }

    path_pub_->publish(trail_);
  }

  /* ============================================================
   * Marker publisher
   * ============================================================
   * Flat box oriented with the vehicle attitude, so the tilt
   * commanded by the thrust vector is visible.
   */
  void publishMarker(const PoseStamped &pose)
  {
    Marker marker;
    marker.header = pose.header;

    marker.ns = "drone_body";
    marker.id = 0;
    marker.action = Marker::ADD;
    marker.type = Marker::CUBE;

    marker.pose = pose.pose;

    marker.scale.x = body_scale_;
    marker.scale.y = body_scale_;
    marker.scale.z = body_scale_ * 0.2;

    marker.color.r = 0.1;
    marker.color.g = 0.4;
    marker.color.b = 1.0;
    marker.color.a = 1.0;
    marker.lifetime = rclcpp::Duration::from_seconds(0);

    marker_pub_->publish(marker);
  }

  /* ---------- Parameters ---------- */
  double min_trail_spacing_;
  int64_t max_trail_length_;
  double body_scale_;

  Path trail_;

  /* ---------- ROS interfaces ---------- */
  rclcpp::Subscription<PoseStamped>::SharedPtr pose_sub_;
  rclcpp::Publisher<Marker>::SharedPtr marker_pub_;
  rclcpp::Publisher<Path>::SharedPtr path_pub_;
};

/* ============================================================
 * main
 * ============================================================
 */
int main(int argc, char **argv)
{
  rclcpp::init(argc, argv);
  rclcpp::spin(std::make_shared<VehicleVis>());
  rclcpp::shutdown();
  return 0;
}
