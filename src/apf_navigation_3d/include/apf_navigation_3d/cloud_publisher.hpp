#pragma once
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/point_cloud2.hpp>
#include <sensor_msgs/point_cloud2_iterator.hpp>

/**
 * @brief Utility class for publishing obstacle points as a PointCloud2
 *
 * - Used for the full voxel grid (background cloud) and for the
 *   active points of the current step (highlighted)
 * - Read-only snapshot: the points are copied into the message
 */
class CloudPublisher
{
public:
  /**
   * @brief Convert points to an XYZ float PointCloud2
   */
  static sensor_msgs::msg::PointCloud2 toMsg(
    const std::vector<Eigen::Vector3d>& points,
    const std::string& frame_id,
    const rclcpp::Time& stamp)
  {
    const auto count = static_cast<uint32_t>(points.size());

    // Initialize PointCloud2 message
    sensor_msgs::msg::PointCloud2 cloud;
    cloud.header.frame_id = frame_id;
    cloud.header.stamp = stamp;
    cloud.height = 1;
    cloud.width = count;

    // Define XYZ fields
    sensor_msgs::PointCloud2Modifier mod(cloud);
    mod.setPointCloud2FieldsByString(1, "xyz");
    mod.resize(count);

    if (count == 0) return cloud;

    // Iterators for point access
    sensor_msgs::PointCloud2Iterator<float>
      ix(cloud, "x"), iy(cloud, "y"), iz(cloud, "z");

    for (const auto& p : points)
    {
      *ix = static_cast<float>(p.x());
      *iy = static_cast<float>(p.y());
      *iz = static_cast<float>(p.z());

      ++ix; ++iy; ++iz;
    }

    return cloud;
  }

  /**
   * @brief Publish points as a point cloud
   *
   * @param points   Points to publish
   * @param pub      ROS2 PointCloud2 publisher
   * @param frame_id Frame of the points
   * @param stamp    Timestamp for the point cloud message
   */
  static void publish(const std::vector<Eigen::Vector3d>& points,
    rclcpp::Publisher<sensor_msgs::msg::PointCloud2>::SharedPtr pub,
    const std::string& frame_id,
    const rclcpp::Time& stamp)
  {
    pub->publish(toMsg(points, frame_id, stamp));
  }
};
