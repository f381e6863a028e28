#pragma once
#include <cmath>
#include <cstdint>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "apf_errors.hpp"

using ObstacleCloud = std::vector<Eigen::Vector3d>;

/**
 * @brief Reads a fine obstacle cloud from an XYZ text file
 *
 * One point per line, "x y z" or "x,y,z". Blank lines and lines
 * starting with '#' are skipped.
 */
class ObstacleCloudLoader
{
public:
  static ObstacleCloud loadXyz(const std::string& path)
  {
    std::ifstream in(path);
    if (!in) {
      throw InvalidConfiguration("cannot open cloud file '" + path + "'");
    }

    ObstacleCloud cloud;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line))
    {
      line_no++;

      const auto first = line.find_first_not_of(" \t\r");
      if (first == std::string::npos || line[first] == '#') continue;

      for (auto &c : line) {
        if (c == ',') c = ' ';
      }

      std::istringstream ss(line);
      double x, y, z;
      if (!(ss >> x >> y >> z)) {
        throw InvalidConfiguration(
          path + ":" + std::to_string(line_no) + ": expected 'x y z'");
      }
      cloud.emplace_back(x, y, z);
    }

    return cloud;
  }
};

/**
 * @brief Synthetic fine obstacle clouds for simulation runs
 *
 * Surfaces are sampled on a regular lattice finer than the voxel size
 * so the voxelized obstacles have no holes.
 */
class ObstacleCloudGenerator
{
public:
  /**
   * @brief Vertical wall in the plane y = y0
   *
   * Spans x in [x_min, x_max] and z in [z_min, z_max].
   */
  static ObstacleCloud wall(double x_min, double x_max,
                            double y0,
                            double z_min, double z_max,
                            double resolution)
  {
    checkResolution(resolution);

    ObstacleCloud cloud;
    const int nx = static_cast<int>(std::floor((x_max - x_min) / resolution)) + 1;
    const int nz = static_cast<int>(std::floor((z_max - z_min) / resolution)) + 1;

    for (int i = 0; i < nx; i++)
      for (int k = 0; k < nz; k++)
        cloud.emplace_back(x_min + i * resolution, y0, z_min + k * resolution);

    return cloud;
  }

  /**
   * @brief Randomly placed cubic obstacles
   *
   * Cube centres are uniform in [-extent, extent] horizontally and
   * [z_min, z_max] vertically; edge lengths are drawn from {1, 2, 3, 4} m.
   * Only the cube surfaces are sampled.
   */
  static ObstacleCloud randomBoxes(int count,
                                   double extent,
                                   double z_min, double z_max,
                                   double resolution,
                                   std::uint32_t seed)
  {
    checkResolution(resolution);

    // Random number generator
    std::mt19937 gen(seed);

    // Random distributions for obstacle center positions
    std::uniform_real_distribution<double> xy(-extent, extent);
    std::uniform_real_distribution<double> z(z_min, z_max);

    // Possible obstacle sizes (meters)
    const std::vector<double> sizes = {1, 2, 3, 4};
    std::uniform_int_distribution<int> si(0, static_cast<int>(sizes.size()) - 1);

    ObstacleCloud cloud;
    for (int i = 0; i < count; i++)
    {
      const Eigen::Vector3d c(xy(gen), xy(gen), z(gen));
      appendCubeSurface(cloud, c, sizes[si(gen)], resolution);
    }
    return cloud;
  }

private:
  static void checkResolution(double resolution)
  {
    if (!(resolution > 0.0)) {
      throw InvalidConfiguration("cloud resolution must be > 0");
    }
  }

  static void appendCubeSurface(ObstacleCloud& cloud,
                                const Eigen::Vector3d& center,
                                double size,
                                double resolution)
  {
    const int n = static_cast<int>(std::ceil(size / resolution));
    const double h = size / 2.0;
    const double step = size / n;

    for (int i = 0; i <= n; i++)
      for (int j = 0; j <= n; j++)
        for (int k = 0; k <= n; k++)
        {
          // Keep lattice nodes on the cube faces only
          if (i != 0 && i != n && j != 0 && j != n && k != 0 && k != n) continue;

          cloud.emplace_back(
            center.x() - h + i * step,
            center.y() - h + j * step,
            center.z() - h + k * step);
        }
  }
};
