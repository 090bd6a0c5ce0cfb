// Copyright (c) 2025 tlsbatch contributors

// This file is part of tlsbatch

// tlsbatch is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. tlsbatch is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with tlsbatch. If not, see
// <https://www.gnu.org/licenses/>.


#include <riegl/scanlib.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <numbers>
#include <tlsbatch/analysis/ScanReader.hpp>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/logger/logger.h>

#include "fmt/format.h"

namespace tlsbatch::analysis {

  namespace {
    /**
     * Collects every shot of an .rxp stream as a Pulse, and its echoes as
     * Returns, in world coordinates.
     */
    class RxpImporter : public scanlib::pointcloud {
     public:
      RxpImporter(const io::TransformMatrix& transform, ScanData& scan)
          : scanlib::pointcloud(false), transform_(transform), scan_(scan) {}

     protected:
      void on_echo_transformed(echo_type echo) override {
        scanlib::pointcloud::on_echo_transformed(echo);
        const scanlib::target& t = targets[target_count - 1];
        Return ret;
        ret.position = io::apply_transform(
            transform_, {t.vertex[0], t.vertex[1], t.vertex[2]});
        ret.pulse_index = scan_.pulses.size();
        ret.target_index = static_cast<std::uint8_t>(target_count);
        ret.range = t.echo_range;
        ret.reflectance = static_cast<float>(t.reflectance);
        scan_.returns.push_back(ret);
      }

      void on_shot_end() override {
        scanlib::pointcloud::on_shot_end();
        Pulse pulse;
        pulse.origin = io::apply_transform(
            transform_, {beam_origin[0], beam_origin[1], beam_origin[2]});
        Eigen::RowVector3d dir(beam_direction[0], beam_direction[1],
                               beam_direction[2]);
        dir = (dir * transform_.topLeftCorner<3, 3>()).normalized();
        pulse.zenith = std::acos(std::clamp(dir[2], -1.0, 1.0));
        pulse.azimuth = std::atan2(dir[0], dir[1]);
        if (pulse.azimuth < 0) pulse.azimuth += 2 * std::numbers::pi;
        pulse.target_count = static_cast<std::uint8_t>(target_count);

        // the echoes of this shot were added before its count was known
        for (size_t i = scan_.returns.size(); i-- > 0;) {
          if (scan_.returns[i].pulse_index != scan_.pulses.size()) break;
          scan_.returns[i].target_count = pulse.target_count;
        }
        scan_.pulses.push_back(pulse);
      }

     private:
      const io::TransformMatrix& transform_;
      ScanData& scan_;
    };
  }  // namespace

  /**
   * Decodes the raw .rxp scan with RiVLib. The decimated .rdbx scan is not
   * read, it holds no pulses without returns.
   */
  class ScanReaderRiVLib : public ScanReaderInterface {
   public:
    void open(const project::ScanPositionFiles& files,
              const io::TransformMatrix& transform) override {
      path_ = files.raw_scan.string();
      transform_ = transform;
      opened_ = true;
    }

    void readScan(ScanData& scan) override {
      if (!opened_) throw tlsbatchException("No scan opened");
      scan.clear();
      scan.sensor_origin = io::sensor_origin(transform_);
      try {
        std::shared_ptr<scanlib::basic_rconnection> rc =
            scanlib::basic_rconnection::create("file:" + path_);
        rc->open();
        scanlib::decoder_rxpmarker dec(rc);
        RxpImporter importer(transform_, scan);
        scanlib::buffer buf;
        for (dec.get(buf); !dec.eoi(); dec.get(buf)) {
          importer.dispatch(buf.begin(), buf.end());
        }
        rc->close();
      } catch (const std::exception& e) {
        throw tlsbatchException(
            fmt::format("Unable to decode {}. {}", path_, e.what()));
      }
      if (scan.pulses.empty()) {
        throw tlsbatchException(fmt::format("No pulses in {}", path_));
      }
      logger::Logger::get_logger().debug("Decoded {} pulses from {}",
                                         scan.pulses.size(), path_);
    }

    void close() override { opened_ = false; }

   private:
    std::string path_;
    io::TransformMatrix transform_;
    bool opened_ = false;
  };

  std::unique_ptr<ScanReaderInterface> createScanReaderRiegl() {
    return std::make_unique<ScanReaderRiVLib>();
  }

}  // namespace tlsbatch::analysis
