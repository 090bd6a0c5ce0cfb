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

#include <cpl_error.h>
#include <gdal_priv.h>

#include <memory>
#include <tlsbatch/common/datastructures.hpp>
#include <tlsbatch/io/RasterReader.hpp>
#include <tlsbatch/io/RasterWriter.hpp>
#include <tlsbatch/logger/logger.h>

#include "fmt/format.h"

namespace tlsbatch::io {

  namespace {
    struct GDALDatasetCloser {
      void operator()(GDALDataset* ds) const {
        if (ds) GDALClose(GDALDataset::ToHandle(ds));
      }
    };
    typedef std::unique_ptr<GDALDataset, GDALDatasetCloser> DatasetPtr;

    std::string last_gdal_error() {
      const char* msg = CPLGetLastErrorMsg();
      return msg ? msg : "";
    }
  }  // namespace

  class RasterWriterGDAL : public RasterWriterInterface {
   public:
    RasterWriterGDAL() { GDALAllRegister(); }

    void writeGrid(const std::string& path, const Grid3D& grid) override {
      if (grid.size() == 0) {
        throw tlsbatchException(fmt::format("Refusing to write empty grid {}",
                                            path));
      }
      GDALDriver* gdal_driver =
          GetGDALDriverManager()->GetDriverByName(driver.c_str());
      if (gdal_driver == nullptr) {
        throw tlsbatchException(
            fmt::format("GDAL driver {} is not available", driver));
      }

      char** options = nullptr;
      options = CSLSetNameValue(options, "COMPRESS", "DEFLATE");
      DatasetPtr dataset(gdal_driver->Create(
          path.c_str(), static_cast<int>(grid.dim_x),
          static_cast<int>(grid.dim_y), static_cast<int>(grid.dim_z),
          GDT_Float32, driver == "GTiff" ? options : nullptr));
      CSLDestroy(options);
      if (!dataset) {
        throw tlsbatchException(fmt::format("Unable to create {}. {}", path,
                                            last_gdal_error()));
      }

      double geotransform[6] = {grid.min_x,
                                grid.cellsize,
                                0,
                                grid.min_y + grid.dim_y * grid.cellsize,
                                0,
                                -grid.cellsize};
      dataset->SetGeoTransform(geotransform);
      dataset->SetMetadataItem("MIN_Z", fmt::format("{}", grid.min_z).c_str());

      std::vector<float> band_data(grid.dim_x * grid.dim_y);
      for (size_t iz = 0; iz < grid.dim_z; ++iz) {
        for (size_t iy = 0; iy < grid.dim_y; ++iy) {
          size_t row = grid.dim_y - 1 - iy;
          for (size_t ix = 0; ix < grid.dim_x; ++ix) {
            band_data[row * grid.dim_x + ix] = grid.at(ix, iy, iz);
          }
        }
        GDALRasterBand* band =
            dataset->GetRasterBand(static_cast<int>(iz) + 1);
        band->SetNoDataValue(grid.nodataval);
        CPLErr err = band->RasterIO(GF_Write, 0, 0, static_cast<int>(grid.dim_x),
                                    static_cast<int>(grid.dim_y),
                                    band_data.data(),
                                    static_cast<int>(grid.dim_x),
                                    static_cast<int>(grid.dim_y), GDT_Float32,
                                    0, 0, nullptr);
        if (err != CE_None) {
          throw tlsbatchException(fmt::format("Unable to write band {} of {}. {}",
                                              iz + 1, path, last_gdal_error()));
        }
      }
      logger::Logger::get_logger().debug("Wrote {}", path);
    }
  };

  class RasterReaderGDAL : public RasterReaderInterface {
    DatasetPtr open(const std::string& path) {
      DatasetPtr dataset(
          GDALDataset::FromHandle(GDALOpen(path.c_str(), GA_ReadOnly)));
      if (!dataset) {
        throw tlsbatchException(
            fmt::format("Unable to open raster {}. {}", path,
                        last_gdal_error()));
      }
      return dataset;
    }

    void read_band(GDALDataset& dataset, int band_no, std::vector<float>& data,
                   const std::string& path) {
      const int nx = dataset.GetRasterXSize();
      const int ny = dataset.GetRasterYSize();
      data.resize(static_cast<size_t>(nx) * ny);
      GDALRasterBand* band = dataset.GetRasterBand(band_no);
      CPLErr err = band->RasterIO(GF_Read, 0, 0, nx, ny, data.data(), nx, ny,
                                  GDT_Float32, 0, 0, nullptr);
      if (err != CE_None) {
        throw tlsbatchException(fmt::format("Unable to read band {} of {}. {}",
                                            band_no, path, last_gdal_error()));
      }
    }

   public:
    RasterReaderGDAL() { GDALAllRegister(); }

    Raster readRaster(const std::string& path, int band_no) override {
      auto dataset = open(path);
      if (band_no < 1 || band_no > dataset->GetRasterCount()) {
        throw tlsbatchException(
            fmt::format("Raster {} has no band {}", path, band_no));
      }
      Raster raster;
      raster.dim_x = dataset->GetRasterXSize();
      raster.dim_y = dataset->GetRasterYSize();
      if (dataset->GetGeoTransform(raster.geotransform.data()) != CE_None) {
        throw tlsbatchException(
            fmt::format("Raster {} has no geotransform", path));
      }
      int has_nodata = 0;
      double nodata =
          dataset->GetRasterBand(band_no)->GetNoDataValue(&has_nodata);
      if (has_nodata) raster.nodataval = static_cast<float>(nodata);
      read_band(*dataset, band_no, raster.array, path);
      return raster;
    }

    Grid3D readGrid(const std::string& path) override {
      auto dataset = open(path);
      double gt[6];
      if (dataset->GetGeoTransform(gt) != CE_None) {
        throw tlsbatchException(
            fmt::format("Raster {} has no geotransform", path));
      }
      Grid3D grid(dataset->GetRasterXSize(), dataset->GetRasterYSize(),
                  dataset->GetRasterCount());
      grid.cellsize = gt[1];
      grid.min_x = gt[0];
      grid.min_y = gt[3] + gt[5] * grid.dim_y;
      if (const char* min_z = dataset->GetMetadataItem("MIN_Z")) {
        grid.min_z = std::stod(min_z);
      }

      std::vector<float> band_data;
      for (size_t iz = 0; iz < grid.dim_z; ++iz) {
        int band_no = static_cast<int>(iz) + 1;
        int has_nodata = 0;
        double nodata =
            dataset->GetRasterBand(band_no)->GetNoDataValue(&has_nodata);
        if (has_nodata) grid.nodataval = static_cast<float>(nodata);
        read_band(*dataset, band_no, band_data, path);
        for (size_t iy = 0; iy < grid.dim_y; ++iy) {
          size_t row = grid.dim_y - 1 - iy;
          for (size_t ix = 0; ix < grid.dim_x; ++ix) {
            grid.at(ix, iy, iz) = band_data[row * grid.dim_x + ix];
          }
        }
      }
      return grid;
    }
  };

  std::unique_ptr<RasterWriterInterface> createRasterWriterGDAL() {
    return std::make_unique<RasterWriterGDAL>();
  }

  std::unique_ptr<RasterReaderInterface> createRasterReaderGDAL() {
    return std::make_unique<RasterReaderGDAL>();
  }

}  // namespace tlsbatch::io
