#include "TestPages.hpp"
#include "TestPdf.hpp"
#include "mathmark/RegionRasterizer.hpp"
#include "mathmark/VectorPageReader.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <cmath>
#include <filesystem>

using namespace mathmark;
using namespace mathmark::testing;

TEST(RenderGeometryTest, MarginAndScaleSetOutputSize) {
  Page page = letterPage();
  RenderGeometry geometry =
      computeRenderGeometry(BoundingBox(100, 200, 200, 220), page, 3.0, 4.0,
                            4096);

  EXPECT_EQ(geometry.region, BoundingBox(97, 197, 203, 223));
  EXPECT_DOUBLE_EQ(geometry.scale, 4.0);
  EXPECT_FALSE(geometry.capped);
  EXPECT_EQ(geometry.pixelX, 388);
  EXPECT_EQ(geometry.pixelY, 788);
  EXPECT_EQ(geometry.pixelWidth, 424);
  EXPECT_EQ(geometry.pixelHeight, 104);
}

TEST(RenderGeometryTest, RegionIsClampedToThePage) {
  Page page = letterPage();
  RenderGeometry geometry = computeRenderGeometry(
      BoundingBox(0, 0, 50, 20), page, 3.0, 4.0, 4096);

  EXPECT_EQ(geometry.region, BoundingBox(0, 0, 53, 23));
  EXPECT_EQ(geometry.pixelX, 0);
  EXPECT_EQ(geometry.pixelY, 0);
  EXPECT_EQ(geometry.pixelWidth, 212);
  EXPECT_EQ(geometry.pixelHeight, 92);
}

TEST(RenderGeometryTest, PixelCapReducesScaleUniformly) {
  Page page = letterPage();
  RenderGeometry geometry = computeRenderGeometry(
      BoundingBox(0, 0, 600, 100), page, 3.0, 10.0, 4096);

  EXPECT_TRUE(geometry.capped);
  EXPECT_NEAR(geometry.scale, 4096.0 / 603.0, 1e-9);
  EXPECT_EQ(geometry.pixelWidth, 4096);
  EXPECT_NEAR(geometry.pixelHeight, 103 * 4096.0 / 603.0, 1.0);
}

TEST(RenderGeometryTest, RegionOutsidePageHasNoPixels) {
  Page page = letterPage();
  RenderGeometry geometry = computeRenderGeometry(
      BoundingBox(700, 900, 720, 920), page, 3.0, 4.0, 4096);

  EXPECT_EQ(geometry.pixelWidth, 0);
  EXPECT_EQ(geometry.pixelHeight, 0);
}

TEST(RegionRasterizerTest, ImageFileNameUsesOneBasedPage) {
  EXPECT_EQ(RegionRasterizer::imageFileName(1, 0), "formula_001_page_001.png");
  EXPECT_EQ(RegionRasterizer::imageFileName(17, 11),
            "formula_017_page_012.png");
  EXPECT_EQ(RegionRasterizer::imageFileName(1234, 0),
            "formula_1234_page_001.png");
}

TEST(RegionRasterizerTest, BlankDetectionUsesGreyRange) {
  RegionRasterizer rasterizer;

  cv::Mat white(40, 120, CV_8UC3, cv::Scalar(255, 255, 255));
  EXPECT_TRUE(rasterizer.isBlank(white));

  cv::Mat inked = white.clone();
  cv::line(inked, cv::Point(10, 20), cv::Point(110, 20), cv::Scalar(0, 0, 0),
           2);
  EXPECT_FALSE(rasterizer.isBlank(inked));

  EXPECT_TRUE(rasterizer.isBlank(cv::Mat()));
}

TEST(RegionRasterizerTest, MissingDocumentFailsToOpen) {
  RegionRasterizer rasterizer;
  std::string error;
  EXPECT_FALSE(rasterizer.open("/nonexistent/paper.pdf", error));
  EXPECT_FALSE(rasterizer.isOpen());
  EXPECT_NE(error.find("/nonexistent/paper.pdf"), std::string::npos);

  RasterResult result =
      rasterizer.rasterize(letterPage(), BoundingBox(10, 10, 50, 30), 1, "/tmp");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());
}

TEST(RegionRasterizerTest, StoredImageHasMarginAndScale) {
  std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "mathmark_rasterizer_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  std::string pdf = (dir / "region.pdf").string();
  ASSERT_TRUE(writeSinglePagePdf(pdf, formulaContent(140, 400, 6)));

  PageReadResult read = readPages(pdf);
  ASSERT_TRUE(read.success) << read.errorMessage;
  ASSERT_EQ(read.pages.size(), 1u);

  RasterConfig config;
  config.scale = 4.0;
  config.margin = 3.0;
  RegionRasterizer rasterizer(config);
  std::string openError;
  ASSERT_TRUE(rasterizer.open(pdf, openError)) << openError;

  // Six 12x14 glyphs at a 14pt pitch
  BoundingBox bbox(140, 378, 222, 392);
  RasterResult result =
      rasterizer.rasterize(read.pages[0], bbox, 1, (dir / "formulas").string());
  ASSERT_TRUE(result.success) << result.errorMessage;

  EXPECT_EQ(result.image.width, 352);  // (82 + 6) x 4
  EXPECT_EQ(result.image.height, 80);  // (14 + 6) x 4
  EXPECT_DOUBLE_EQ(result.image.scale, 4.0);

  cv::Mat stored = cv::imread(result.image.path);
  ASSERT_FALSE(stored.empty());
  EXPECT_EQ(stored.cols, result.image.width);
  EXPECT_EQ(stored.rows, result.image.height);
  EXPECT_FALSE(rasterizer.isBlank(stored));

  std::filesystem::remove_all(dir);
}
