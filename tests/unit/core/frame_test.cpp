#include <pillsight/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace pc = pillsight::core;

TEST(Frame, DefaultEmpty) {
  pc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 80 * 3);
  pc::Frame f(100, 80, pc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 80u);
  EXPECT_EQ(f.format(), pc::PixelFormat::BGR8);
  EXPECT_FALSE(f.empty());
  EXPECT_EQ(f.size_bytes(), 100u * 80 * 3);
  EXPECT_EQ(f.data().size(), 100u * 80 * 3);
  EXPECT_TRUE(f.is_consistent());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::BGR8), 300u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Float32Gray), 400u);
  EXPECT_EQ(pc::Frame::min_bytes(10, 10, pc::PixelFormat::Unknown), 0u);
}

TEST(Frame, ShortBufferIsInconsistent) {
  pc::Frame f(10, 10, pc::PixelFormat::BGR8, std::vector<std::byte>(299));
  EXPECT_FALSE(f.is_consistent());
}

TEST(Frame, UnknownFormatIsInconsistent) {
  pc::Frame f(10, 10, pc::PixelFormat::Unknown, std::vector<std::byte>(300));
  EXPECT_FALSE(f.is_consistent());
}
