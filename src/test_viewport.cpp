#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <limits>

#include "viewport.h"

using namespace panegrid;

TEST_SUITE("viewport") {
  TEST_CASE("chunk_at floors toward negative infinity") {
    ChunkGrid grid{100.0f, 50.0f};
    CHECK(chunk_at(grid, Vec2{0.0f, 0.0f}) == ChunkCoord{0, 0});
    CHECK(chunk_at(grid, Vec2{99.9f, 49.9f}) == ChunkCoord{0, 0});
    CHECK(chunk_at(grid, Vec2{100.0f, 50.0f}) == ChunkCoord{1, 1});
    CHECK(chunk_at(grid, Vec2{-0.1f, -0.1f}) == ChunkCoord{-1, -1});
    CHECK(chunk_at(grid, Vec2{-100.0f, -50.0f}) == ChunkCoord{-1, -1});
    CHECK(chunk_at(grid, Vec2{-100.5f, 120.0f}) == ChunkCoord{-2, 2});
  }

  TEST_CASE("chunk_at saturates far away and ignores bad input") {
    ChunkGrid grid{1.0f, 1.0f};
    CHECK(chunk_at(grid, Vec2{1e30f, -1e30f}) ==
          ChunkCoord{std::numeric_limits<int>::max(), std::numeric_limits<int>::min()});
    CHECK(chunk_at(grid, Vec2{std::numeric_limits<float>::quiet_NaN(), 5.0f}) == ChunkCoord{0, 5});
    CHECK(chunk_at(ChunkGrid{0.0f, 10.0f}, Vec2{50.0f, 50.0f}) == ChunkCoord{0, 5});
  }

  TEST_CASE("chunk_origin is the top-left corner in world units") {
    ChunkGrid grid{1470.0f, 735.0f};
    CHECK(chunk_origin(grid, ChunkCoord{2, -1}) == Vec2{2940.0f, -735.0f});
  }

  TEST_CASE("to_chunk_local stays inside the chunk") {
    ChunkGrid grid{100.0f, 100.0f};
    CHECK(to_chunk_local(grid, Vec2{250.0f, 30.0f}) == Vec2{50.0f, 30.0f});
    CHECK(to_chunk_local(grid, Vec2{-30.0f, -130.0f}) == Vec2{70.0f, 70.0f});
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
