#include <catch2/catch_all.hpp>
#include <gitwebdiff/snapshot.hpp>
#include <filesystem>
#include <fstream>

using namespace gitwebdiff;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("gitwebdiff_snap_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void put(const fs::path& p, const std::string& content){
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << content;
}

TEST_CASE("directory trees are paired into add/delete/change/move") {
  auto root = mkd("pairs");
  auto l = root / "left";
  auto r = root / "right";
  put(l / "same.txt", "same\n");
  put(r / "same.txt", "same\n");
  put(l / "src/changed.cpp", "int a;\n");
  put(r / "src/changed.cpp", "int bb;\n");
  put(l / "gone.txt", "bye\n");
  put(r / "logo.png", "PNG");
  put(l / "old_name.txt", "moved content\n");
  put(r / "new_name.txt", "moved content\n");

  DirDiffComputer c;
  auto pairs = c.compute(l, r);
  REQUIRE(pairs.size() == 4);
  for (int i = 0; i < 4; i++)
    REQUIRE(pairs[i].idx == i);

  REQUIRE(pairs[0].type == PairType::Delete);
  REQUIRE(pairs[0].a == "gone.txt");
  REQUIRE(pairs[0].b.empty());
  REQUIRE(pairs[0].size_a == 4);

  REQUIRE(pairs[1].type == PairType::Add);
  REQUIRE(pairs[1].b == "logo.png");
  REQUIRE(pairs[1].is_image_diff);
  REQUIRE(pairs[1].size_b == 3);

  REQUIRE(pairs[2].type == PairType::Move);
  REQUIRE(pairs[2].a == "old_name.txt");
  REQUIRE(pairs[2].b == "new_name.txt");

  REQUIRE(pairs[3].type == PairType::Change);
  REQUIRE(pairs[3].a == "src/changed.cpp");
  REQUIRE(pairs[3].size_a == 7);
  REQUIRE(pairs[3].size_b == 8);
  REQUIRE_FALSE(pairs[3].is_image_diff);
  REQUIRE(to_string(pairs[3].type) == "change");
}

TEST_CASE("move detection can be turned off") {
  auto root = mkd("nomove");
  put(root / "l/a.txt", "x\n");
  put(root / "r/b.txt", "x\n");
  DirDiffComputer c(DirDiffOptions{false});
  auto pairs = c.compute(root / "l", root / "r");
  REQUIRE(pairs.size() == 2);
  REQUIRE(pairs[0].type == PairType::Delete);
  REQUIRE(pairs[1].type == PairType::Add);
}

TEST_CASE("symlinks into another tree are compared by their target content") {
  auto root = mkd("links");
  put(root / "work/f.txt", "new\n");
  put(root / "l/f.txt", "old\n");
  fs::create_directories(root / "r");
  fs::create_symlink(root / "work/f.txt", root / "r/f.txt");

  auto pairs = DirDiffComputer().compute(root / "l", root / "r/");
  REQUIRE(pairs.size() == 1);
  REQUIRE(pairs[0].b == "f.txt");
  REQUIRE(pairs[0].type == PairType::Change);
}

TEST_CASE("identical trees give an empty snapshot; missing trees throw") {
  auto root = mkd("same");
  put(root / "l/x", "1");
  put(root / "r/x", "1");
  REQUIRE(DirDiffComputer().compute(root / "l", root / "r").empty());
  REQUIRE_THROWS(DirDiffComputer().compute(root / "l", root / "nope"));
  REQUIRE(empty_snapshot()->empty());
  REQUIRE(empty_snapshot() == empty_snapshot());
}

TEST_CASE("image extensions") {
  REQUIRE(is_image_path("a/b/c.PNG"));
  REQUIRE(is_image_path("x.jpeg"));
  REQUIRE_FALSE(is_image_path("x.txt"));
  REQUIRE_FALSE(is_image_path("png"));
}
