#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cuberace/map_definition.hpp"

namespace {

class TempMapDir {
 public:
  TempMapDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() / ("cuberace-maps-" + std::to_string(stamp));
    std::filesystem::create_directories(path_);
  }
  ~TempMapDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  void Write(const std::string& name, const std::string& content) const {
    std::ofstream out(path_ / name, std::ios::binary);
    out << content;
  }

  const std::filesystem::path& Path() const { return path_; }

 private:
  std::filesystem::path path_;
};

const std::vector<std::string> kTeams{"red", "blue"};

}  // namespace

TEST(MapParseTest, ReadsEveryMarker) {
  auto map = cuberace::ParseMap(
      "#####\n"
      "#R.O#\n"
      "#V.B#\n"
      "#O.G#\n"
      "#####\n",
      "marker.txt", kTeams);

  EXPECT_EQ(map.width, 5);
  EXPECT_EQ(map.height, 5);
  EXPECT_EQ(map.walls.size(), 16u);
  EXPECT_TRUE(map.walls.count(cuberace::Cell{0, 0}));
  ASSERT_EQ(map.ledges.size(), 1u);
  EXPECT_EQ(*map.ledges.begin(), (cuberace::Cell{1, 2}));
  EXPECT_EQ(map.starts.at("red"), (cuberace::Cell{1, 1}));
  EXPECT_EQ(map.starts.at("blue"), (cuberace::Cell{3, 2}));
  EXPECT_EQ(map.goal, (cuberace::Cell{3, 3}));
  ASSERT_EQ(map.initial_boulders.size(), 2u);
  EXPECT_EQ(map.initial_boulders[0], (cuberace::Cell{3, 1}));
  EXPECT_EQ(map.initial_boulders[1], (cuberace::Cell{1, 3}));
}

TEST(MapParseTest, StripsCarriageReturnsAndTrailingBlankLines) {
  auto map = cuberace::ParseMap("R.B\r\n..G\r\n\r\n\n", "crlf.txt", kTeams);
  EXPECT_EQ(map.width, 3);
  EXPECT_EQ(map.height, 2);
  EXPECT_EQ(map.goal, (cuberace::Cell{2, 1}));
}

TEST(MapParseTest, WidthIsLongestRow) {
  auto map = cuberace::ParseMap("RB\n.....G\n", "ragged.txt", kTeams);
  EXPECT_EQ(map.width, 6);
  EXPECT_EQ(map.height, 2);
}

TEST(MapParseTest, LastDuplicateMarkerWins) {
  auto map = cuberace::ParseMap("R.R\nB.G\nG..\n", "dup.txt", kTeams);
  EXPECT_EQ(map.starts.at("red"), (cuberace::Cell{2, 0}));
  EXPECT_EQ(map.goal, (cuberace::Cell{0, 2}));
}

TEST(MapParseTest, MissingGoalFails) {
  EXPECT_THROW(cuberace::ParseMap("R.B\n...\n", "nogoal.txt", kTeams), cuberace::MapLoadError);
}

TEST(MapParseTest, MissingTeamStartFails) {
  try {
    cuberace::ParseMap("R..\n..G\n", "noblue.txt", kTeams);
    FAIL() << "MapLoadError expected";
  } catch (const cuberace::MapLoadError& ex) {
    EXPECT_NE(std::string(ex.what()).find("blue"), std::string::npos);
    EXPECT_NE(std::string(ex.what()).find("noblue.txt"), std::string::npos);
  }
}

TEST(MapParseTest, EmptyTextFails) {
  EXPECT_THROW(cuberace::ParseMap("\n\n", "empty.txt", kTeams), cuberace::MapLoadError);
}

TEST(MapParseTest, ValidatesAgainstGivenTeams) {
  const std::vector<std::string> red_only{"red"};
  auto map = cuberace::ParseMap("R..\n..G\n", "solo.txt", red_only);
  EXPECT_EQ(map.starts.at("red"), (cuberace::Cell{0, 0}));
  EXPECT_FALSE(map.starts.count("blue"));

  const std::vector<std::string> with_green{"red", "blue", "green"};
  EXPECT_THROW(cuberace::ParseMap("R.B\n..G\n", "three.txt", with_green), cuberace::MapLoadError);
}

TEST(MapValidateTest, RejectsStartOrGoalOnWall) {
  cuberace::MapDefinition map;
  map.width = 3;
  map.height = 1;
  map.starts = {{"red", {0, 0}}, {"blue", {1, 0}}};
  map.goal = {2, 0};
  EXPECT_NO_THROW(cuberace::ValidateMap(map, kTeams, "ok"));

  map.walls.insert({1, 0});
  EXPECT_THROW(cuberace::ValidateMap(map, kTeams, "start-wall"), cuberace::MapLoadError);

  map.walls.clear();
  map.walls.insert({2, 0});
  EXPECT_THROW(cuberace::ValidateMap(map, kTeams, "goal-wall"), cuberace::MapLoadError);
}

TEST(MapCatalogTest, LoadsTxtFilesInNameOrderAndWraps) {
  TempMapDir dir;
  dir.Write("b_second.txt", "B.R\n..G\n");
  dir.Write("a_first.txt", "R.B\n..G\n");
  dir.Write("notes.md", "not a map");

  auto catalog = cuberace::MapCatalog::LoadDirectory(dir.Path(), kTeams);
  ASSERT_EQ(catalog.Size(), 2u);
  EXPECT_EQ(catalog.Current().name, "a_first.txt");
  EXPECT_EQ(catalog.Current().map->starts.at("red"), (cuberace::Cell{0, 0}));

  EXPECT_EQ(catalog.Advance().name, "b_second.txt");
  EXPECT_EQ(catalog.Current().map->starts.at("red"), (cuberace::Cell{2, 0}));
  EXPECT_EQ(catalog.Advance().name, "a_first.txt");
}

TEST(MapCatalogTest, EmptyOrMissingDirectoryFails) {
  TempMapDir dir;
  EXPECT_THROW(cuberace::MapCatalog::LoadDirectory(dir.Path(), kTeams), cuberace::MapLoadError);
  EXPECT_THROW(cuberace::MapCatalog::LoadDirectory(dir.Path() / "missing", kTeams), cuberace::MapLoadError);
}

TEST(MapCatalogTest, AnyInvalidMapFailsTheWholeCatalog) {
  TempMapDir dir;
  dir.Write("01_ok.txt", "R.B\n..G\n");
  dir.Write("02_broken.txt", "R..\n...\n");
  EXPECT_THROW(cuberace::MapCatalog::LoadDirectory(dir.Path(), kTeams), cuberace::MapLoadError);
}
