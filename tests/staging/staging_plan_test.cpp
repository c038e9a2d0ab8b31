#include "staging/staging_plan.hpp"

#include <catch2/catch.hpp>

#include <filesystem>

namespace fs = std::filesystem;

using diststage::staging::CommitFileSet;

TEST_CASE("Commit set keeps first-insertion order", "[staging][plan]") {
  CommitFileSet files;
  REQUIRE(files.empty());
  REQUIRE(files.Register("/co/source/foo-src.zip"));
  REQUIRE(files.Register("/co/HEADER.html"));
  REQUIRE(files.Register("/co/RELEASE-NOTES.txt"));

  REQUIRE(files.size() == 3U);
  REQUIRE(files.Paths()[0] == fs::path("/co/source/foo-src.zip"));
  REQUIRE(files.Paths()[1] == fs::path("/co/HEADER.html"));
  REQUIRE(files.Paths()[2] == fs::path("/co/RELEASE-NOTES.txt"));
}

TEST_CASE("Commit set drops duplicates, including non-normalized spellings",
          "[staging][plan]") {
  CommitFileSet files;
  REQUIRE(files.Register("/co/RELEASE-NOTES.txt"));
  REQUIRE(files.Register("/co/README.html"));
  REQUIRE_FALSE(files.Register("/co/RELEASE-NOTES.txt"));
  REQUIRE_FALSE(files.Register("/co/source/../RELEASE-NOTES.txt"));
  files.RegisterMany({"/co/README.html", "/co/./binaries/HEADER.html"});

  REQUIRE(files.size() == 3U);
  REQUIRE(files.Paths()[0] == fs::path("/co/RELEASE-NOTES.txt"));
  REQUIRE(files.Paths()[2] == fs::path("/co/binaries/HEADER.html"));
  REQUIRE(files.Contains("/co/binaries/./HEADER.html"));
  REQUIRE_FALSE(files.Contains("/co/source/HEADER.html"));
}
