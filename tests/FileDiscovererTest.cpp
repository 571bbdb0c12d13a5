#include <algorithm>
#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/storage/FileDiscoverer.hpp"

using namespace testing_support;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> drain(FileDiscoverer& d) {
  std::vector<std::string> out;
  while (auto p = d.next()) out.push_back(fs::path(*p).filename().string());
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

TEST(FileDiscoverer, NormalizesExtensions) {
  EXPECT_EQ(normalize_extension("JPG"), ".jpg");
  EXPECT_EQ(normalize_extension(".PnG"), ".png");
  EXPECT_EQ(normalize_extension(""), "");
}

TEST(FileDiscoverer, FiltersByExtensionCaseInsensitively) {
  TempDir dir;
  write_file(dir.file("a.JPG"), "x");
  write_file(dir.file("b.png"), "x");
  write_file(dir.file("notes.txt"), "x");
  write_file(dir.file("noext"), "x");

  FileDiscoverer d(dir.path().string(), {"jpg", ".PNG"}, true, CancellationToken());
  EXPECT_EQ(drain(d), (std::vector<std::string>{"a.JPG", "b.png"}));
  EXPECT_FALSE(d.warning());
}

TEST(FileDiscoverer, YieldsAbsolutePaths) {
  TempDir dir;
  write_file(dir.file("a.png"), "x");
  FileDiscoverer d(dir.path().string(), {".png"}, true, CancellationToken());
  auto p = d.next();
  ASSERT_TRUE(p);
  EXPECT_TRUE(fs::path(*p).is_absolute());
}

TEST(FileDiscoverer, RecursionFlag) {
  TempDir dir;
  write_file(dir.file("top.png"), "x");
  write_file(dir.file("sub/deep/inner.png"), "x");

  FileDiscoverer flat(dir.path().string(), {".png"}, false, CancellationToken());
  EXPECT_EQ(drain(flat), (std::vector<std::string>{"top.png"}));

  FileDiscoverer deep(dir.path().string(), {".png"}, true, CancellationToken());
  EXPECT_EQ(drain(deep), (std::vector<std::string>{"inner.png", "top.png"}));
}

TEST(FileDiscoverer, MissingRootEndsQuietlyWithWarning) {
  TempDir dir;
  const auto missing = dir.file("gone");

  FileDiscoverer d(missing, {".png"}, true, CancellationToken());
  EXPECT_FALSE(d.next());
  EXPECT_TRUE(d.warning());
  EXPECT_FALSE(d.next());
}

TEST(FileDiscoverer, RestartWalksAgain) {
  TempDir dir;
  write_file(dir.file("a.png"), "x");
  write_file(dir.file("b.gif"), "x");

  FileDiscoverer d(dir.path().string(), {".png", ".gif"}, true, CancellationToken());
  const auto first = drain(d);
  d.restart();
  EXPECT_EQ(drain(d), first);
  EXPECT_EQ(first.size(), 2u);
}

TEST(FileDiscoverer, StopsYieldingOnceCancelled) {
  TempDir dir;
  for (int i = 0; i < 5; ++i) write_file(dir.file("f" + std::to_string(i) + ".png"), "x");

  CancellationSource source;
  FileDiscoverer d(dir.path().string(), {".png"}, true, source.token());
  ASSERT_TRUE(d.next());
  source.cancel();
  EXPECT_FALSE(d.next());
  EXPECT_FALSE(d.warning());
}
