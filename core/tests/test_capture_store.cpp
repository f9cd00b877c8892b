#include "doctest/doctest.h"
#include "idelens/capture_store.hpp"
#include "idelens/inspector.hpp"
#include "ide_fixture.hpp"
#include <filesystem>
#include <fstream>

using namespace idelens;
using namespace idelens_test;
namespace fs = std::filesystem;

static Capture small_capture() {
  Capture c;
  c.width = 1;
  c.height = 1;
  c.data = {'B', 'M', 1, 2, 3};
  return c;
}

DOCTEST_TEST_CASE("traversal and home-relative paths are refused") {
  CaptureStore store(std::vector<std::string>{});
  DOCTEST_REQUIRE(store.check_path("../outside.bmp").error().kind ==
                  ErrorKind::AccessDenied);
  DOCTEST_REQUIRE(store.check_path("shots/../../outside.bmp").error().kind ==
                  ErrorKind::AccessDenied);
  DOCTEST_REQUIRE(store.check_path("~/shot.bmp").error().kind ==
                  ErrorKind::AccessDenied);
  DOCTEST_REQUIRE(store.check_path("").error().kind == ErrorKind::Malformed);
  DOCTEST_REQUIRE(store.check_path("shots/a.bmp").ok());
}

DOCTEST_TEST_CASE("system directories are refused") {
  auto root = (fs::current_path() / "idelens_protected").string();
  CaptureStore store({root});

  DOCTEST_REQUIRE(store.check_path(root + "/x.bmp").error().kind ==
                  ErrorKind::AccessDenied);
  DOCTEST_REQUIRE(store.check_path("idelens_protected/deep/x.bmp").error().kind ==
                  ErrorKind::AccessDenied);
  // Same prefix, different directory.
  DOCTEST_REQUIRE(store.check_path("idelens_protected_not/x.bmp").ok());
  DOCTEST_REQUIRE(!CaptureStore::default_protected_roots().empty());
}

DOCTEST_TEST_CASE("save creates missing directories and writes the bytes") {
  const std::string dir = "idelens_test_out";
  fs::remove_all(dir);
  CaptureStore store(std::vector<std::string>{});

  auto st = store.save(small_capture(), dir + "/nested/shot.bmp");
  DOCTEST_REQUIRE(st.ok());
  DOCTEST_REQUIRE(fs::exists(dir + "/nested/shot.bmp"));
  DOCTEST_REQUIRE_EQ(fs::file_size(dir + "/nested/shot.bmp"), 5u);

  std::ifstream f(dir + "/nested/shot.bmp", std::ios::binary);
  std::vector<char> bytes((std::istreambuf_iterator<char>(f)),
                          std::istreambuf_iterator<char>());
  DOCTEST_REQUIRE_EQ(bytes[0], 'B');
  DOCTEST_REQUIRE_EQ(bytes[4], 3);
  f.close();
  fs::remove_all(dir);
}

DOCTEST_TEST_CASE("empty captures are not written") {
  CaptureStore store(std::vector<std::string>{});
  auto st = store.save(Capture{}, "idelens_empty.bmp");
  DOCTEST_REQUIRE(!st.ok());
  DOCTEST_REQUIRE(st.error().kind == ErrorKind::Malformed);
  DOCTEST_REQUIRE(!fs::exists("idelens_empty.bmp"));
}

DOCTEST_TEST_CASE("inspector save reports success as a flag") {
  FakeBackend fb;
  populate_ide(fb);
  Inspector in(&fb);

  const std::string dir = "idelens_test_save";
  fs::remove_all(dir);
  auto c = in.capture_window(kOutput);
  DOCTEST_REQUIRE(in.save_capture(c, dir + "/output.bmp"));
  DOCTEST_REQUIRE_EQ(fs::file_size(dir + "/output.bmp"), c.data.size());
  DOCTEST_REQUIRE(!in.save_capture(c, "../output.bmp"));
  DOCTEST_REQUIRE(!in.save_capture(Capture{}, dir + "/empty.bmp"));
  DOCTEST_REQUIRE(in.save_capture_async(c, dir + "/async.bmp").get());
  DOCTEST_REQUIRE_THROWS_AS(in.save_capture(c, ""), std::invalid_argument);
  fs::remove_all(dir);
}
