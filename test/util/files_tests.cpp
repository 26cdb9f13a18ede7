#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"
#include "util/files.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <stdexcept>

using namespace statesync;
using namespace statesync::test;

TEST_CASE("Files - Positional reads and writes", "[files]") {
  TempDir dir;
  auto path = dir.path() / "a" / "b" / "data.bin";

  SECTION("create_sized_file creates parents and a zero-filled file") {
    REQUIRE(util::create_sized_file(path, 10000));
    REQUIRE(fs::file_size(path) == 10000);
    auto bytes = util::read_range(path, 9000, 1000);
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == std::vector<uint8_t>(1000, 0));
  }

  SECTION("write_at keeps the length and the other bytes") {
    REQUIRE(util::create_sized_file(path, 100));
    std::vector<uint8_t> data = {1, 2, 3, 4};
    REQUIRE(util::write_at(path, 50, data.data(), data.size()));
    REQUIRE(fs::file_size(path) == 100);

    auto content = ReadFile(path);
    REQUIRE(content[49] == 0);
    REQUIRE(content[50] == 1);
    REQUIRE(content[53] == 4);
    REQUIRE(content[54] == 0);
  }

  SECTION("read_range past the end fails") {
    REQUIRE(util::create_sized_file(path, 10));
    REQUIRE_FALSE(util::read_range(path, 5, 10).has_value());
    REQUIRE(util::read_range(path, 5, 5).has_value());
  }

  SECTION("write_at on a missing file fails") {
    std::vector<uint8_t> data = {1};
    REQUIRE_FALSE(util::write_at(dir.path() / "missing", 0, data.data(), 1));
  }
}

TEST_CASE("Files - Atomic write and directory helpers", "[files]") {
  TempDir dir;
  auto path = dir.path() / "config.json";

  REQUIRE(util::atomic_write_file(path, std::string("{\"a\":1}")));
  REQUIRE(util::atomic_write_file(path, std::string("{\"a\":2}")));
  auto content = ReadFile(path);
  REQUIRE(std::string(content.begin(), content.end()) == "{\"a\":2}");
  // No temp file left behind
  REQUIRE(std::distance(fs::directory_iterator(dir.path()),
                        fs::directory_iterator()) == 1);

  auto sub = dir.path() / "sub";
  REQUIRE_FALSE(util::is_empty_directory(sub));
  REQUIRE(util::ensure_directory(sub));
  REQUIRE(util::is_empty_directory(sub));
  WriteFile(sub / "x", {1});
  REQUIRE_FALSE(util::is_empty_directory(sub));

  REQUIRE(util::remove_all(sub));
  REQUIRE_FALSE(fs::exists(sub));
  REQUIRE(util::remove_all(sub));
}

TEST_CASE("ThreadPool - JoinAll drains every future", "[threadpool]") {
  util::ThreadPool pool(3);

  SECTION("Results keep submission order") {
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
      futures.push_back(pool.enqueue([i]() { return i * i; }));
    }
    auto results = util::JoinAll(futures);
    REQUIRE(results.size() == 20);
    for (int i = 0; i < 20; ++i) {
      REQUIRE(results[i] == i * i);
    }
  }

  SECTION("First exception is rethrown after all tasks finished") {
    std::atomic<int> finished{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
      futures.push_back(pool.enqueue([i, &finished]() {
        finished++;
        if (i == 3) {
          throw std::runtime_error("task 3 failed");
        }
        return i;
      }));
    }
    REQUIRE_THROWS_AS(util::JoinAll(futures), std::runtime_error);
    REQUIRE(finished.load() == 10);
  }
}

TEST_CASE("ThreadPool - Sizing and shutdown", "[threadpool]") {
  SECTION("Zero threads means one per core") {
    util::ThreadPool pool(0);
    REQUIRE(pool.size() > 0);
  }

  SECTION("Queued tasks run before the pool is destroyed") {
    std::atomic<int> finished{0};
    {
      util::ThreadPool pool(1);
      REQUIRE(pool.size() == 1);
      for (int i = 0; i < 50; ++i) {
        // Futures are dropped; the pool still owns the tasks
        (void)pool.enqueue([&finished]() { finished++; });
      }
    }
    REQUIRE(finished.load() == 50);
  }
}
