#include <catch2/catch_test_macros.hpp>
#include "statesync/priority.hpp"

using namespace statesync;

namespace {

StateSyncArtifactId Id(Height height, uint8_t tag) {
  StateSyncArtifactId id;
  id.height = height;
  id.root_hash.fill(tag);
  return id;
}

} // namespace

TEST_CASE("ComputePriority - With a fetch target", "[priority]") {
  auto target = std::make_optional(Id(100, 0xaa));

  REQUIRE(ComputePriority(target, 50, Id(100, 0xaa)) == Priority::Fetch);
  REQUIRE(ComputePriority(target, 50, Id(100, 0xbb)) == Priority::Drop);
  REQUIRE(ComputePriority(target, 50, Id(99, 0xaa)) == Priority::Drop);
  REQUIRE(ComputePriority(target, 50, Id(10, 0xaa)) == Priority::Drop);
  REQUIRE(ComputePriority(target, 50, Id(101, 0xcc)) == Priority::Stash);

  // The local height does not matter once a target is set
  REQUIRE(ComputePriority(target, 200, Id(100, 0xaa)) == Priority::Fetch);
}

TEST_CASE("ComputePriority - Without a fetch target", "[priority]") {
  std::optional<StateSyncArtifactId> none;

  REQUIRE(ComputePriority(none, 50, Id(49, 1)) == Priority::Drop);
  REQUIRE(ComputePriority(none, 50, Id(50, 1)) == Priority::Drop);
  REQUIRE(ComputePriority(none, 50, Id(51, 1)) == Priority::Stash);
}

TEST_CASE("Priority - Names", "[priority]") {
  REQUIRE(std::string(PriorityToString(Priority::Fetch)) == "fetch");
  REQUIRE(std::string(PriorityToString(Priority::Stash)) == "stash");
  REQUIRE(std::string(PriorityToString(Priority::Drop)) == "drop");
}
