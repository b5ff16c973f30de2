// tests/test_resource_id.cpp

#include <doctest/doctest.h>

#include "core/common/resource_id.hpp"

#include <set>
#include <sstream>

using manor::resource_id_t;

TEST_SUITE("resource_id") {

TEST_CASE("bare path lands in the manor namespace") {
  resource_id_t id("coins");
  CHECK(id.get_namespace() == "manor");
  CHECK(id.get_path() == "coins");
  CHECK(id.to_string() == "manor:coins");
}

TEST_CASE("explicit namespace is kept") {
  resource_id_t id("mod:secret_room");
  CHECK(id.get_namespace() == "mod");
  CHECK(id.get_path() == "secret_room");
  CHECK(id != resource_id_t("secret_room"));
  CHECK(id == resource_id_t("mod", "secret_room"));
}

TEST_CASE("from_name builds ids from display names") {
  CHECK(resource_id_t::from_name("Entrance Hall") == resource_id_t("entrance_hall"));
  CHECK(resource_id_t::from_name("Maid's Chamber") == resource_id_t("maids_chamber"));
  CHECK(resource_id_t::from_name("Vault") == resource_id_t("vault"));
}

TEST_CASE("ordering and streaming") {
  std::set<resource_id_t> ids{"b", "a", "other:a"};
  CHECK(ids.size() == 3);
  CHECK(*ids.begin() == resource_id_t("a"));

  std::ostringstream os;
  os << resource_id_t("keys");
  CHECK(os.str() == "manor:keys");

  CHECK(resource_id_t().empty());
}

}
