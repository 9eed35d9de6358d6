#include "tern/flat-hash-map.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>

namespace tern {

TEST(FlatHashMapTest, OwningValuesByFd) {
  flat_hash_map<int, std::unique_ptr<std::string>> map;
  EXPECT_TRUE(map.empty());

  map.insert_or_assign(7, std::make_unique<std::string>("first"));
  map.insert_or_assign(9, std::make_unique<std::string>("second"));
  EXPECT_EQ(map.size(), 2U);

  // Replacing the value of a reused fd destroys the previous one.
  map.insert_or_assign(7, std::make_unique<std::string>("reused"));
  EXPECT_EQ(map.size(), 2U);
  ASSERT_NE(map.find(7), map.end());
  EXPECT_EQ(*map.find(7)->second, "reused");

  EXPECT_EQ(map.erase(9), 1U);
  EXPECT_EQ(map.erase(9), 0U);
  EXPECT_EQ(map.find(9), map.end());
}

TEST(FlatHashMapTest, ManyKeys) {
  flat_hash_map<int, int> map;
  for (int fd = 0; fd < 10000; ++fd) {
    map.emplace(fd, 2 * fd);
  }
  EXPECT_EQ(map.size(), 10000U);
  for (int fd = 0; fd < 10000; fd += 2) {
    map.erase(fd);
  }
  EXPECT_EQ(map.size(), 5000U);
  EXPECT_FALSE(map.contains(4));
  EXPECT_EQ(map.at(5), 10);
}

}  // namespace tern
