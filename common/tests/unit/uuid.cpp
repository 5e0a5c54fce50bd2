#include <conduit/common/uuid.hpp>

#include <set>
#include <thread>

#include <gtest/gtest.h>

using namespace conduit::common;

TEST(UUID, NextIsUnique)
{
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(UUID::next());
  }
  EXPECT_EQ(ids.size(), 1000);

  std::string other;
  std::thread thread{[&other]() { other = UUID::next(); }};
  thread.join();

  EXPECT_EQ(other.length(), 36);
  EXPECT_EQ(ids.count(other), 0);
}
