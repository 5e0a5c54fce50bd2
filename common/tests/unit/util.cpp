#include <conduit/common/exceptions.hpp>
#include <conduit/common/util.hpp>

#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

using namespace conduit::common;

struct Section {

  int value;

  void load(cereal::JSONInputArchive& archive)
  {
    archive(cereal::make_nvp("value", value));
  }

  void set_defaults()
  {
    value = 42;
  }
};

std::exception_ptr make_chain()
{
  try {
    try {
      try {
        throw std::invalid_argument{"innermost"};
      } catch (...) {
        std::throw_with_nested(std::runtime_error{"middle"});
      }
    } catch (...) {
      std::throw_with_nested(ConduitException{"outermost"});
    }
  } catch (...) {
    return std::current_exception();
  }
  return nullptr;
}

TEST(Util, CauseChain)
{
  auto chain = util::cause_chain(make_chain());
  ASSERT_EQ(chain.size(), 3);

  EXPECT_EQ(util::describe(chain[0]), "outermost");
  EXPECT_EQ(util::describe(chain[1]), "middle");
  EXPECT_EQ(util::describe(chain[2]), "innermost");

  auto single = util::cause_chain(std::make_exception_ptr(std::logic_error{"alone"}));
  ASSERT_EQ(single.size(), 1);
  EXPECT_EQ(util::describe(single[0]), "alone");

  EXPECT_TRUE(util::cause_chain(nullptr).empty());
}

TEST(Util, Describe)
{
  EXPECT_EQ(util::describe(nullptr), "<none>");
  EXPECT_EQ(util::describe(std::make_exception_ptr(42)), "<non-standard exception>");
}

TEST(Util, Timeout)
{
  EXPECT_FALSE(util::to_timeout(-1).has_value());
  ASSERT_TRUE(util::to_timeout(0).has_value());
  EXPECT_EQ(util::to_timeout(0).value().count(), 0);
  EXPECT_EQ(util::to_timeout(150).value(), std::chrono::milliseconds{150});
}

TEST(Util, LoadOptional)
{
  {
    std::stringstream stream{R"({"section": {"value": 7}, "number": 3})"};
    cereal::JSONInputArchive archive{stream};

    Section section;
    util::cereal_load_optional(archive, "section", section);
    EXPECT_EQ(section.value, 7);

    int number = 0;
    EXPECT_TRUE(util::cereal_load_value(archive, "number", number));
    EXPECT_EQ(number, 3);
  }

  {
    std::stringstream stream{R"({"other": 1})"};
    cereal::JSONInputArchive archive{stream};

    Section section{0};
    util::cereal_load_optional(archive, "section", section);
    EXPECT_EQ(section.value, 42);

    int number = 5;
    EXPECT_FALSE(util::cereal_load_value(archive, "number", number));
    EXPECT_EQ(number, 5);
  }
}
