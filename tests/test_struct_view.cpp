#include <vector>

#include <flatdata/struct_view.hpp>

#include "coappearances.hpp"

#include <gtest/gtest.h>

using namespace coappearances;

namespace {

struct Signed {
  static constexpr std::string_view NAME = "Signed";
  static constexpr size_t sizeInBytes = 3;
  static constexpr flatdata::Field<int16_t> delta{"delta", 0, 13};
  static constexpr flatdata::Field<bool> flag{"flag", 13, 1};
  static constexpr flatdata::Field<int8_t> small{"small", 14, 5};
};

} // namespace

TEST(StructViewTest, SetAndGetFields) {
  std::vector<uint8_t> buffer(Coappearance::sizeInBytes * 2 + flatdata::PADDING_SIZE, 0);

  flatdata::ViewMut<Coappearance> second(buffer, Coappearance::sizeInBytes);
  second.set(Coappearance::a_ref, 1);
  second.set(Coappearance::b_ref, 2);
  second.set(Coappearance::count, 3);
  second.set(Coappearance::first_chapter_ref, 0xFFFF);

  flatdata::View<Coappearance> view(buffer, Coappearance::sizeInBytes);
  EXPECT_EQ(view.get(Coappearance::a_ref), 1u);
  EXPECT_EQ(view.get(Coappearance::b_ref), 2u);
  EXPECT_EQ(view.get(Coappearance::count), 3u);
  EXPECT_EQ(view.get(Coappearance::first_chapter_ref), 0xFFFFu);

  // First record untouched
  for (size_t i = 0; i < Coappearance::sizeInBytes; ++i) {
    EXPECT_EQ(buffer[i], 0) << "byte " << i;
  }
}

TEST(StructViewTest, SignedAndBoolFields) {
  flatdata::StructBuffer<Signed> record;
  auto view = record.mut();
  view.set(Signed::delta, -4096);
  view.set(Signed::flag, true);
  view.set(Signed::small, -16);

  auto read = record.view();
  EXPECT_EQ(read.get(Signed::delta), -4096);
  EXPECT_TRUE(read.get(Signed::flag));
  EXPECT_EQ(read.get(Signed::small), -16);

  view.set(Signed::small, 15);
  EXPECT_EQ(read.get(Signed::small), 15);
  EXPECT_EQ(read.get(Signed::delta), -4096);
  EXPECT_EQ(record.bytes().size(), Signed::sizeInBytes);
}

TEST(StructViewTest, ReflectionTableAccess) {
  flatdata::StructLayout layout("Signed", 3,
                                {{"delta", 0, 13, true}, {"flag", 13, 1, false},
                                 {"small", 14, 5, true}});
  ASSERT_NE(layout.find("small"), nullptr);
  EXPECT_EQ(layout.find("missing"), nullptr);

  flatdata::StructBuffer<Signed> record;
  auto view = record.mut();
  view.set(*layout.find("delta"), static_cast<uint64_t>(int64_t{-2}));
  view.set(*layout.find("flag"), 1);

  EXPECT_EQ(record.view().get(Signed::delta), -2);
  EXPECT_TRUE(record.view().get(Signed::flag));
  EXPECT_EQ(static_cast<int64_t>(record.view().get(*layout.find("delta"))), -2);
}

// A view may not extend past the end of its buffer
TEST(StructViewTest, BoundsCheckedConstruction) {
  std::vector<uint8_t> buffer(10, 0);
  EXPECT_NO_THROW(flatdata::StructView(buffer, 2, 8));
  EXPECT_THROW(flatdata::StructView(buffer, 3, 8), std::out_of_range);
  EXPECT_THROW(flatdata::StructView(buffer, 11, 0), std::out_of_range);
  EXPECT_THROW(flatdata::ViewMut<Coappearance>(buffer, 4), std::out_of_range);
}

// Views compare by backing buffer and position, not by content
TEST(StructViewTest, IdentityEquality) {
  std::vector<uint8_t> first(16, 0);
  std::vector<uint8_t> second(16, 0);

  EXPECT_EQ(flatdata::StructView(first, 4, 4), flatdata::StructView(first, 4, 4));
  EXPECT_NE(flatdata::StructView(first, 4, 4), flatdata::StructView(first, 8, 4));
  EXPECT_NE(flatdata::StructView(first, 4, 4), flatdata::StructView(second, 4, 4));
}

TEST(StructViewTest, MutableToConst) {
  flatdata::StructBuffer<Chapter> chapter;
  auto view = chapter.mut();
  view.set(Chapter::major, 1);
  view.set(Chapter::minor, 2);

  EXPECT_EQ(view.asConst().get(Chapter::minor), 2);
  EXPECT_EQ(view.bytes()[0], 0x21);
  EXPECT_EQ(view.bytes()[1], 0x00);
}
