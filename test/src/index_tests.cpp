// identity
#include "dbg/index.hpp"

// application
#include "dbg/error.hpp"
#include "records.hpp"

// stdc++
#include <string>
#include <vector>

// gtest
#include <gtest/gtest.h>

using namespace sof;
using namespace sof::test;

namespace {
std::vector<dbg::compilation_unit> units_of(dbg::compilation_unit cu) {
  std::vector<dbg::compilation_unit> units;
  units.push_back(std::move(cu));
  return units;
}

template <typename F> std::error_code error_of(F &&f) {
  try {
    f();
  } catch (const dbg::exception &e) {
    return e.code();
  }
  return {};
}
} // namespace

TEST(DebugInfoIndexTest, ResolvesStructByName) {
  dbg::debug_info_index index(units_of(point_unit()));
  const auto &record = index.resolve_struct("Point");
  ASSERT_TRUE(record.name.has_value());
  EXPECT_EQ(*record.name, "Point");
  EXPECT_EQ(record.offset, 0x2d);
}

TEST(DebugInfoIndexTest, MembersInDeclarationOrder) {
  dbg::debug_info_index index(units_of(point_unit()));
  auto members = dbg::members(index.resolve_struct("Point")).collect();
  std::vector<dbg::member_offset> expected{{"x", 0}, {"y", 4}};
  EXPECT_EQ(members, expected);
}

TEST(DebugInfoIndexTest, TypedefResolvesToSameStruct) {
  dbg::debug_info_index index(units_of(point_unit()));
  const auto &direct = index.resolve_struct("Point");
  const auto &aliased = index.resolve_struct("Point_t");
  EXPECT_EQ(&direct, &aliased);
  EXPECT_EQ(dbg::members(aliased).collect(), dbg::members(direct).collect());
}

TEST(DebugInfoIndexTest, TypedefOffsetIsRelativeToItsUnit) {
  std::vector<dbg::compilation_unit> units;
  units.push_back(point_unit(0));
  // second unit starts at 0x100, its typedef refers to 0x2d inside it
  std::vector<dbg::struct_record> structs;
  structs.push_back(make_struct(0x12d, "Other", {member("a", 0)}));
  std::vector<dbg::typedef_record> typedefs;
  typedefs.push_back(make_typedef(0x150, 0x100, "Other_t", 0x2d));
  units.emplace_back(0x100, "other.c", std::move(structs), std::move(typedefs));

  dbg::debug_info_index index(std::move(units));
  const auto &record = index.resolve_struct("Other_t");
  ASSERT_TRUE(record.name.has_value());
  EXPECT_EQ(*record.name, "Other");
}

TEST(DebugInfoIndexTest, StructNameShadowsTypedef) {
  std::vector<dbg::struct_record> structs;
  structs.push_back(make_struct(0x2d, "X", {member("direct", 0)}));
  structs.push_back(make_struct(0x40, "Y", {member("aliased", 0)}));
  std::vector<dbg::typedef_record> typedefs;
  typedefs.push_back(make_typedef(0x60, 0, "X", 0x40));
  dbg::debug_info_index index(
      units_of({0, "x.c", std::move(structs), std::move(typedefs)}));

  auto members = dbg::members(index.resolve_struct("X")).collect();
  ASSERT_EQ(members.size(), 1);
  EXPECT_EQ(members[0].name, "direct");
}

TEST(DebugInfoIndexTest, UnknownNameIsStructNotFound) {
  dbg::debug_info_index index(units_of(point_unit()));
  EXPECT_EQ(error_of([&] { index.resolve_struct("Missing"); }),
            dbg::errc::struct_not_found);
  EXPECT_EQ(error_of([&] { index.resolve_struct(""); }),
            dbg::errc::struct_not_found);
}

TEST(DebugInfoIndexTest, TypedefOfPrimitiveIsStructNotFound) {
  std::vector<dbg::typedef_record> typedefs;
  // 0x30 would be a DW_TAG_base_type, which is never indexed
  typedefs.push_back(make_typedef(0x40, 0, "Scalar", 0x30));
  dbg::debug_info_index index(units_of({0, "s.c", {}, std::move(typedefs)}));
  EXPECT_EQ(error_of([&] { index.resolve_struct("Scalar"); }),
            dbg::errc::struct_not_found);
}

TEST(DebugInfoIndexTest, TypedefOfVoidIsStructNotFound) {
  std::vector<dbg::typedef_record> typedefs;
  typedefs.push_back(make_typedef(0x40, 0, "Nothing", std::nullopt));
  dbg::debug_info_index index(units_of({0, "v.c", {}, std::move(typedefs)}));
  EXPECT_EQ(error_of([&] { index.resolve_struct("Nothing"); }),
            dbg::errc::struct_not_found);
}

TEST(DebugInfoIndexTest, TwoLevelTypedefChainIsNotFollowed) {
  auto cu = point_unit();
  // typedef Point_t Point_tt;
  cu.typedefs.push_back(make_typedef(0x60, 0, "Point_tt", 0x50));
  dbg::debug_info_index index(units_of(std::move(cu)));
  EXPECT_EQ(error_of([&] { index.resolve_struct("Point_tt"); }),
            dbg::errc::struct_not_found);
}

TEST(DebugInfoIndexTest, AnonymousStructReachableThroughTypedef) {
  std::vector<dbg::struct_record> structs;
  structs.push_back(
      make_struct(0x2d, std::nullopt, {member("a", 0), member("b", 8)}, 16));
  std::vector<dbg::typedef_record> typedefs;
  typedefs.push_back(make_typedef(0x50, 0, "Anon_t", 0x2d));
  dbg::debug_info_index index(
      units_of({0, "a.c", std::move(structs), std::move(typedefs)}));

  EXPECT_EQ(index.struct_count(), 1);
  EXPECT_EQ(index.named_struct_count(), 0);
  auto members = dbg::members(index.resolve_struct("Anon_t")).collect();
  std::vector<dbg::member_offset> expected{{"a", 0}, {"b", 8}};
  EXPECT_EQ(members, expected);
}

TEST(DebugInfoIndexTest, LastUnitWinsOnDuplicateNames) {
  std::vector<dbg::compilation_unit> units;
  units.push_back(point_unit(0));
  std::vector<dbg::struct_record> structs;
  structs.push_back(make_struct(0x12d, "Point", {member("z", 0)}));
  units.emplace_back(0x100, "later.c", std::move(structs),
                     std::vector<dbg::typedef_record>{});

  dbg::debug_info_index index(std::move(units));
  EXPECT_EQ(index.resolve_struct("Point").offset, 0x12d);
  EXPECT_EQ(index.named_struct_count(), 1);
  EXPECT_EQ(index.struct_count(), 2);
  // the typedef still points into the first unit
  EXPECT_EQ(index.resolve_struct("Point_t").offset, 0x2d);
}

TEST(MemberRangeTest, MissingOffsetFailsWithoutPartialList) {
  auto record = make_struct(
      0x2d, "Broken",
      {member("ok", 0), {DW_TAG_member, std::string("bad"), std::nullopt}});
  std::vector<dbg::member_offset> members;
  EXPECT_EQ(error_of([&] { members = dbg::members(record).collect(); }),
            dbg::errc::missing_member_offset);
  EXPECT_TRUE(members.empty());
}

TEST(MemberRangeTest, MissingNameFails) {
  auto record = make_struct(
      0x2d, "Unnamed",
      {{DW_TAG_member, std::nullopt, dbg::member_location{uint64_t{0}}}});
  EXPECT_EQ(error_of([&] { dbg::members(record).collect(); }),
            dbg::errc::missing_member_name);
}

TEST(MemberRangeTest, NonMemberChildFails) {
  auto record = make_struct(
      0x2d, "Tagged",
      {member("kind", 0), {DW_TAG_union_type, std::nullopt, std::nullopt}});
  try {
    dbg::members(record).collect();
    FAIL() << "expected an exception";
  } catch (const dbg::exception &e) {
    EXPECT_EQ(e.code(), dbg::errc::unexpected_child_kind);
    EXPECT_NE(std::string(e.what()).find("DW_TAG_union_type"),
              std::string::npos);
  }
}

TEST(MemberRangeTest, UnnamedTagKeepsItsValue) {
  auto record = make_struct(0x2d, "Vendor", {{0x4107, std::nullopt, std::nullopt}});
  try {
    dbg::members(record).collect();
    FAIL() << "expected an exception";
  } catch (const dbg::exception &e) {
    EXPECT_EQ(e.code(), dbg::errc::unexpected_child_kind);
    EXPECT_NE(std::string(e.what()).find("DW_TAG_<0x4107>"), std::string::npos);
  }
  EXPECT_EQ(dbg::tag_name(DW_TAG_member), "DW_TAG_member");
}

TEST(MemberRangeTest, UnsupportedLocationFails) {
  auto record = make_struct(
      0x2d, "Weird",
      {{DW_TAG_member, std::string("m"),
        dbg::member_location{dbg::unsupported_location{DW_FORM_exprloc}}}});
  EXPECT_EQ(error_of([&] { dbg::members(record).collect(); }),
            dbg::errc::unsupported_member_location);
}

TEST(MemberRangeTest, IsLazyAndRestartable) {
  auto record = make_struct(
      0x2d, "Mixed",
      {member("first", 0), {DW_TAG_subprogram, std::string("f"), std::nullopt}});
  auto range = dbg::members(record);
  for (int pass = 0; pass < 2; pass++) {
    auto it = range.begin();
    ASSERT_NE(it, range.end());
    EXPECT_EQ(*it, (dbg::member_offset{"first", 0}));
    ++it;
    ASSERT_NE(it, range.end());
    EXPECT_THROW(*it, dbg::exception);
    ++it;
    EXPECT_EQ(it, range.end());
  }
}

TEST(MemberRangeTest, EmptyStructHasNoMembers) {
  auto record = make_struct(0x2d, "Empty", {});
  EXPECT_TRUE(dbg::members(record).collect().empty());
}

TEST(ErrorTest, CodesMapToConditions) {
  std::error_code custom = dbg::errc::no_debug_info;
  EXPECT_EQ(custom, dbg::error_cause::custom_error);
  EXPECT_NE(custom, dbg::error_cause::dwarf_error);

  std::error_code malformed(1, dbg::dwarf_category());
  EXPECT_EQ(malformed, dbg::error_cause::dwarf_error);
  std::error_code dwfl(1, dbg::dwfl_category());
  EXPECT_EQ(dwfl, dbg::error_cause::dwarf_error);
  std::error_code elf(1, dbg::elf_category());
  EXPECT_EQ(elf, dbg::error_cause::elf_error);
}
