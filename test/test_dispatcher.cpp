#include "encoder_fixture.hpp"

#include "encoder/dispatcher.hpp"
#include "encoder/scalar_format.hpp"
#include "runtime/error.hpp"
#include "runtime/extension.hpp"

using namespace tomlenc;

struct dispatch : encoder_fixture { };

namespace {
  struct point final : custom_value {
    int x, y;

    point(int x, int y) : x{x}, y{y} { }

    std::string
    to_string() const override { return fmt::format("({}, {})", x, y); }
  };

  struct color final : enum_value {
    using enum_value::enum_value;
  };
}

TEST_F(dispatch, default_registrations) {
  dispatcher const& d = enc.dispatch_table();
  EXPECT_TRUE(d.has_exact(typeid(std::string)));
  EXPECT_TRUE(d.has_exact(typeid(std::int64_t)));
  EXPECT_TRUE(d.has_exact(typeid(date_time)));
  EXPECT_TRUE(d.has_exact(typeid(array)));
  EXPECT_TRUE(d.has_exact(typeid(table)));
  EXPECT_FALSE(d.has_exact(typeid(path_value)));
  EXPECT_EQ(d.capability_count(), 4u);
}

TEST_F(dispatch, scalars) {
  EXPECT_EQ(format("abc"), R"("abc")");
  EXPECT_EQ(format(true), "true");
  EXPECT_EQ(format(7), "7");
  EXPECT_EQ(format(0.25), "0.25");
  EXPECT_EQ(format(decimal{"1e+05"}), "1e+5");
  EXPECT_EQ(format(make_date(1979, 5, 27)), "1979-05-27");
  EXPECT_EQ(format(make_time(7, 32, 0)), "07:32:00");
}

TEST_F(dispatch, lists) {
  EXPECT_EQ(format(make_array()), "[]");
  EXPECT_EQ(format(make_array({1, 2, 3})), "[ 1, 2, 3,]");
  EXPECT_EQ(format(make_array({"a", nullptr, "b"})), R"([ "a", "b",])");
  EXPECT_EQ(format(make_array({make_array({1, 2}), make_array({3})})),
            "[ [ 1, 2,], [ 3,],]");
}

TEST_F(dispatch, tables_inside_lists_are_inline) {
  EXPECT_EQ(format(make_array({make_array({make_table({{"x", 1}})})})),
            "[ [ { x = 1 },],]");
  EXPECT_EQ(format(make_table()), "{}");
  EXPECT_EQ(format(make_table({{"a b", 1}, {"c", make_table({{"d", "e"}})}})),
            R"({ "a b" = 1, c = { d = "e" } })");
}

TEST_F(dispatch, capabilities) {
  EXPECT_EQ(format(std::make_shared<path_value>("/tmp/x")), R"("/tmp/x")");
  EXPECT_EQ(format(std::make_shared<enum_value>("RED", 1)), R"("1")");
  EXPECT_EQ(format(std::make_shared<enum_value>("RED", "red")), R"("red")");
  EXPECT_EQ(format(std::make_shared<ipv4_address>(ipv4_address::parse("10.0.0.1"))),
            R"("10.0.0.1")");
  EXPECT_EQ(format(std::make_shared<value_tuple>(value_tuple{1, "a"})),
            R"([ 1, "a",])");
}

TEST_F(dispatch, capabilities_match_derived_types) {
  EXPECT_EQ(format(std::make_shared<color>("GREEN", 2)), R"("2")");
}

TEST_F(dispatch, unknown_types_fall_back_to_strings) {
  EXPECT_EQ(format(std::make_shared<point>(1, 2)), R"x("(1, 2)")x");
  EXPECT_EQ(format(make_numeric(5)), R"("5")");
}

TEST_F(dispatch, exact_registration_replaces_previous) {
  enc.dispatch_table().add_exact<std::int64_t>([] (format_context&, value const& v) {
    return fmt::format("0x{:x}", *v.get_if<std::int64_t>());
  });

  EXPECT_EQ(format(255), "0xff");
  EXPECT_EQ(format(make_array({16})), "[ 0x10,]");
}

TEST_F(dispatch, exact_type_beats_capability) {
  enc.dispatch_table().add_exact<color>([] (format_context&, value const& v) {
    return format_string(v.as_custom<color>()->name());
  });

  EXPECT_EQ(format(std::make_shared<color>("GREEN", 2)), R"("GREEN")");
  EXPECT_EQ(format(std::make_shared<enum_value>("RED", 1)), R"("1")");
}

TEST_F(dispatch, first_matching_capability_wins) {
  std::size_t before = enc.dispatch_table().capability_count();

  enc.dispatch_table().add_capability<point>([] (format_context&, value const&) {
    return std::string{"first"};
  });
  enc.dispatch_table().add_capability<point>([] (format_context&, value const&) {
    return std::string{"second"};
  });

  EXPECT_EQ(enc.dispatch_table().capability_count(), before + 2);
  EXPECT_EQ(format(std::make_shared<point>(0, 0)), "first");
}

TEST_F(dispatch, later_capability_does_not_shadow_earlier_ones) {
  enc.dispatch_table().add_capability(
    [] (value const& v) { return v.as_custom() != nullptr; },
    [] (format_context&, value const&) { return std::string{"custom"}; }
  );

  EXPECT_EQ(format(std::make_shared<path_value>("p")), R"("p")");
  EXPECT_EQ(format(std::make_shared<point>(0, 0)), "custom");
}

TEST_F(dispatch, formatters_dispatch_nested_values) {
  enc.dispatch_table().add_capability<point>([] (format_context& ctx, value const& v) {
    auto const* p = v.as_custom<point>();
    return ctx.format(make_array({p->x, p->y}));
  });

  EXPECT_EQ(format(std::make_shared<point>(3, 4)), "[ 3, 4,]");
}

TEST_F(dispatch, self_containing_array_is_rejected) {
  auto a = make_array({1});
  a->push_back(a);

  EXPECT_THROW(format(a), structural_error);

  (*a)[1] = nullptr;
}

TEST_F(dispatch, shared_array_is_not_a_cycle) {
  auto shared = make_array({1});
  EXPECT_EQ(format(make_array({shared, shared})), "[ [ 1,], [ 1,],]");
}
