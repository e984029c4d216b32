#include <synthevents/event/FieldValue.hpp>
#include <synthevents/event/NativeEvent.hpp>

#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace SE;

TEST_SUITE("event.native") {
    TEST_CASE("Field value predicates") {
        CHECK(isUndefined(FieldValue{}));
        CHECK(isNullish(FieldValue{}));
        CHECK(isNullish(FieldValue{nullptr}));
        CHECK_FALSE(isNullish(FieldValue{false}));

        CHECK_FALSE(isTruthy(FieldValue{}));
        CHECK_FALSE(isTruthy(FieldValue{nullptr}));
        CHECK_FALSE(isTruthy(FieldValue{std::int64_t{0}}));
        CHECK_FALSE(isTruthy(FieldValue{0.0}));
        CHECK_FALSE(isTruthy(FieldValue{std::numeric_limits<double>::quiet_NaN()}));
        CHECK_FALSE(isTruthy(FieldValue{std::string{}}));
        CHECK(isTruthy(FieldValue{std::string{"x"}}));
        CHECK(isTruthy(FieldValue{TargetRef{""}}));
        CHECK(isTruthy(FieldValue{std::int64_t{-1}}));

        CHECK(asNumber(FieldValue{std::int64_t{4}}) == std::optional<double>{4.0});
        CHECK(asNumber(FieldValue{2.5}) == std::optional<double>{2.5});
        CHECK_FALSE(asNumber(FieldValue{std::string{"4"}}).has_value());

        CHECK(kindOf(FieldValue{TargetRef{"/a"}}) == FieldKind::Target);
        CHECK(fieldKindToString(kindOf(FieldValue{nullptr})) == "null");
        CHECK(fieldKindToString(kindOf(FieldValue{})) == "undefined");
    }

    TEST_CASE("Empty native event has no fields and no mechanisms") {
        auto const& empty = EmptyNativeEvent::instance();
        CHECK(isUndefined(empty.field("type")));
        CHECK_FALSE(empty.hasPreventDefault());
        CHECK_FALSE(empty.hasStopPropagation());
    }

    TEST_CASE("Field bag reads, writes and erases fields") {
        FieldBagEvent bag{{"type", std::string{"click"}}, {"button", std::int64_t{0}}};
        CHECK(bag.size() == 2);
        CHECK(bag.field("type") == FieldValue{std::string{"click"}});
        CHECK(isUndefined(bag.field("missing")));

        bag.setField("button", std::int64_t{2});
        CHECK(bag.field("button") == FieldValue{std::int64_t{2}});

        bag.eraseField("button");
        CHECK_FALSE(bag.contains("button"));
        CHECK(isUndefined(bag.field("button")));
    }

    TEST_CASE("Field bag hooks enable the native mechanisms") {
        FieldBagEvent bag;
        CHECK_FALSE(bag.hasPreventDefault());
        CHECK_FALSE(bag.hasStopPropagation());

        bag.onPreventDefault([](FieldBagEvent& self) { self.setField("defaultPrevented", true); })
            .onStopPropagation([](FieldBagEvent& self) { self.setField("stopped", true); });
        CHECK(bag.hasPreventDefault());
        CHECK(bag.hasStopPropagation());

        bag.preventDefault();
        bag.stopPropagation();
        CHECK(bag.field("defaultPrevented") == FieldValue{true});
        CHECK(bag.field("stopped") == FieldValue{true});
    }
}
