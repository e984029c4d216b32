#include <synthevents/event/DescriptorTable.hpp>
#include <synthevents/event/NativeEvent.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace SE;

namespace {

auto constant(std::int64_t value) -> Normalizer {
    return [value](NativeEvent const&) -> FieldValue { return value; };
}

} // namespace

TEST_SUITE("event.descriptor_table") {
    TEST_CASE("Entries keep declaration order") {
        DescriptorTable table{
            {"type", nullptr},
            {"detail", nullptr},
            {"view", nullptr},
        };
        CHECK(table.size() == 3);
        CHECK(table.names() == std::vector<std::string>{"type", "detail", "view"});
        CHECK(table.contains("detail"));
        CHECK_FALSE(table.contains("screenX"));
        CHECK(table.find("screenX") == nullptr);
    }

    TEST_CASE("Rule kinds follow the field name and normalizer") {
        DescriptorTable table{
            {"target", nullptr},
            {"type", nullptr},
            {"timeStamp", constant(5)},
        };
        REQUIRE(table.find("target") != nullptr);
        CHECK(ruleKind(*table.find("target")) == FieldRuleKind::Target);
        CHECK(ruleKind(*table.find("type")) == FieldRuleKind::Copy);
        CHECK(ruleKind(*table.find("timeStamp")) == FieldRuleKind::Normalize);

        CHECK(fieldRuleKindToString(FieldRuleKind::Copy) == "copy");
        CHECK(fieldRuleKindToString(FieldRuleKind::Target) == "target");
        CHECK(fieldRuleKindToString(FieldRuleKind::Normalize) == "normalize");
    }

    TEST_CASE("Repeated names keep the first position and the last rule") {
        DescriptorTable table{
            {"a", nullptr},
            {"b", nullptr},
            {"a", constant(2)},
        };
        CHECK(table.names() == std::vector<std::string>{"a", "b"});
        REQUIRE(table.find("a") != nullptr);
        CHECK(ruleKind(*table.find("a")) == FieldRuleKind::Normalize);
    }

    TEST_CASE("Merge appends derived fields and shadows base rules") {
        DescriptorTable base{
            {"type", nullptr},
            {"detail", constant(1)},
        };
        DescriptorTable derived{
            {"screenX", nullptr},
            {"detail", constant(2)},
        };

        auto merged = DescriptorTable::merge(base, derived);
        CHECK(merged.names() == std::vector<std::string>{"type", "detail", "screenX"});

        auto const* detail = merged.find("detail");
        REQUIRE(detail != nullptr);
        REQUIRE(detail->rule.normalize);
        auto value = detail->rule.normalize(EmptyNativeEvent::instance());
        CHECK(value == FieldValue{std::int64_t{2}});

        SUBCASE("Inputs are left untouched") {
            CHECK(base.size() == 2);
            CHECK(derived.size() == 2);
            auto baseDetail = base.find("detail")->rule.normalize(EmptyNativeEvent::instance());
            CHECK(baseDetail == FieldValue{std::int64_t{1}});
        }
    }

    TEST_CASE("Chained merges resolve to the most derived rule") {
        DescriptorTable root{{"type", nullptr}, {"detail", constant(1)}};
        DescriptorTable middle{{"detail", constant(2)}, {"view", nullptr}};
        DescriptorTable leaf{{"detail", constant(3)}, {"key", nullptr}};

        auto merged = DescriptorTable::merge(DescriptorTable::merge(root, middle), leaf);
        CHECK(merged.names() == std::vector<std::string>{"type", "detail", "view", "key"});
        auto value = merged.find("detail")->rule.normalize(EmptyNativeEvent::instance());
        CHECK(value == FieldValue{std::int64_t{3}});
    }

    TEST_CASE("Merging with an empty table is the identity") {
        DescriptorTable base{{"type", nullptr}, {"target", nullptr}};
        DescriptorTable empty;
        CHECK(DescriptorTable::merge(base, empty).names() == base.names());
        CHECK(DescriptorTable::merge(empty, base).names() == base.names());
    }

    TEST_CASE("Standard interface declares the base fields") {
        auto const& table = StandardEventInterface();
        CHECK(table.names()
              == std::vector<std::string>{"type",
                                          "target",
                                          "currentTarget",
                                          "eventPhase",
                                          "bubbles",
                                          "cancelable",
                                          "timeStamp",
                                          "defaultPrevented",
                                          "isTrusted"});
        CHECK(ruleKind(*table.find("target")) == FieldRuleKind::Target);
        CHECK(ruleKind(*table.find("currentTarget")) == FieldRuleKind::Normalize);

        FieldBagEvent stamped{{"timeStamp", 1234.5}};
        CHECK(table.find("timeStamp")->rule.normalize(stamped) == FieldValue{1234.5});

        FieldBagEvent unstamped;
        auto now = table.find("timeStamp")->rule.normalize(unstamped);
        REQUIRE(asNumber(now).has_value());
        CHECK(*asNumber(now) > 0.0);
    }
}
