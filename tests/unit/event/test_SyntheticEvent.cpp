#include <synthevents/event/EventClass.hpp>
#include <synthevents/event/NativeEvent.hpp>
#include <synthevents/event/SyntheticEvent.hpp>

#include <doctest/doctest.h>

#include <string>

using namespace SE;

namespace {

auto makeBase(NormalizationOptions options = {}) -> std::shared_ptr<EventClass> {
    return EventClass::Create("SyntheticEvent", StandardEventInterface(), options);
}

DispatchConfig const kClick{.registration_name = "onClick"};

} // namespace

TEST_SUITE("event.synthetic_event") {
    TEST_CASE("Construction copies interface fields from the native event") {
        auto base = makeBase();
        FieldBagEvent native{{"type", std::string{"click"}},
                             {"bubbles", true},
                             {"cancelable", true},
                             {"eventPhase", std::int64_t{2}},
                             {"timeStamp", 42.0}};

        auto event = base->acquire(&kClick, TargetRef{"/ui/button"}, &native);
        REQUIRE(event);
        CHECK(event->eventClass() == base);
        CHECK(event->dispatchConfig() == &kClick);
        REQUIRE(event->targetInst().has_value());
        CHECK(event->targetInst()->path == "/ui/button");
        CHECK(event->nativeEvent() == &native);

        CHECK(event->fieldAs<std::string>("type") == std::optional<std::string>{"click"});
        CHECK(event->fieldAs<bool>("bubbles") == std::optional<bool>{true});
        CHECK(event->fieldAs<std::int64_t>("eventPhase") == std::optional<std::int64_t>{2});
        CHECK(event->fieldAs<double>("timeStamp") == std::optional<double>{42.0});
        CHECK(std::holds_alternative<std::nullptr_t>(event->field("currentTarget")));
    }

    TEST_CASE("Fields missing on the native event read as undefined") {
        auto          base = makeBase();
        FieldBagEvent native{{"type", std::string{"focus"}}};

        auto event = base->acquire(&kClick, std::nullopt, &native);
        CHECK(event->hasField("eventPhase"));
        CHECK(isUndefined(event->field("eventPhase")));
        CHECK(isUndefined(event->field("isTrusted")));
        CHECK_FALSE(event->hasField("notDeclared"));
        CHECK(isUndefined(event->field("notDeclared")));
    }

    TEST_CASE("Target field binds to the explicit native event target") {
        auto          base = makeBase();
        FieldBagEvent native{{"type", std::string{"click"}}, {"target", std::string{"ignored"}}};

        SUBCASE("With a target") {
            auto event = base->acquire(&kClick, std::nullopt, &native, TargetRef{"/ui/label"});
            CHECK(event->field("target") == FieldValue{TargetRef{"/ui/label"}});
        }
        SUBCASE("Without a target") {
            auto event = base->acquire(&kClick, std::nullopt, &native);
            CHECK(std::holds_alternative<std::nullptr_t>(event->field("target")));
        }
    }

    TEST_CASE("Native defaultPrevented decides the initial prevented state") {
        auto base = makeBase();

        SUBCASE("true") {
            FieldBagEvent native{{"defaultPrevented", true}};
            auto          event = base->acquire(&kClick, std::nullopt, &native);
            CHECK(event->isDefaultPrevented());
        }
        SUBCASE("false wins over a legacy returnValue") {
            FieldBagEvent native{{"defaultPrevented", false}, {"returnValue", false}};
            auto          event = base->acquire(&kClick, std::nullopt, &native);
            CHECK_FALSE(event->isDefaultPrevented());
        }
        SUBCASE("absent") {
            FieldBagEvent native{{"type", std::string{"click"}}};
            auto          event = base->acquire(&kClick, std::nullopt, &native);
            CHECK_FALSE(event->isDefaultPrevented());
        }
    }

    TEST_CASE("Legacy returnValue counts as prevented only when enabled") {
        FieldBagEvent native{{"returnValue", false}};

        SUBCASE("Fallback on") {
            auto base  = makeBase();
            auto event = base->acquire(&kClick, std::nullopt, &native);
            CHECK(event->isDefaultPrevented());
        }
        SUBCASE("Fallback off") {
            auto base  = makeBase(NormalizationOptions{.legacy_return_value_fallback = false});
            auto event = base->acquire(&kClick, std::nullopt, &native);
            CHECK_FALSE(event->isDefaultPrevented());
        }
        SUBCASE("returnValue true") {
            FieldBagEvent allowed{{"returnValue", true}};
            auto          base  = makeBase();
            auto          event = base->acquire(&kClick, std::nullopt, &allowed);
            CHECK_FALSE(event->isDefaultPrevented());
        }
    }

    TEST_CASE("preventDefault uses the native mechanism when present") {
        auto          base  = makeBase();
        int           calls = 0;
        FieldBagEvent native{{"type", std::string{"submit"}}};
        native.onPreventDefault([&](FieldBagEvent&) { ++calls; });

        auto event = base->acquire(&kClick, std::nullopt, &native);
        event->preventDefault();
        CHECK(event->isDefaultPrevented());
        CHECK(event->fieldAs<bool>("defaultPrevented") == std::optional<bool>{true});
        CHECK(calls == 1);
        CHECK_FALSE(native.contains("returnValue"));

        event->preventDefault();
        CHECK(event->isDefaultPrevented());
    }

    TEST_CASE("preventDefault falls back to returnValue on legacy events") {
        auto          base = makeBase();
        FieldBagEvent native{{"type", std::string{"submit"}}};

        auto event = base->acquire(&kClick, std::nullopt, &native);
        event->preventDefault();
        CHECK(event->isDefaultPrevented());
        CHECK(native.field("returnValue") == FieldValue{false});
    }

    TEST_CASE("stopPropagation uses the native mechanism or cancelBubble") {
        auto base = makeBase();

        SUBCASE("native mechanism") {
            int           calls = 0;
            FieldBagEvent native;
            native.onStopPropagation([&](FieldBagEvent&) { ++calls; });
            auto event = base->acquire(&kClick, std::nullopt, &native);
            event->stopPropagation();
            CHECK(event->isPropagationStopped());
            CHECK(calls == 1);
            CHECK_FALSE(native.contains("cancelBubble"));
        }
        SUBCASE("legacy fallback") {
            FieldBagEvent native;
            auto          event = base->acquire(&kClick, std::nullopt, &native);
            event->stopPropagation();
            CHECK(event->isPropagationStopped());
            CHECK(native.field("cancelBubble") == FieldValue{true});
        }
    }

    TEST_CASE("Events without a native event normalize against an empty one") {
        auto base  = makeBase();
        auto event = base->acquire(&kClick, std::nullopt, nullptr);
        REQUIRE(event);
        CHECK(event->nativeEvent() == nullptr);
        CHECK(isUndefined(event->field("type")));
        CHECK_FALSE(event->isDefaultPrevented());
        REQUIRE(asNumber(event->field("timeStamp")).has_value());

        event->preventDefault();
        event->stopPropagation();
        CHECK(event->isDefaultPrevented());
        CHECK(event->isPropagationStopped());
    }

    TEST_CASE("Repeated mutators without a native event are idempotent") {
        auto base  = makeBase();
        auto event = base->acquire(&kClick, TargetRef{"/ui/canvas"}, nullptr);

        event->preventDefault();
        event->preventDefault();
        CHECK(event->isDefaultPrevented());
        CHECK(event->field("defaultPrevented") == FieldValue{true});
        CHECK(event->nativeEvent() == nullptr);
        CHECK_FALSE(event->isPropagationStopped());

        event->stopPropagation();
        event->stopPropagation();
        CHECK(event->isPropagationStopped());
        CHECK(event->isDefaultPrevented());
        CHECK(event->targetInst()->path == "/ui/canvas");
    }

    TEST_CASE("persist marks the event as kept") {
        auto base  = makeBase();
        auto event = base->acquire(&kClick, std::nullopt, nullptr);
        CHECK_FALSE(event->isPersistent());
        event->persist();
        CHECK(event->isPersistent());
    }

    TEST_CASE("reset nulls every field and drops borrowed references") {
        auto          base = makeBase();
        FieldBagEvent native{{"type", std::string{"click"}}};
        auto          event = base->acquire(&kClick, TargetRef{"/a"}, &native);
        event->setField("extra", std::int64_t{3});
        event->preventDefault();
        event->persist();

        event->reset();
        CHECK(event->eventClass() == base);
        CHECK(event->dispatchConfig() == nullptr);
        CHECK(event->nativeEvent() == nullptr);
        CHECK_FALSE(event->targetInst().has_value());
        CHECK_FALSE(event->isDefaultPrevented());
        CHECK_FALSE(event->isPersistent());
        CHECK(std::holds_alternative<std::nullptr_t>(event->field("type")));
        CHECK(std::holds_alternative<std::nullptr_t>(event->field("extra")));
    }

    TEST_CASE("Normalizers may compute fields the native event lacks") {
        auto base   = makeBase();
        auto custom = base->extend("CustomEvent",
                                   DescriptorTable{
                                       {"doubled",
                                        [](NativeEvent const& native) -> FieldValue {
                                            auto value = asNumber(native.field("value"));
                                            return value ? FieldValue{*value * 2.0} : FieldValue{nullptr};
                                        }},
                                   });
        FieldBagEvent native{{"value", 21.0}};
        auto          event = custom->acquire(&kClick, std::nullopt, &native);
        CHECK(event->fieldAs<double>("doubled") == std::optional<double>{42.0});
        CHECK(event->hasField("type"));
    }
}
