#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <optional>
#include <set>
#include <string>

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace

TEST_SUITE("log.tagged_logger") {
    TEST_CASE("Tag lists parse comma separated names") {
        CHECK(SE::TaggedLogger::parseTagList("EventPool, Dispatch,,Batching ")
              == std::set<std::string>{"EventPool", "Dispatch", "Batching"});
        CHECK(SE::TaggedLogger::parseTagList("").empty());
        CHECK(SE::TaggedLogger::parseTagList(" , ").empty());
    }

    TEST_CASE("Skip tags mute pool traffic unless tags are enabled explicitly") {
        SE::TaggedLogger log;
        log.setEnabledTags({});
        log.setSkipTags({"EventPool", "Dispatch"});

        CHECK(log.accepts({"EventClass"}));
        CHECK_FALSE(log.accepts({"EventPool"}));
        CHECK_FALSE(log.accepts({"Dispatch", "ERROR"}));

        log.setEnabledTags({"EventPool"});
        CHECK(log.accepts({"EventPool"}));
        CHECK_FALSE(log.accepts({"Batching"}));
        CHECK_FALSE(log.accepts({"EventPool", "ERROR"}));

        log.setEnabledTags({});
        CHECK_FALSE(log.accepts({"EventPool"}));
    }

    TEST_CASE("Environment filters") {
        SUBCASE("Unset variables keep the default skip list") {
            EnvGuard tags{"SYNTHEVENTS_LOG_TAGS", nullptr};
            EnvGuard skip{"SYNTHEVENTS_LOG_SKIP", nullptr};

            SE::TaggedLogger log;
            CHECK_FALSE(log.accepts({"EventPool"}));
            CHECK_FALSE(log.accepts({"Dispatch"}));
            CHECK(log.accepts({"Batching", "ERROR"}));
        }
        SUBCASE("SYNTHEVENTS_LOG_TAGS restricts output to the listed tags") {
            EnvGuard tags{"SYNTHEVENTS_LOG_TAGS", "Batching, Config"};
            EnvGuard skip{"SYNTHEVENTS_LOG_SKIP", nullptr};

            SE::TaggedLogger log;
            CHECK(log.accepts({"Batching"}));
            CHECK(log.accepts({"Config", "Batching"}));
            CHECK_FALSE(log.accepts({"EventClass"}));
            CHECK_FALSE(log.accepts({"Config", "ERROR"}));
        }
        SUBCASE("SYNTHEVENTS_LOG_SKIP replaces the skip list") {
            EnvGuard tags{"SYNTHEVENTS_LOG_TAGS", nullptr};
            EnvGuard skip{"SYNTHEVENTS_LOG_SKIP", "EventClass"};

            SE::TaggedLogger log;
            CHECK(log.accepts({"EventPool"}));
            CHECK(log.accepts({"Dispatch"}));
            CHECK_FALSE(log.accepts({"EventClass"}));
        }
        SUBCASE("Reapplying picks up later changes") {
            EnvGuard         tags{"SYNTHEVENTS_LOG_TAGS", nullptr};
            EnvGuard         skip{"SYNTHEVENTS_LOG_SKIP", nullptr};
            SE::TaggedLogger log;
            CHECK_FALSE(log.accepts({"EventPool"}));

            EnvGuard clearSkip{"SYNTHEVENTS_LOG_SKIP", ""};
            log.applyEnvironmentFilters();
            CHECK(log.accepts({"EventPool"}));
            CHECK(log.accepts({"Dispatch"}));
        }
    }
}
