#include <synthevents/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace SE;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::CapacityExceeded);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::TypeMismatch, "wrong pool"};
        CHECK(describeError(withMsg) == "type_mismatch:wrong pool");

        Error withoutMsg{Error::Code::NotSupported, {}};
        CHECK(describeError(withoutMsg) == "not_supported");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either a value or an error") {
        Expected<int> ok = 7;
        REQUIRE(ok.has_value());
        CHECK(*ok == 7);

        Expected<int> failed = std::unexpected(Error{Error::Code::MalformedInput, "bad json"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::MalformedInput);
        REQUIRE(failed.error().message.has_value());
        CHECK(*failed.error().message == "bad json");
    }
}
