#include "core/Error.hpp"

#include <doctest/doctest.h>

using namespace STS;

TEST_SUITE("Error") {

TEST_CASE("describeError prefixes the code label") {
    Error error{Error::Code::EmptyHistory, "Nothing to undo"};
    CHECK(describeError(error) == "empty_history:Nothing to undo");
    CHECK(errorMessage(error) == "Nothing to undo");
}

TEST_CASE("errors without a message fall back to the label") {
    Error error{Error::Code::NotFound, ""};
    CHECK(describeError(error) == "not_found");
    CHECK(errorMessage(error) == "not_found");
}

TEST_CASE("every code has a distinct label") {
    CHECK(errorCodeToString(Error::Code::SchemaValidation) == "schema_validation");
    CHECK(errorCodeToString(Error::Code::AssetFetch) == "asset_fetch");
    CHECK(errorCodeToString(Error::Code::DeliveryFailed) == "delivery_failed");
    CHECK(errorCodeToString(Error::Code::InvalidPath) != errorCodeToString(Error::Code::MalformedInput));
}

} // TEST_SUITE
