#include <catch2/catch_test_macros.hpp>
#include <resumable/http/common/http_response.hpp>

using namespace resumable::http;

TEST_CASE("Response status helpers", "[http_response][unit]") {
    http_response response;

    SECTION("2xx is ok, partial content included") {
        response.set_status(http_response::status::partial_content);
        REQUIRE(response.get_status_code() == 206);
        REQUIRE(response.is_ok());
    }

    SECTION("Redirect statuses") {
        for (uint16_t status : {301, 302, 303, 307, 308}) {
            response.set_status(status);
            REQUIRE(response.is_redirect_response());
        }
        response.set_status(http_response::status::not_modified);
        REQUIRE_FALSE(response.is_redirect_response());
    }

    SECTION("Responses without body") {
        response.set_status(http_response::status::ok);
        REQUIRE(response.has_body(false));
        REQUIRE_FALSE(response.has_body(true));
        response.set_status(http_response::status::no_content);
        REQUIRE_FALSE(response.has_body(false));
        response.set_status(http_response::status::not_modified);
        REQUIRE_FALSE(response.has_body(false));
        response.set_status(uint16_t{100});
        REQUIRE_FALSE(response.has_body(false));
    }

    SECTION("416 is an error") {
        response.set_status(http_response::status::range_not_satisfiable);
        REQUIRE(response.get_status_code() == 416);
        REQUIRE_FALSE(response.is_ok());
    }
}
