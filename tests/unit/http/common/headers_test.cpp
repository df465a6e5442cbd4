#include <catch2/catch_test_macros.hpp>
#include <resumable/http/common/headers.hpp>

using namespace resumable::http;

TEST_CASE("Headers storage and lookup", "[headers][unit]") {
    headers h;

    SECTION("Lookup is case-insensitive") {
        h.add_header("Content-Type", "application/octet-stream");
        REQUIRE(h.has_header("content-type"));
        REQUIRE(h.get_header("CONTENT-TYPE") == "application/octet-stream");
    }

    SECTION("Missing header returns an empty value") {
        REQUIRE_FALSE(h.has_header("Range"));
        REQUIRE(h.get_header("Range").empty());
    }

    SECTION("set_header replaces an existing value") {
        h.add_header("Range", "bytes=0-");
        h.set_header("range", "bytes=10-");
        REQUIRE(h.get_headers().size() == 1);
        REQUIRE(h.get_header("Range") == "bytes=10-");
    }

    SECTION("Repeated headers are all kept") {
        h.add_header("Accept-Ranges", "none");
        h.add_header("Accept-Ranges", "bytes");
        auto values = h.get_headers_with_key("accept-ranges");
        REQUIRE(values.size() == 2);
        REQUIRE(values[1] == "bytes");
    }

    SECTION("remove_header") {
        h.add_header("Authorization", "Bearer x");
        REQUIRE(h.remove_header("authorization"));
        REQUIRE_FALSE(h.remove_header("authorization"));
        REQUIRE(h.empty_headers());
    }
}

TEST_CASE("Headers framing information", "[headers][unit]") {
    headers h;

    SECTION("Content-Length") {
        h.process_header("Content-Length", " 5000000000 ");
        REQUIRE(h.has_content_length());
        REQUIRE(h.get_content_length() == 5000000000ULL);
    }

    SECTION("Invalid Content-Length is ignored") {
        h.process_header("Content-Length", "12abc");
        REQUIRE_FALSE(h.has_content_length());
    }

    SECTION("Chunked transfer coding") {
        h.process_header("Transfer-Encoding", "gzip, chunked");
        REQUIRE(h.is_chunked());
    }

    SECTION("Chunked must be the last coding") {
        h.process_header("Transfer-Encoding", "chunked, gzip");
        REQUIRE_FALSE(h.is_chunked());
    }
}

TEST_CASE("Headers keep-alive", "[headers][unit]") {
    headers h;

    SECTION("HTTP/1.1 defaults to keep-alive") {
        REQUIRE(h.keep_alive());
    }

    SECTION("HTTP/1.0 defaults to close") {
        h.set_http_version_minor(0);
        REQUIRE_FALSE(h.keep_alive());
    }

    SECTION("Connection: close") {
        h.process_header("Connection", "close");
        REQUIRE_FALSE(h.keep_alive());
    }

    SECTION("Connection: keep-alive on HTTP/1.0") {
        h.set_http_version_minor(0);
        h.process_header("Connection", "Keep-Alive");
        REQUIRE(h.keep_alive());
    }

    SECTION("set_keep_alive writes the Connection header") {
        h.set_keep_alive(false);
        REQUIRE(h.get_header("Connection") == "Close");
        REQUIRE_FALSE(h.keep_alive());
    }
}
