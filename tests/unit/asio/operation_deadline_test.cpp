#include <catch2/catch_test_macros.hpp>
#include <resumable/asio/operation_deadline.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>

using namespace resumable;

TEST_CASE("Operation deadline", "[operation_deadline][unit]") {
    boost::asio::io_context io_context;
    int expirations = 0;

    SECTION("Fires when the operation outlives the timeout") {
        auto deadline = std::make_unique<asio::operation_deadline>(io_context, std::chrono::seconds(1),
                                                                   [&] { ++expirations; });
        // keep the context busy past the deadline
        boost::asio::steady_timer slow(io_context, std::chrono::milliseconds(1500));
        slow.async_wait([&](const boost::system::error_code&) {
            REQUIRE(deadline->expired());
            deadline.reset();
        });
        io_context.run();
        REQUIRE(expirations == 1);
    }

    SECTION("Destroying the deadline disarms it") {
        {
            asio::operation_deadline deadline(io_context, std::chrono::seconds(1), [&] { ++expirations; });
            REQUIRE_FALSE(deadline.expired());
        }
        io_context.run();
        REQUIRE(expirations == 0);
    }

    SECTION("Zero timeout never fires") {
        asio::operation_deadline deadline(io_context, std::chrono::seconds(0), [&] { ++expirations; });
        io_context.run();
        REQUIRE_FALSE(deadline.expired());
        REQUIRE(expirations == 0);
    }
}
