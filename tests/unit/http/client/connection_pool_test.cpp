#include <catch2/catch_test_macros.hpp>
#include <resumable/http/client/connection_pool.hpp>
#include <resumable/http/client/client_connection.hpp>
#include <resumable/asio/sockets/tcp_socket.hpp>
#include <boost/asio.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace resumable::http;
namespace asio = boost::asio;

namespace {

    std::shared_ptr<client_connection> make_connection(asio::io_context& context, const std::string& host) {
        auto socket = std::make_shared<resumable::asio::tcp_socket>("test", context);
        return std::make_shared<client_connection>(socket, host, "80");
    }

}

TEST_CASE("Connection pool bookkeeping", "[connection_pool][unit]") {
    asio::io_context context;
    connection_pool pool;

    SECTION("Empty pool has nothing to hand out") {
        REQUIRE(pool.checkout("example.com", "80", false) == nullptr);
        REQUIRE(pool.size() == 0);
    }

    SECTION("Connections that cannot carry another request are not pooled") {
        // never connected, so not reusable
        pool.checkin("example.com", "80", false, make_connection(context, "example.com"));
        REQUIRE(pool.size() == 0);
    }

    SECTION("Null connections are ignored") {
        pool.checkin("example.com", "80", false, nullptr);
        REQUIRE(pool.size() == 0);
    }

    SECTION("cleanup and clear on an empty pool") {
        REQUIRE(pool.cleanup_closed() == 0);
        pool.clear();
        REQUIRE(pool.size() == 0);
    }
}

TEST_CASE("Connection pool thread safety", "[connection_pool][threading]") {
    connection_pool pool;
    const int num_threads = 8;
    const int operations_per_thread = 500;
    std::atomic<int> unexpected{0};

    auto thread_func = [&](int thread_id) {
        asio::io_context context;
        for (int i = 0; i < operations_per_thread; ++i) {
            std::string host = "host" + std::to_string((thread_id + i) % 5);
            if (i % 2 == 0) {
                pool.checkin(host, "80", false, make_connection(context, host));
            } else {
                auto conn = pool.checkout(host, "80", false);
                if (conn && !conn->is_open()) {
                    ++unexpected;
                }
            }
            if (i % 50 == 0) {
                pool.cleanup_closed();
                pool.size();
            }
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(thread_func, i);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(unexpected == 0);
    REQUIRE(pool.size() == 0);
}
