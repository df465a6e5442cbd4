#include <iostream>
#include <resumable/http_client.hpp>

using namespace resumable;

int main(int argc, char* argv[]) {
    std::string url = argc > 1 ? argv[1] : "http://localhost:8080/large.bin";

    boost::asio::io_context io_context;
    http::async_client client(io_context);

    std::cout << "Streaming Download Example (Coroutines)\n" << std::endl;

    co_spawn(io_context, [&]() -> awaitable<void> {
        try {
            auto stream = co_await client.get(url);
            std::cout << "Status: " << stream->get_status_code()
                      << ", ranges " << (stream->accepts_ranges() ? "supported" : "not supported") << std::endl;

            std::size_t chunks = 0;
            while (true) {
                auto chunk = co_await stream->read_chunk();
                if (chunk.empty()) break;
                chunks++;
            }

            std::cout << "Streaming completed: " << chunks << " chunks, "
                      << stream->position() << " bytes, "
                      << stream->resumptions() << " resumptions" << std::endl;
        } catch (const boost::system::system_error& e) {
            std::cerr << "Download failed: " << e.code().message() << std::endl;
        }
    }, detached);

    io_context.run();
    return 0;
}
