#ifndef RESUMABLE_ASIO_SOCKET_HPP
#define RESUMABLE_ASIO_SOCKET_HPP

#include <chrono>
#include <string>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/types.hpp"

namespace resumable::asio {

class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(const std::string &context, boost::asio::io_context &io_context);
    virtual ~socket();

    // socket control
    virtual awaitable<boost::system::error_code> connect(
        const std::string &host,
        const std::string &port,
        std::chrono::seconds timeout) = 0;
    virtual void close() = 0;
    virtual void cancel() = 0;
    virtual bool requires_handshake() const;
    virtual awaitable<boost::system::error_code> handshake(const std::string &host = "");

    // read operations
    virtual awaitable<io_result> read_some(uint8_t buffer[], size_t max_size) = 0;

    // write operations
    virtual awaitable<io_result> write(std::string_view str) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual bool is_secure() const = 0;

    // other methods
    boost::asio::io_context &get_io_context() const;

protected:
    std::string context_;
    boost::asio::io_context &io_context_;
};

}

#endif
