#include "async_client.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

async_client::async_client(boost::asio::io_context& io_context)
    : io_context_(io_context) {
    LOG_DEBUG("Created HTTP async client");
}

async_client::async_client(boost::asio::io_context& io_context, std::shared_ptr<transport> transport)
    : client_base(std::move(transport))
    , io_context_(io_context) {
    LOG_DEBUG("Created HTTP async client over an existing transport");
}

async_client::~async_client() {
    LOG_DEBUG("Destroying HTTP async client");
    release_transport();
}

}
