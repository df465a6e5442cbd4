#ifndef RESUMABLE_HTTP_CLIENT_CONNECTION_POOL_HPP
#define RESUMABLE_HTTP_CLIENT_CONNECTION_POOL_HPP

#include <memory>
#include <string>
#include <shared_mutex>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include "client_connection.hpp"

namespace resumable::http {

/**
 * Idle keep-alive connections, keyed by origin. A connection is owned by the pool only
 * while idle: checkout() hands it over to the caller, and checkin() gives it back once
 * its response body has been fully read.
 */
class connection_pool {
private:
    // Connection entry in the pool
    struct connection_entry {
        std::string host;
        std::string port;
        bool ssl;
        std::shared_ptr<client_connection> connection;

        connection_entry(const std::string& h, const std::string& p, bool s,
                         std::shared_ptr<client_connection> conn)
            : host(h), port(p), ssl(s), connection(std::move(conn)) {}
    };

    // Tags for multi_index_container
    struct by_key {};
    struct by_sequence {};

    using connection_container = boost::multi_index_container<
        connection_entry,
        boost::multi_index::indexed_by<
            // Hashed index by composite key (host, port, ssl), several idle connections per origin
            boost::multi_index::hashed_non_unique<
                boost::multi_index::tag<by_key>,
                boost::multi_index::composite_key<
                    connection_entry,
                    boost::multi_index::member<connection_entry, std::string, &connection_entry::host>,
                    boost::multi_index::member<connection_entry, std::string, &connection_entry::port>,
                    boost::multi_index::member<connection_entry, bool, &connection_entry::ssl>
                >
            >,
            // Sequenced index for LRU eviction (most recently returned at the back)
            boost::multi_index::sequenced<
                boost::multi_index::tag<by_sequence>
            >
        >
    >;

    connection_container connections_;
    std::size_t max_idle_;
    mutable std::shared_mutex mutex_;

public:
    static constexpr std::size_t DEFAULT_MAX_IDLE = 16;

    explicit connection_pool(std::size_t max_idle = DEFAULT_MAX_IDLE);
    ~connection_pool();

    // Take an idle open connection for the origin (returns nullptr if there is none)
    std::shared_ptr<client_connection> checkout(const std::string& host,
                                                const std::string& port,
                                                bool ssl);

    // Return a connection to the pool. It is dropped unless it can carry another request
    void checkin(const std::string& host,
                 const std::string& port,
                 bool ssl,
                 std::shared_ptr<client_connection> connection);

    // Remove connections closed while idle. Returns the number of connections removed
    std::size_t cleanup_closed();

    // Get the number of idle connections in the pool
    std::size_t size() const;

    // Close and remove all idle connections
    void clear();
};

}

#endif
