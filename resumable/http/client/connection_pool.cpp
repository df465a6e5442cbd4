#include "connection_pool.hpp"
#include "../../util/logger.hpp"

namespace resumable::http {

connection_pool::connection_pool(std::size_t max_idle) : max_idle_(max_idle) {
}

connection_pool::~connection_pool() {
    clear();
}

std::shared_ptr<client_connection> connection_pool::checkout(const std::string& host,
                                                             const std::string& port,
                                                             bool ssl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& key_index = connections_.get<by_key>();
    auto range = key_index.equal_range(std::make_tuple(host, port, ssl));

    for (auto it = range.first; it != range.second;) {
        auto conn = it->connection;
        it = key_index.erase(it);
        if (conn && conn->is_open()) {
            LOG_TRACE("reusing pooled connection to {}:{}", host, port);
            return conn;
        }
    }
    return nullptr;
}

void connection_pool::checkin(const std::string& host,
                              const std::string& port,
                              bool ssl,
                              std::shared_ptr<client_connection> connection) {
    if (!connection || max_idle_ == 0) return;
    if (!connection->reusable()) {
        connection->close();
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& seq_index = connections_.get<by_sequence>();

    // evict the least recently returned connection
    while (seq_index.size() >= max_idle_) {
        seq_index.front().connection->close();
        seq_index.pop_front();
    }

    seq_index.emplace_back(host, port, ssl, std::move(connection));
    LOG_TRACE("connection to {}:{} returned to pool. idle: {}", host, port, seq_index.size());
}

std::size_t connection_pool::cleanup_closed() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t removed = 0;
    auto& seq_index = connections_.get<by_sequence>();
    auto it = seq_index.begin();
    while (it != seq_index.end()) {
        if (!it->connection->is_open()) {
            it = seq_index.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t connection_pool::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

void connection_pool::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : connections_.get<by_sequence>()) {
        entry.connection->close();
    }
    connections_.clear();
}

}
