#ifndef RESUMABLE_HTTP_CLIENT_DOWNLOAD_SOURCE_HPP
#define RESUMABLE_HTTP_CLIENT_DOWNLOAD_SOURCE_HPP

#include <iosfwd>
#include <memory>
#include <boost/iostreams/categories.hpp>

#include "download_stream.hpp"

namespace resumable::http {

/**
 * Boost.Iostreams Source over a blocking download, so the body can be consumed with
 * boost::iostreams::stream or through a filtering chain (e.g. gzip_decompressor).
 * Copies share the same download.
 *
 * A transport error that ends the download is thrown from read(), which iostreams
 * reports by setting badbit on the stream.
 */
class download_source {
public:
    typedef char char_type;
    typedef boost::iostreams::source_tag category;

    explicit download_source(std::shared_ptr<download_stream> download)
        : download_(std::move(download)) {}

    explicit download_source(download_stream&& download)
        : download_(std::make_shared<download_stream>(std::move(download))) {}

    std::streamsize read(char* s, std::streamsize n) {
        if (n <= 0) return 0;
        auto bytes = download_->read_some(reinterpret_cast<uint8_t*>(s), static_cast<std::size_t>(n));
        return bytes == 0 ? -1 : static_cast<std::streamsize>(bytes);
    }

    download_stream& get_download() { return *download_; }

private:
    std::shared_ptr<download_stream> download_;
};

}

#endif
