#include <iostream>
#include <string>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <resumable/http_client.hpp>

using namespace resumable;

// Count the lines of a gzip compressed remote file without storing it
int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <url of a .gz file>" << std::endl;
        return 1;
    }

    http::client client;

    try {
        http::download_source source(client.get(argv[1]));
        if (!source.get_download().ok()) {
            std::cerr << "Server returned status " << source.get_download().get_status_code() << std::endl;
            return 2;
        }

        boost::iostreams::filtering_istream in;
        in.push(boost::iostreams::gzip_decompressor());
        in.push(source);

        std::size_t lines = 0;
        std::string line;
        while (std::getline(in, line)) {
            lines++;
        }

        if (in.bad()) {
            std::cerr << "Download interrupted after " << source.get_download().position() << " bytes" << std::endl;
            return 2;
        }

        std::cout << lines << " lines (" << source.get_download().position() << " compressed bytes, "
                  << source.get_download().resumptions() << " resumptions)" << std::endl;
    } catch (const boost::system::system_error& e) {
        std::cerr << "Request failed: " << e.code().message() << std::endl;
        return 2;
    } catch (const boost::iostreams::gzip_error& e) {
        std::cerr << "Invalid gzip data: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
