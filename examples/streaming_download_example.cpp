#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <resumable/http_client.hpp>

using namespace resumable;

// Helper to format bytes
std::string format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

// Helper to draw progress bar
void draw_progress(std::uint64_t downloaded, std::uint64_t total) {
    const int bar_width = 40;
    float progress = total > 0 ? static_cast<float>(downloaded) / total : 0;
    int filled = static_cast<int>(bar_width * progress);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::setw(3) << static_cast<int>(progress * 100) << "% "
              << format_bytes(downloaded);
    if (total > 0) {
        std::cout << " / " << format_bytes(total);
    }
    std::cout << std::flush;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <url> <output file> [max resumptions]" << std::endl;
        return 1;
    }

    std::string url = argv[1];
    std::string output = argv[2];

    if (std::getenv("RESUMABLE_LOG_LEVEL")) {
        logging::enable();
        logging::set_log_level(spdlog::level::debug);
    }

    http::client client;
    client.timeout(std::chrono::seconds(15));
    if (argc > 3) {
        client.max_resumptions(static_cast<unsigned>(std::stoul(argv[3])));
    }

    std::cout << "Downloading " << url << " to " << output << "\n" << std::endl;

    auto result = client.request(url)
        .download(output, [](std::uint64_t downloaded, std::uint64_t total) {
            draw_progress(downloaded, total);
        });

    std::cout << std::endl; // New line after progress bar

    if (result) {
        std::cout << "Download completed!" << std::endl;
        std::cout << "  Status: " << result.status_code << std::endl;
        std::cout << "  Bytes: " << format_bytes(result.bytes_transferred) << std::endl;
        std::cout << "  Resumptions: " << result.resumptions << std::endl;
        std::cout << "  File: " << output << std::endl;
        return 0;
    }

    if (result.has_http_error()) {
        std::cerr << "Server returned status " << result.status_code << std::endl;
    } else {
        std::cerr << "Download failed after " << format_bytes(result.bytes_transferred)
                  << " and " << result.resumptions << " resumptions: " << result.error << std::endl;
    }
    return 2;
}
