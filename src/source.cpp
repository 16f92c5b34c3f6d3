#include <textopen/source.h>

#include "file_source.h"
#include "memory_source.h"

#include <vector>

namespace textopen {

std::unique_ptr<Source> make_memory_source(std::string data, std::string name) {
    return std::make_unique<detail::MemorySource>(std::move(data), std::move(name));
}

std::unique_ptr<Source> make_file_source(const std::filesystem::path& path) {
    return std::make_unique<detail::FileSource>(path);
}

std::string read_all(Source& source) {
    std::string content;
    constexpr std::size_t BUF_SIZE = 64 * 1024;
    std::vector<char> buf(BUF_SIZE);

    while (true) {
        std::size_t n = source.read(buf.data(), BUF_SIZE);
        if (n == 0) break;
        content.append(buf.data(), n);
    }
    return content;
}

} // namespace textopen
