#include <textopen/file_sink.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <unistd.h>

namespace textopen {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

} // namespace

FileSink::FileSink(const std::filesystem::path& path)
    : path_(path)
{
    file_ = std::fopen(path.string().c_str(), "wb");
    if (!file_) {
        throw SourceError("cannot create file: " + path.string() + " (" + errno_text() + ")");
    }
}

FileSink::~FileSink() {
    if (!file_) return;
    try {
        close();
    } catch (const SourceError& e) {
        std::fprintf(stderr, "textopen: %s\n", e.what());
    }
}

FileSink::FileSink(FileSink&& other) noexcept
    : file_(std::exchange(other.file_, nullptr))
    , path_(std::move(other.path_))
{
}

FileSink& FileSink::operator=(FileSink&& other) noexcept {
    if (this != &other) {
        FileSink discarded(std::move(*this));
        file_ = std::exchange(other.file_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void FileSink::write(const char* data, std::size_t size) {
    if (!file_) {
        throw SourceError("write to closed file: " + path_.string());
    }
    if (std::fwrite(data, 1, size, file_) != size) {
        throw SourceError("write failed: " + path_.string() + " (" + errno_text() + ")");
    }
}

void FileSink::close() {
    if (!file_) return;
    std::FILE* f = std::exchange(file_, nullptr);

    std::string error;
    if (std::fflush(f) != 0) {
        error = "flush failed: ";
    } else if (::fsync(::fileno(f)) != 0 && errno != EINVAL) {
        // EINVAL: the descriptor (pipe, terminal) doesn't support syncing.
        error = "sync failed: ";
    }
    if (!error.empty()) {
        error += path_.string() + " (" + errno_text() + ")";
    }

    if (std::fclose(f) != 0 && error.empty()) {
        error = "close failed: " + path_.string() + " (" + errno_text() + ")";
    }
    if (!error.empty()) {
        throw SourceError(error);
    }
}

std::size_t copy(Source& source, FileSink& sink) {
    constexpr std::size_t BUF_SIZE = 64 * 1024;
    std::vector<char> buf(BUF_SIZE);
    std::size_t total = 0;

    while (true) {
        std::size_t n = source.read(buf.data(), BUF_SIZE);
        if (n == 0) break;
        sink.write(buf.data(), n);
        total += n;
    }
    return total;
}

} // namespace textopen
