#include "file_source.h"

#include <cerrno>
#include <cstring>

namespace textopen::detail {

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path.string())
{
    file_ = std::fopen(path_.c_str(), "rb");
    if (!file_) {
        throw SourceError("cannot open file: " + path_ +
                          " (" + std::strerror(errno) + ")");
    }

    // Pipes and character devices have no size; leave it at 0.
    if (std::fseek(file_, 0, SEEK_END) == 0) {
        long end = std::ftell(file_);
        if (end > 0) size_ = static_cast<std::size_t>(end);
        std::fseek(file_, 0, SEEK_SET);
    }
    std::clearerr(file_);
}

FileSource::~FileSource() {
    if (file_) {
        std::fclose(file_);
    }
}

std::size_t FileSource::read(char* buf, std::size_t max) {
    if (!file_ || eof_ || max == 0) return 0;
    std::size_t n = std::fread(buf, 1, max, file_);
    if (n < max && std::ferror(file_)) {
        throw SourceError("read failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    if (n == 0 || std::feof(file_)) {
        eof_ = true;
    }
    return n;
}

bool FileSource::at_end() const {
    return eof_ || !file_;
}

SourceInfo FileSource::info() const {
    return {path_, size_, true};
}

void FileSource::close() {
    if (!file_) return;
    std::FILE* f = file_;
    file_ = nullptr;
    if (std::fclose(f) != 0) {
        throw SourceError("close failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
}

} // namespace textopen::detail
