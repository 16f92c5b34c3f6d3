#pragma once

#include <textopen/source.h>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <string_view>

namespace textopen {

// A file opened for writing; close() flushes and syncs before closing.
class FileSink {
public:
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink();

    FileSink(FileSink&& other) noexcept;
    FileSink& operator=(FileSink&& other) noexcept;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const char* data, std::size_t size);
    void write(std::string_view data) { write(data.data(), data.size()); }

    // Flush, fsync and close. Throws SourceError if any step fails.
    void close();

    bool is_open() const { return file_ != nullptr; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::FILE* file_ = nullptr;
    std::filesystem::path path_;
};

// Copy everything from `source` to `sink`. Returns the number of bytes copied.
std::size_t copy(Source& source, FileSink& sink);

} // namespace textopen
