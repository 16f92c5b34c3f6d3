#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace textopen {

struct SourceInfo {
    std::string name;
    std::size_t size_bytes = 0;
    bool seekable = false;
};

// Thrown when the underlying resource fails (open, read, flush or close).
// Running out of data is never reported this way.
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Source {
public:
    virtual ~Source() = default;

    // Read up to max bytes into buf. Returns number of bytes actually read.
    // Blocks until at least one byte is available; returns 0 only when the
    // stream is exhausted. Throws SourceError on I/O failure.
    virtual std::size_t read(char* buf, std::size_t max) = 0;

    // Returns true when there is no more data to read.
    virtual bool at_end() const = 0;

    // Metadata about this source.
    virtual SourceInfo info() const = 0;
};

// Serves a copy of `data`.
std::unique_ptr<Source> make_memory_source(std::string data,
                                           std::string name = "memory");

// Opens `path` for binary reading. Throws SourceError if it cannot be opened.
std::unique_ptr<Source> make_file_source(const std::filesystem::path& path);

// Drain a source into one contiguous string.
std::string read_all(Source& source);

} // namespace textopen
