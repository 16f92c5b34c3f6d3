#pragma once

#include <textopen/encoding.h>
#include <textopen/source.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace textopen {

inline constexpr std::size_t kDefaultLookaheadSize = 10240;
inline constexpr std::size_t kMaxLookaheadSize = 64 * 1024 * 1024;

struct ReaderConfig {
    // Declared media type, e.g. from an HTTP header ("text/html; charset=koi8-r").
    // Empty means none.
    std::string content_type;

    // Bytes buffered up front and examined for a BOM, <meta> declarations
    // and UTF-8 validity. Declarations past this prefix are not seen.
    // Clamped to [3, kMaxLookaheadSize].
    std::size_t lookahead_size = kDefaultLookaheadSize;
};

struct ReaderResult {
    std::unique_ptr<Source> source;  // UTF-8 without BOM
    Resolution resolution;
};

// Wrap `source` so that it yields UTF-8 without a leading BOM, whatever the
// encoding of the original bytes. The lookahead prefix is read eagerly;
// everything else is converted lazily as the result is drained.
//
// Throws SourceError if priming the lookahead fails. A source that ends
// before yielding a byte is not an error; it is returned unchanged. Nothing
// is decoded here, so DecodeError only ever comes from the result's read().
ReaderResult open_reader(std::unique_ptr<Source> source,
                         const ReaderConfig& config = {});

// Same as open_reader(), discarding the resolution.
std::unique_ptr<Source> new_reader(std::unique_ptr<Source> source,
                                   const ReaderConfig& config = {});

// Drop a leading UTF-8 BOM (EF BB BF) from `source`. The check happens on
// the first read() and looks at no more than three bytes; bytes that are not
// a BOM are replayed ahead of the rest.
std::unique_ptr<Source> strip_utf8_bom(std::unique_ptr<Source> source);

// A file opened for reading through the normalizing pipeline.
class TextFile {
public:
    TextFile(const std::filesystem::path& path, const ReaderConfig& config = {});
    ~TextFile();

    TextFile(TextFile&&) noexcept;
    TextFile& operator=(TextFile&&) noexcept;

    TextFile(const TextFile&) = delete;
    TextFile& operator=(const TextFile&) = delete;

    // UTF-8 content without BOM. Must not be used after close().
    Source& reader();

    const Resolution& resolution() const;
    const std::filesystem::path& path() const;
    bool is_open() const;

    // Release the file. Throws SourceError if closing fails.
    void close();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

TextFile open_text_file(const std::filesystem::path& path,
                        const ReaderConfig& config = {});

// Like open_text_file(), but prints the error and aborts on failure.
TextFile must_open_text_file(const std::filesystem::path& path,
                             const ReaderConfig& config = {});

} // namespace textopen
