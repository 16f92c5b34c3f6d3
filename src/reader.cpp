#include <textopen/reader.h>

#include "bom.h"
#include "file_source.h"
#include "replay_source.h"
#include "transcoding_source.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>

namespace textopen {

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

ReaderResult open_reader(std::unique_ptr<Source> source, const ReaderConfig& config) {
    // The BOM check needs at least the longest signature.
    std::size_t cap = std::clamp(config.lookahead_size, detail::kUtf8Bom.size(),
                                 kMaxLookaheadSize);
    std::string preview = detail::read_prefix(*source, cap);
    Resolution resolution = detect_encoding(std::string_view(preview), config.content_type);

    if (preview.empty()) {
        // Nothing to convert; the exhausted source is a valid empty reader.
        return {std::move(source), std::move(resolution)};
    }

    std::unique_ptr<Source> reader =
        std::make_unique<detail::ReplaySource>(std::move(preview), std::move(source));
    if (!resolution.encoding.is_nop()) {
        reader = std::make_unique<detail::TranscodingSource>(std::move(reader),
                                                             resolution.encoding);
    }

    // Decoders may emit a BOM of their own (UTF-16 -> UTF-8 keeps U+FEFF).
    return {strip_utf8_bom(std::move(reader)), std::move(resolution)};
}

std::unique_ptr<Source> new_reader(std::unique_ptr<Source> source, const ReaderConfig& config) {
    return open_reader(std::move(source), config).source;
}

std::unique_ptr<Source> strip_utf8_bom(std::unique_ptr<Source> source) {
    return std::make_unique<detail::Utf8BomStripper>(std::move(source));
}

// ---------------------------------------------------------------------------
// TextFile
// ---------------------------------------------------------------------------

struct TextFile::Impl {
    std::filesystem::path path;
    detail::FileSource* file = nullptr;  // owned by the reader chain
    std::unique_ptr<Source> reader;
    Resolution resolution;
};

TextFile::TextFile(const std::filesystem::path& path, const ReaderConfig& config) {
    auto file = std::make_unique<detail::FileSource>(path);
    detail::FileSource* raw = file.get();

    // If detection throws, `file` unwinds and closes the handle.
    auto [source, res] = open_reader(std::move(file), config);
    impl_ = std::make_unique<Impl>(Impl{path, raw, std::move(source), std::move(res)});
}

TextFile::~TextFile() {
    if (!impl_ || !impl_->file) return;
    try {
        close();
    } catch (const SourceError& e) {
        std::fprintf(stderr, "textopen: %s\n", e.what());
    }
}

TextFile::TextFile(TextFile&&) noexcept = default;

TextFile& TextFile::operator=(TextFile&& other) noexcept {
    if (this != &other) {
        TextFile discarded(std::move(*this));
        impl_ = std::move(other.impl_);
    }
    return *this;
}

Source& TextFile::reader() {
    return *impl_->reader;
}

const Resolution& TextFile::resolution() const {
    return impl_->resolution;
}

const std::filesystem::path& TextFile::path() const {
    return impl_->path;
}

bool TextFile::is_open() const {
    return impl_ && impl_->file != nullptr;
}

void TextFile::close() {
    if (!is_open()) return;
    detail::FileSource* file = impl_->file;
    impl_->file = nullptr;
    file->close();
}

TextFile open_text_file(const std::filesystem::path& path, const ReaderConfig& config) {
    return TextFile(path, config);
}

TextFile must_open_text_file(const std::filesystem::path& path, const ReaderConfig& config) {
    try {
        return TextFile(path, config);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "textopen: fatal error: %s\n", e.what());
        std::abort();
    }
}

} // namespace textopen
