#pragma once

#include <textopen/encoding.h>
#include <textopen/source.h>

#include <unicode/ucnv.h>

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace textopen::detail {

struct ConverterCloser {
    void operator()(UConverter* cnv) const { ucnv_close(cnv); }
};

using ConverterPtr = std::unique_ptr<UConverter, ConverterCloser>;

// Decodes `upstream` from `encoding` into UTF-8 as it is read. Conversion
// goes through ICU's UTF-16 pivot, which persists across read() calls so
// sequences split between chunks decode correctly.
//
// read() throws DecodeError on bytes that are illegal or truncated in the
// source encoding, and lets SourceError from upstream through. Text decoded
// before a bad sequence is returned first; the error is raised by the read()
// that finds nothing left to deliver, and by every read() after it.
class TranscodingSource : public Source {
public:
    TranscodingSource(std::unique_ptr<Source> upstream, const Encoding& encoding);

    TranscodingSource(const TranscodingSource&) = delete;
    TranscodingSource& operator=(const TranscodingSource&) = delete;

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;

private:
    void refill();
    void drain_pivot(char*& target, const char* target_limit);

    std::unique_ptr<Source> upstream_;
    std::string charset_;
    ConverterPtr decoder_;
    ConverterPtr utf8_;

    std::vector<char> in_;
    std::size_t in_pos_ = 0;
    std::size_t in_len_ = 0;
    bool upstream_done_ = false;

    std::array<UChar, 1024> pivot_{};
    UChar* pivot_source_ = nullptr;
    UChar* pivot_target_ = nullptr;

    bool finished_ = false;
    std::optional<std::string> error_;
};

} // namespace textopen::detail
