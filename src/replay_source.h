#pragma once

#include <textopen/source.h>

#include <cstddef>
#include <memory>
#include <string>

namespace textopen::detail {

// Serves `prefix` first, then whatever is left in `rest`. Used to put back
// bytes that were read ahead for sniffing.
class ReplaySource : public Source {
public:
    ReplaySource(std::string prefix, std::unique_ptr<Source> rest);

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;

private:
    std::string prefix_;
    std::size_t prefix_pos_ = 0;
    std::unique_ptr<Source> rest_;
};

// Drops a leading UTF-8 BOM. Nothing is read from `source` until the first
// read(); bytes that turn out not to be a BOM are served ahead of the rest.
class Utf8BomStripper : public Source {
public:
    explicit Utf8BomStripper(std::unique_ptr<Source> source);

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;

private:
    void check_bom();
    void put_back(std::string head);

    std::unique_ptr<Source> source_;
    bool checked_ = false;
};

// Read from `source` until `max` bytes are collected or it is exhausted.
std::string read_prefix(Source& source, std::size_t max);

} // namespace textopen::detail
