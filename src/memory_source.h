#pragma once

#include <textopen/source.h>

#include <cstddef>
#include <string>

namespace textopen::detail {

class MemorySource : public Source {
public:
    explicit MemorySource(std::string data, std::string name = "memory");

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;

private:
    std::string data_;
    std::string name_;
    std::size_t pos_ = 0;
};

} // namespace textopen::detail
