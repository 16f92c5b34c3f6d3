#include "memory_source.h"

#include <algorithm>
#include <utility>

namespace textopen::detail {

MemorySource::MemorySource(std::string data, std::string name)
    : data_(std::move(data))
    , name_(std::move(name))
{
}

std::size_t MemorySource::read(char* buf, std::size_t max) {
    std::size_t to_copy = std::min(max, data_.size() - pos_);
    std::copy(data_.data() + pos_, data_.data() + pos_ + to_copy, buf);
    pos_ += to_copy;
    return to_copy;
}

bool MemorySource::at_end() const {
    return pos_ >= data_.size();
}

SourceInfo MemorySource::info() const {
    return {name_, data_.size(), false};
}

} // namespace textopen::detail
