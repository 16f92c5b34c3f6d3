#include "replay_source.h"

#include "bom.h"

#include <algorithm>
#include <array>
#include <exception>
#include <utility>

namespace textopen::detail {

ReplaySource::ReplaySource(std::string prefix, std::unique_ptr<Source> rest)
    : prefix_(std::move(prefix))
    , rest_(std::move(rest))
{
}

std::size_t ReplaySource::read(char* buf, std::size_t max) {
    if (prefix_pos_ < prefix_.size()) {
        std::size_t to_copy = std::min(max, prefix_.size() - prefix_pos_);
        std::copy(prefix_.data() + prefix_pos_,
                  prefix_.data() + prefix_pos_ + to_copy,
                  buf);
        prefix_pos_ += to_copy;
        if (prefix_pos_ == prefix_.size()) {
            prefix_.clear();
            prefix_.shrink_to_fit();
            prefix_pos_ = 0;
        }
        return to_copy;
    }
    return rest_ ? rest_->read(buf, max) : 0;
}

bool ReplaySource::at_end() const {
    return prefix_pos_ >= prefix_.size() && (!rest_ || rest_->at_end());
}

SourceInfo ReplaySource::info() const {
    if (rest_) return rest_->info();
    return {"replay", prefix_.size(), false};
}

// ---------------------------------------------------------------------------
// Utf8BomStripper
// ---------------------------------------------------------------------------

Utf8BomStripper::Utf8BomStripper(std::unique_ptr<Source> source)
    : source_(std::move(source))
{
}

std::size_t Utf8BomStripper::read(char* buf, std::size_t max) {
    if (!checked_) {
        check_bom();
    }
    return source_->read(buf, max);
}

void Utf8BomStripper::check_bom() {
    std::string head;
    try {
        // Stop as soon as the bytes seen can no longer start a BOM.
        while (head.size() < kUtf8Bom.size() && kUtf8Bom.starts_with(head)) {
            std::array<char, 3> chunk;
            std::size_t n = source_->read(chunk.data(), kUtf8Bom.size() - head.size());
            if (n == 0) break;
            head.append(chunk.data(), n);
        }
    } catch (const std::exception&) {
        put_back(std::move(head));
        throw;
    }

    if (head == kUtf8Bom) {
        checked_ = true;
    } else {
        put_back(std::move(head));
    }
}

void Utf8BomStripper::put_back(std::string head) {
    if (!head.empty()) {
        source_ = std::make_unique<ReplaySource>(std::move(head), std::move(source_));
    }
    checked_ = true;
}

bool Utf8BomStripper::at_end() const {
    return source_->at_end();
}

SourceInfo Utf8BomStripper::info() const {
    return source_->info();
}

// ---------------------------------------------------------------------------

std::string read_prefix(Source& source, std::size_t max) {
    constexpr std::size_t kChunk = 64 * 1024;

    // Grown as data arrives; `max` may be far larger than the stream.
    std::string prefix;
    while (prefix.size() < max) {
        std::size_t want = std::min(kChunk, max - prefix.size());
        std::size_t filled = prefix.size();
        prefix.resize(filled + want);
        std::size_t n = source.read(prefix.data() + filled, want);
        prefix.resize(filled + n);
        if (n == 0) break;
    }
    return prefix;
}

} // namespace textopen::detail
