#include "transcoding_source.h"

#include <string>

namespace textopen::detail {

namespace {

constexpr std::size_t kInputChunk = 16 * 1024;

ConverterPtr open_converter(const std::string& name) {
    UErrorCode err = U_ZERO_ERROR;
    ConverterPtr cnv(ucnv_open(name.c_str(), &err));
    if (U_FAILURE(err) || !cnv) {
        throw DecodeError("cannot open converter for " + name + ": " + u_errorName(err));
    }

    // Stop on the first bad sequence instead of substituting U+FFFD.
    err = U_ZERO_ERROR;
    ucnv_setToUCallBack(cnv.get(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &err);
    ucnv_setFromUCallBack(cnv.get(), UCNV_FROM_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &err);
    if (U_FAILURE(err)) {
        throw DecodeError("cannot configure converter for " + name + ": " + u_errorName(err));
    }
    return cnv;
}

} // namespace

TranscodingSource::TranscodingSource(std::unique_ptr<Source> upstream, const Encoding& encoding)
    : upstream_(std::move(upstream))
    , charset_(encoding.name())
    , decoder_(open_converter(encoding.converter_name()))
    , utf8_(open_converter("UTF-8"))
    , in_(kInputChunk)
{
    pivot_source_ = pivot_.data();
    pivot_target_ = pivot_.data();
}

std::size_t TranscodingSource::read(char* buf, std::size_t max) {
    char* target = buf;
    char* const target_limit = buf + max;

    if (error_) {
        drain_pivot(target, target_limit);
        if (target == buf) {
            throw DecodeError(*error_);
        }
        return static_cast<std::size_t>(target - buf);
    }

    while (target == buf && max > 0 && !finished_) {
        if (in_pos_ == in_len_ && !upstream_done_) {
            refill();
        }

        const char* source = in_.data() + in_pos_;
        const char* const source_limit = in_.data() + in_len_;
        const UBool flush = upstream_done_;

        UErrorCode err = U_ZERO_ERROR;
        ucnv_convertEx(utf8_.get(), decoder_.get(),
                       &target, target_limit,
                       &source, source_limit,
                       pivot_.data(), &pivot_source_, &pivot_target_,
                       pivot_.data() + pivot_.size(),
                       false, flush, &err);
        in_pos_ = static_cast<std::size_t>(source - in_.data());

        if (err == U_BUFFER_OVERFLOW_ERROR) {
            break;  // buf is full; the pivot keeps the rest
        }
        if (U_FAILURE(err)) {
            error_ = "invalid " + charset_ + " input: " + u_errorName(err);
            // Characters decoded ahead of the bad sequence may still sit in the pivot.
            drain_pivot(target, target_limit);
            if (target == buf) {
                throw DecodeError(*error_);
            }
            break;
        }
        if (flush && in_pos_ == in_len_) {
            finished_ = true;
        }
    }

    return static_cast<std::size_t>(target - buf);
}

void TranscodingSource::refill() {
    in_pos_ = 0;
    in_len_ = upstream_->read(in_.data(), in_.size());
    if (in_len_ == 0) {
        upstream_done_ = true;
    }
}

void TranscodingSource::drain_pivot(char*& target, const char* target_limit) {
    const UChar* pending = pivot_source_;
    UErrorCode err = U_ZERO_ERROR;
    ucnv_fromUnicode(utf8_.get(), &target, target_limit,
                     &pending, pivot_target_, nullptr, false, &err);
    pivot_source_ += pending - pivot_source_;
    if (U_FAILURE(err) && err != U_BUFFER_OVERFLOW_ERROR) {
        pivot_source_ = pivot_target_;  // unconvertible; nothing more to recover
    }
}

bool TranscodingSource::at_end() const {
    return finished_;
}

SourceInfo TranscodingSource::info() const {
    auto upstream = upstream_->info();
    return {upstream.name + " (" + charset_ + " -> UTF-8)", 0, false};
}

} // namespace textopen::detail
