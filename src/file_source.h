#pragma once

#include <textopen/source.h>

#include <cstdio>
#include <filesystem>
#include <string>

namespace textopen::detail {

class FileSource : public Source {
public:
    explicit FileSource(const std::filesystem::path& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    std::size_t read(char* buf, std::size_t max) override;
    bool at_end() const override;
    SourceInfo info() const override;

    // Close the handle now. Throws SourceError if fclose fails. Reads after
    // close() return 0.
    void close();
    bool is_open() const { return file_ != nullptr; }

private:
    std::FILE* file_ = nullptr;
    std::string path_;
    std::size_t size_ = 0;
    bool eof_ = false;
};

} // namespace textopen::detail
