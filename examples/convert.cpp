#include <textopen/file_sink.h>
#include <textopen/reader.h>

#include <charconv>
#include <cstdio>
#include <exception>
#include <string>
#include <string_view>

static void print_usage() {
    std::fprintf(stderr,
                 "usage: textopen-convert [--content-type=TYPE] [--lookahead=BYTES] INPUT OUTPUT\n"
                 "Writes INPUT to OUTPUT as UTF-8 without byte-order mark.\n");
}

static bool convert(const std::string& input, const std::string& output,
                    const textopen::ReaderConfig& config) {
    try {
        textopen::TextFile in = textopen::open_text_file(input, config);
        const auto& res = in.resolution();
        std::fprintf(stderr, "textopen: %s: %s (%s)\n", input.c_str(),
                     res.name.c_str(), res.certain ? "certain" : "guessed");

        textopen::FileSink out(output);
        std::size_t n = textopen::copy(in.reader(), out);
        out.close();
        in.close();

        std::fprintf(stderr, "textopen: wrote %zu bytes to %s\n", n, output.c_str());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "textopen: cannot convert '%s': %s\n", input.c_str(), e.what());
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    textopen::ReaderConfig config;
    std::string paths[2];
    int npaths = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.starts_with("--content-type=")) {
            config.content_type = arg.substr(15);
        } else if (arg.starts_with("--lookahead=")) {
            std::string_view value = arg.substr(12);
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                             config.lookahead_size);
            if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
                print_usage();
                return 2;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (npaths < 2 && !arg.starts_with("--")) {
            paths[npaths++] = std::string(arg);
        } else {
            print_usage();
            return 2;
        }
    }

    if (npaths != 2) {
        print_usage();
        return 2;
    }

    return convert(paths[0], paths[1], config) ? 0 : 1;
}
