#include <chisel/chisel.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace {

    int usage(const char* argv0) {
        std::cerr << "usage: " << argv0 << " [--objects] <file.json>\n"
                  << "  prints the JSON Pointer of every value in the document\n"
                  << "  --objects  only print pointers of objects\n";
        return 2;
    }

    bool selected(const chisel::Event& e, const bool objects_only) {
        if (objects_only)
            return e.kind == chisel::EventKind::StartObject;
        return e.is_value();
    }

    void report(const std::string& path, const chisel::ParseError& err) {
        if (err.kind == chisel::ErrorKind::Io) {
            std::cerr << err.to_string() << "\n";
            return;
        }

        std::ifstream in(path, std::ios::binary);
        const std::string text {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        std::cerr << err.format<chisel::ErrorFormat::Pretty>(text) << "\n";
    }

} // namespace

int main(int argc, char* argv[]) {
    bool objects_only = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg {argv[i]};
        if (arg == "--objects")
            objects_only = true;
        else if (arg == "-h" || arg == "--help")
            return usage(argv[0]);
        else if (path == nullptr)
            path = argv[i];
        else
            return usage(argv[0]);
    }

    if (path == nullptr)
        return usage(argv[0]);

    std::string out;
    chisel::PointerSink sink {[&](const chisel::Event& e, const chisel::JsonPointer& p) {
        if (!selected(e, objects_only))
            return;
        out = p.str();
        out.push_back('\n');
        std::cout << out;
    }};

    const auto result = chisel::parse_sax_file(path, sink);
    if (!result.ok()) {
        report(path, result.error);
        return 1;
    }
    return 0;
}
