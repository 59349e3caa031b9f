#include <planwise/os/File.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

namespace planwise::os {

namespace {

struct FileCloser {
    void operator()(std::FILE* fp) const {
        if (fp != nullptr) std::fclose(fp);
    }
};

using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

} // namespace

ReadTextResult read_text_file(const std::filesystem::path& path) {
    ReadTextResult r{};

    FileHandle fp(std::fopen(path.string().c_str(), "rb"));
    if (!fp) {
        r.err = "cannot open " + path.string() + ": " + std::strerror(errno);
        return r;
    }

    char buf[16 * 1024];
    while (true) {
        const size_t n = std::fread(buf, 1, sizeof(buf), fp.get());
        r.text.append(buf, n);
        if (n < sizeof(buf)) break;
    }
    if (std::ferror(fp.get()) != 0) {
        r.text.clear();
        r.err = "read error on " + path.string();
        return r;
    }

    r.text.erase(std::remove(r.text.begin(), r.text.end(), '\r'), r.text.end());
    r.ok = true;
    return r;
}

} // namespace planwise::os
