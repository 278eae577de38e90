#include "io/AtomicFile.h"

#include <fstream>
#include <system_error>

namespace fractal::io {

namespace {
    bool write_temp_and_flush(const fs::path& temp, std::string_view bytes, std::string* err) {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "cannot open '" + temp.string() + "' for writing";
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            if (err) *err = "write to '" + temp.string() + "' failed";
            return false;
        }
        out.close();
        return !out.fail();
    }
}

bool write_atomic(const fs::path& path, std::string_view bytes, std::string* err)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories failed: " + ec.message();
            return false;
        }
    }

    const fs::path tmp = temp_path_for(path);
    if (!write_temp_and_flush(tmp, bytes, err)) {
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        if (err) *err = "rename to '" + path.string() + "' failed: " + ec.message();
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return false;
    }
    return true;
}

bool read_all(const fs::path& p, std::string& out, std::string* err)
{
    std::ifstream in(p, std::ios::binary);
    if (!in) { if (err) *err = "open failed: " + p.string(); return false; }
    in.seekg(0, std::ios::end);
    const auto sz = in.tellg();
    in.seekg(0, std::ios::beg);
    out.resize(static_cast<std::size_t>(sz));
    if (sz > 0) in.read(out.data(), sz);
    if (!in) { if (err) *err = "read failed: " + p.string(); return false; }
    return true;
}

} // namespace fractal::io
