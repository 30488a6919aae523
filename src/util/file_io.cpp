#include <ferry/file_io.hpp>

#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace ferry {

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned> s_temp_counter{0};
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return FerryError{FerryError::IO, "cannot read " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return FerryError{FerryError::IO, "error reading " + path.string()};
    }
    return Result<std::string>::ok(ss.str());
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return FerryError{FerryError::IO,
                "cannot create directory " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(::getpid()) + "." +
           std::to_string(s_temp_counter.fetch_add(1));
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return FerryError{FerryError::IO, "cannot write " + tmp.string()};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return FerryError{FerryError::IO, "error writing " + tmp.string()};
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return FerryError{FerryError::IO,
            "cannot move " + tmp.string() + " to " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

bool is_temp_file(const fs::path& path) {
    return path.filename().string().find(".tmp.") != std::string::npos;
}

} // namespace ferry
