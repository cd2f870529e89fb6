#include "utils.h"

namespace file_io {

    std::string formatFsError(std::string_view msg,
                              const FilePath& p,
                              const std::error_code& ec) {
        std::string s(msg);
        s += ": ";
        s += p.string();
        if (ec) {
            s += " (" + ec.message() + ")";
        }
        return s;
    }

    // 统一的状态检查：check(p, ec) 为 false 或出错时抛出 "<what> <failure>: path"
    template <typename Check>
    static void requireStatus(const FilePath& p, std::string_view what, std::string_view failure, Check check) {
        std::error_code ec;
        const bool ok = check(p, ec);
        if (ec || !ok) {
            throw std::runtime_error(formatFsError(std::string(what) + " " + std::string(failure), p, ec));
        }
    }

    void requireExists(const FilePath& p, std::string_view what) {
        requireStatus(p, what, "does not exist",
                      [](const FilePath& x, std::error_code& ec) { return fs::exists(x, ec); });
    }

    void requireRegularFile(const FilePath& p, std::string_view what) {
        requireStatus(p, what, "is not a regular file",
                      [](const FilePath& x, std::error_code& ec) { return fs::is_regular_file(x, ec); });
    }

    void requireDirectory(const FilePath& p, std::string_view what) {
        requireStatus(p, what, "is not a directory",
                      [](const FilePath& x, std::error_code& ec) { return fs::is_directory(x, ec); });
    }

    void ensureDirectoryExists(const FilePath& p, std::string_view what) {
        std::error_code ec;
        const auto st = fs::status(p, ec);
        if (fs::exists(st)) {
            requireDirectory(p, what);
            return;
        }
        // status 对不存在的路径会设置 ec，这里只关心创建是否成功
        ec.clear();
        fs::create_directories(p, ec);
        if (ec) {
            throw std::runtime_error(formatFsError("failed to create " + std::string(what), p, ec));
        }
    }

    void ensureParentDirExists(const FilePath& out_file) {
        const FilePath parent = out_file.parent_path();
        if (!parent.empty()) {
            ensureDirectoryExists(parent, "output parent dir");
        }
    }

    bool hasContent(const FilePath& p) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) return false;
        const auto size = fs::file_size(p, ec);
        if (ec) {
            throw std::runtime_error(formatFsError("failed to read file size", p, ec));
        }
        return size > 0;
    }

    bool removeFile(const FilePath& p) {
        std::error_code ec;
        const bool removed = fs::remove(p, ec);
        if (ec) {
            throw std::runtime_error(formatFsError("failed to remove file", p, ec));
        }
        return removed;
    }

    // 表格类输出统一走这里：父目录存在、截断写、错误信息一致
    std::ofstream openOutput(const FilePath& p, std::string_view what) {
        ensureParentDirExists(p);
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error(formatFsError("failed to open " + std::string(what) + " for writing",
                                                   p, std::make_error_code(std::errc::io_error)));
        }
        return out;
    }

    std::string fastaStem(const FilePath& p) {
        FilePath name = p.filename();
        if (name.extension() == ".gz") name = name.stem();
        return name.stem().string();
    }

} // namespace file_io
