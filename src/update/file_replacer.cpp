#include "update/file_replacer.hpp"

#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace selfupdate {

namespace {

Result PipeReaderToWriter(IReader& r, IWriter& w, ReplaceReport& report) {
    std::vector<std::uint8_t> buffer(256 * 1024);
    Sha256Hasher hasher;

    while (true) {
        const ssize_t n = r.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) {
            const int err = errno;
            return Result::Fail(err, "Read failed during copy (" + std::string(std::strerror(err)) + ")");
        }

        const std::span<const std::uint8_t> chunk(buffer.data(), static_cast<size_t>(n));
        auto res = w.WriteAll(chunk);
        if (!res.is_ok()) return res;

        hasher.Update(chunk);
        report.bytes += static_cast<std::uint64_t>(n);
    }

    auto fr = w.FsyncNow();
    if (!fr.is_ok()) return fr;

    report.sha256 = hasher.FinalHex();
    return Result::Ok();
}

} // namespace

Result FileReplacer::Replace(const std::string& source, const std::string& target, ReplaceReport& out) {
    out = ReplaceReport{};

    FileReader reader;
    auto open_res = FileReader::Open(source, reader);
    if (!open_res.is_ok()) return open_res;

    const std::string tmp_path = target + ".tmp";
    const mode_t mode = reader.Permissions();

    FileWriter writer;
    open_res = FileWriter::Open(tmp_path, mode, writer);
    if (!open_res.is_ok()) return open_res;

    auto pipe_res = PipeReaderToWriter(reader, writer, out);
    if (pipe_res.is_ok() && reader.TotalSize() && *reader.TotalSize() != out.bytes) {
        pipe_res = Result::Fail(EIO, "source changed during copy: " + source);
    }
    if (pipe_res.is_ok()) {
        pipe_res = writer.Close();
    }
    if (!pipe_res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return pipe_res;
    }

    // O_CREAT honours the umask; set the source bits explicitly.
    if (::chmod(tmp_path.c_str(), mode) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "chmod failed: " + tmp_path + " (" + std::strerror(err) + ")");
    }

    if (::rename(tmp_path.c_str(), target.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "Atomic rename failed: " + target + " (" + std::strerror(err) + ")");
    }

    LogDebug("Replaced %s with %s (%llu bytes, sha256=%s)",
             target.c_str(), source.c_str(), (unsigned long long)out.bytes, out.sha256.c_str());
    return Result::Ok();
}

Result FileReplacer::RemoveIfExists(const std::string& path) {
    if (::unlink(path.c_str()) != 0) {
        const int err = errno;
        if (err == ENOENT) return Result::Ok();
        return Result::Fail(err, "unlink failed: " + path + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

} // namespace selfupdate
