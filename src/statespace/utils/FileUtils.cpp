#include "utils/FileUtils.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace STS::Utils {

namespace {

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "fsync failed"});
    }
    return {};
}

} // namespace

auto toMillis(std::chrono::system_clock::time_point tp) -> std::uint64_t {
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    return static_cast<std::uint64_t>(duration.count());
}

auto toUnixSeconds(std::chrono::system_clock::time_point tp) -> double {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

auto generateUuid() -> std::string {
    std::random_device                           rd;
    std::uniform_int_distribution<std::uint64_t> dist;
    auto                                         high = dist(rd);
    auto                                         low  = dist(rd);
    // Version 4, variant 1.
    high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    low  = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    oss << std::setw(8) << (high >> 32) << '-';
    oss << std::setw(4) << ((high >> 16) & 0xFFFF) << '-';
    oss << std::setw(4) << (high & 0xFFFF) << '-';
    oss << std::setw(4) << (low >> 48) << '-';
    oss << std::setw(12) << (low & 0xFFFFFFFFFFFFull);
    return oss.str();
}

auto ensureParentDirectory(std::filesystem::path const& path) -> Expected<void> {
    auto parent = path.parent_path();
    if (parent.empty())
        return {};
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoFailure,
                                     "Failed to create directory " + parent.string() + ": " + ec.message()});
    }
    return {};
}

auto writeFileAtomic(std::filesystem::path const& path,
                     std::span<const std::byte> data,
                     bool fsyncData) -> Expected<void> {
    if (auto dir = ensureParentDirectory(path); !dir) {
        return dir;
    }

    // Unique per call so concurrent writers of the same file never share a temp file.
    auto tmpPath = path;
    tmpPath += ".tmp-" + generateUuid();
    auto discard = [&tmpPath](Error error) -> Expected<void> {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return std::unexpected(std::move(error));
    };

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to open temp file " + tmpPath.string()});
    }

    std::size_t totalWritten = 0;
    while (totalWritten < data.size()) {
        auto const* ptr       = data.data() + static_cast<std::ptrdiff_t>(totalWritten);
        auto const  remaining = data.size() - totalWritten;
        auto        written   = ::write(fd, reinterpret_cast<void const*>(ptr), remaining);
        if (written <= 0) {
            ::close(fd);
            return discard(Error{Error::Code::IoFailure, "Failed to write temp file " + tmpPath.string()});
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            ::close(fd);
            return discard(sync.error());
        }
    }

    if (::close(fd) != 0) {
        return discard(Error{Error::Code::IoFailure, "Failed to close temp file " + tmpPath.string()});
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        return discard(Error{Error::Code::IoFailure, "Failed to rename temp file to " + path.string()});
    }
    return {};
}

auto writeTextFileAtomic(std::filesystem::path const& path,
                         std::string_view text,
                         bool fsyncData) -> Expected<void> {
    auto span = std::as_bytes(std::span(text.data(), text.size()));
    return writeFileAtomic(path, span, fsyncData);
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read file " + path.string()});
    }
    return oss.str();
}

auto isContainedRelativePath(std::string_view relative) -> bool {
    if (relative.empty())
        return false;
    std::filesystem::path p{relative};
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory())
        return false;
    for (auto const& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

} // namespace STS::Utils
