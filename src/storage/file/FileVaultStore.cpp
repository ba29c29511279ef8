#include "coffer/diagnostics/Log.hpp"
#include "coffer/storage/file/FileVaultStoreFactory.hpp"
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#if defined(__linux__)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace coffer::storage
{

std::string_view describe(IoError e) noexcept
{
    switch (e)
    {
    case IoError::NotFound:
        return "vault file not found";
    case IoError::AccessDenied:
        return "permission denied";
    case IoError::ReadFailed:
        return "could not read vault file";
    case IoError::WriteFailed:
        return "could not write vault file";
    case IoError::TooLarge:
        return "vault file too large";
    }
    return "i/o error";
}

namespace file
{
namespace
{

// A vault of this size is not something this tool produced.
constexpr std::size_t g_maxVaultFileBytes{ 256U * 1024U * 1024U };
constexpr mode_t g_ownerOnlyMode{ S_IRUSR | S_IWUSR };

// Closes on scope exit. Errors from an explicit close() are reported by the caller instead.
class FileDescriptor final
{
public:
    explicit FileDescriptor(int fd) noexcept : m_fd{ fd }
    {
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&&) = delete;
    FileDescriptor& operator=(FileDescriptor&&) = delete;
    ~FileDescriptor()
    {
        if (m_fd >= 0)
        {
            ::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }
    [[nodiscard]] bool valid() const noexcept
    {
        return m_fd >= 0;
    }
    [[nodiscard]] bool close() noexcept
    {
        const int fd{ m_fd };
        m_fd = -1;
        return ::close(fd) == 0;
    }

private:
    int m_fd;
};

[[nodiscard]] IoError classifyErrno(int err, IoError fallback) noexcept
{
    switch (err)
    {
    case ENOENT:
    case ENOTDIR:
        return IoError::NotFound;
    case EACCES:
    case EPERM:
    case EROFS:
        return IoError::AccessDenied;
    default:
        return fallback;
    }
}

void logFailure(const char* what, const std::filesystem::path& path, int err)
{
    coffer::diagnostics::warning(what, " failed for ", path.string(), ": errno ", err);
}

[[nodiscard]] bool writeAll(int fd, std::span<const std::uint8_t> bytes) noexcept
{
    std::size_t written{};
    while (written < bytes.size())
    {
        const ssize_t n{ ::write(fd, bytes.data() + written, bytes.size() - written) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

[[nodiscard]] std::filesystem::path parentOrCurrent(const std::filesystem::path& path)
{
    const auto parent{ path.parent_path() };
    return parent.empty() ? std::filesystem::path{ "." } : parent;
}

class FileVaultStore final : public IVaultFileStore
{
public:
    [[nodiscard]] bool exists(const std::filesystem::path& path) const noexcept override
    {
        struct stat st{};
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
    }

    [[nodiscard]] Result<std::vector<std::uint8_t>, IoError>
    readVaultFile(const std::filesystem::path& path) const override
    {
        FileDescriptor fd{ ::open(path.c_str(), O_RDONLY | O_CLOEXEC) };
        if (!fd.valid())
        {
            const int err{ errno };
            logFailure("open", path, err);
            return classifyErrno(err, IoError::ReadFailed);
        }

        struct stat st{};
        if (::fstat(fd.get(), &st) != 0 || !S_ISREG(st.st_mode))
        {
            return IoError::ReadFailed;
        }
        if (static_cast<std::size_t>(st.st_size) > g_maxVaultFileBytes)
        {
            return IoError::TooLarge;
        }

        std::vector<std::uint8_t> bytes(static_cast<std::size_t>(st.st_size));
        std::size_t got{};
        while (got < bytes.size())
        {
            const ssize_t n{ ::read(fd.get(), bytes.data() + got, bytes.size() - got) };
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            if (n <= 0)
            {
                logFailure("read", path, errno);
                return IoError::ReadFailed;
            }
            got += static_cast<std::size_t>(n);
        }
        return bytes;
    }

    [[nodiscard]] Result<std::monostate, IoError> writeVaultFileAtomic(const std::filesystem::path& path,
                                                                        std::span<const std::uint8_t> bytes) override
    {
        if (bytes.size() > g_maxVaultFileBytes)
        {
            return IoError::TooLarge;
        }

        std::string tempName{ path.string() + ".tmpXXXXXX" };
        FileDescriptor fd{ ::mkostemp(tempName.data(), O_CLOEXEC) };
        if (!fd.valid())
        {
            const int err{ errno };
            logFailure("mkostemp", path, err);
            return classifyErrno(err, IoError::WriteFailed);
        }

        const auto abandon{ [&tempName, &path](const char* what, int err) -> IoError
                            {
                                logFailure(what, path, err);
                                ::unlink(tempName.c_str());
                                return classifyErrno(err, IoError::WriteFailed);
                            } };

        if (::fchmod(fd.get(), g_ownerOnlyMode) != 0)
        {
            return abandon("fchmod", errno);
        }
        if (!writeAll(fd.get(), bytes))
        {
            return abandon("write", errno);
        }
        if (::fsync(fd.get()) != 0)
        {
            return abandon("fsync", errno);
        }
        if (!fd.close())
        {
            return abandon("close", errno);
        }
        if (::rename(tempName.c_str(), path.c_str()) != 0)
        {
            return abandon("rename", errno);
        }

        // The rename itself is durable only once the directory entry is flushed.
        FileDescriptor dir{ ::open(parentOrCurrent(path).c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
        if (!dir.valid() || ::fsync(dir.get()) != 0)
        {
            logFailure("directory fsync", path, errno);
            return IoError::WriteFailed;
        }
        coffer::diagnostics::debug("vault file written: ", path.string(), " (", bytes.size(), " bytes)");
        return std::monostate{};
    }
};

} // namespace

std::unique_ptr<IVaultFileStore> makeFileVaultStore()
{
    return std::make_unique<FileVaultStore>();
}

} // namespace file

} // namespace coffer::storage
