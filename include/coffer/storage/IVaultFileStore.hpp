#ifndef INCLUDE_COFFER_STORAGE_IVAULTFILESTORE_HPP
#define INCLUDE_COFFER_STORAGE_IVAULTFILESTORE_HPP

#include "coffer/core/Result.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace coffer::storage
{

enum class IoError : std::uint8_t
{
    NotFound,
    AccessDenied,
    ReadFailed,
    WriteFailed,
    TooLarge,
};

[[nodiscard]] std::string_view describe(IoError e) noexcept;

// Whole-file access to the encrypted vault. Contents are opaque ciphertext at this layer.
class IVaultFileStore
{
public:
    IVaultFileStore() = default;
    IVaultFileStore(const IVaultFileStore&) = delete;
    IVaultFileStore& operator=(const IVaultFileStore&) = delete;
    IVaultFileStore(IVaultFileStore&&) = delete;
    IVaultFileStore& operator=(IVaultFileStore&&) = delete;
    virtual ~IVaultFileStore() = default;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& path) const noexcept = 0;

    [[nodiscard]] virtual Result<std::vector<std::uint8_t>, IoError>
    readVaultFile(const std::filesystem::path& path) const = 0;

    // Either the old contents or the new contents survive a crash, never a mix.
    [[nodiscard]] virtual Result<std::monostate, IoError> writeVaultFileAtomic(const std::filesystem::path& path,
                                                                                std::span<const std::uint8_t> bytes) = 0;
};

} // namespace coffer::storage

#endif // INCLUDE_COFFER_STORAGE_IVAULTFILESTORE_HPP
