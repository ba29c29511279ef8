#ifndef INCLUDE_COFFER_STORAGE_FILE_FILEVAULTSTOREFACTORY_HPP
#define INCLUDE_COFFER_STORAGE_FILE_FILEVAULTSTOREFACTORY_HPP

#include "coffer/storage/IVaultFileStore.hpp"
#include <memory>

namespace coffer::storage::file
{

// POSIX store: owner-only permissions, temp file + fsync + rename + directory fsync.
[[nodiscard]] std::unique_ptr<coffer::storage::IVaultFileStore> makeFileVaultStore();

} // namespace coffer::storage::file

#endif // INCLUDE_COFFER_STORAGE_FILE_FILEVAULTSTOREFACTORY_HPP
