#ifndef INCLUDE_COFFER_CORE_VAULTERRORS_HPP
#define INCLUDE_COFFER_CORE_VAULTERRORS_HPP

#include "coffer/core/Result.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace coffer::core
{

enum class DerivationError : std::uint8_t
{
    InvalidParams,
    WeakParams,
    BackendFailure,
};

enum class CodecError : std::uint8_t
{
    Malformed,
    UnknownVersion,
    DuplicateId,
};

enum class CipherError : std::uint8_t
{
    AuthenticationFailed,
    MalformedEnvelope,
    UnsupportedVersion,
    AlgorithmUnavailable,
    BackendFailure,
};

enum class MutationError : std::uint8_t
{
    Locked,
    NotFound,
    InvalidText,
    RandomFailed,
};

enum class UnlockErrorKind : std::uint8_t
{
    WrongPassphraseOrCorrupt,
    UnsupportedFormat,
};

using UnlockCause = std::variant<DerivationError, CipherError, CodecError>;

struct UnlockError final
{
    UnlockErrorKind kind{ UnlockErrorKind::UnsupportedFormat };
    UnlockCause cause{ CipherError::MalformedEnvelope };
};

enum class KeySetupErrorKind : std::uint8_t
{
    Locked,
    RandomFailed,
    DerivationFailed,
    AlgorithmUnavailable,
};

// Failure to establish a key for a new vault or a new passphrase.
struct KeySetupError final
{
    KeySetupErrorKind kind{ KeySetupErrorKind::DerivationFailed };
    std::optional<DerivationError> cause;
};

enum class PersistErrorKind : std::uint8_t
{
    Locked,
    SealFailed,
};

struct PersistError final
{
    PersistErrorKind kind{ PersistErrorKind::SealFailed };
    std::optional<CipherError> cause;
};

[[nodiscard]] UnlockError classifyUnlockFailure(UnlockCause cause) noexcept;

[[nodiscard]] std::string_view describe(DerivationError e) noexcept;
[[nodiscard]] std::string_view describe(CodecError e) noexcept;
[[nodiscard]] std::string_view describe(CipherError e) noexcept;
[[nodiscard]] std::string_view describe(MutationError e) noexcept;
[[nodiscard]] std::string_view describe(const UnlockError& e) noexcept;
[[nodiscard]] std::string_view describe(const KeySetupError& e) noexcept;
[[nodiscard]] std::string_view describe(const PersistError& e) noexcept;

// Short identifier of the lower-level cause, for logs.
[[nodiscard]] std::string_view causeName(const UnlockCause& cause) noexcept;

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTERRORS_HPP
