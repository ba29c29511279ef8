#include "coffer/core/VaultErrors.hpp"

namespace coffer::core
{

UnlockError classifyUnlockFailure(UnlockCause cause) noexcept
{
    if (const auto* cipher{ std::get_if<CipherError>(&cause) };
        cipher != nullptr && *cipher == CipherError::AuthenticationFailed)
    {
        return UnlockError{ .kind = UnlockErrorKind::WrongPassphraseOrCorrupt, .cause = cause };
    }
    return UnlockError{ .kind = UnlockErrorKind::UnsupportedFormat, .cause = cause };
}

std::string_view describe(DerivationError e) noexcept
{
    switch (e)
    {
    case DerivationError::InvalidParams:
        return "invalid key derivation parameters";
    case DerivationError::WeakParams:
        return "key derivation parameters below the safety floor";
    case DerivationError::BackendFailure:
        return "key derivation backend failure";
    }
    return "key derivation error";
}

std::string_view describe(CodecError e) noexcept
{
    switch (e)
    {
    case CodecError::Malformed:
        return "malformed vault payload";
    case CodecError::UnknownVersion:
        return "unknown vault payload version";
    case CodecError::DuplicateId:
        return "duplicate entry id in vault payload";
    }
    return "vault payload error";
}

std::string_view describe(CipherError e) noexcept
{
    switch (e)
    {
    case CipherError::AuthenticationFailed:
        return "authentication failed";
    case CipherError::MalformedEnvelope:
        return "malformed vault envelope";
    case CipherError::UnsupportedVersion:
        return "unsupported vault envelope version";
    case CipherError::AlgorithmUnavailable:
        return "encryption algorithm unavailable in this build";
    case CipherError::BackendFailure:
        return "encryption backend failure";
    }
    return "cipher error";
}

std::string_view describe(MutationError e) noexcept
{
    switch (e)
    {
    case MutationError::Locked:
        return "vault is locked";
    case MutationError::NotFound:
        return "no entry with that id";
    case MutationError::InvalidText:
        return "text is not valid UTF-8";
    case MutationError::RandomFailed:
        return "system random generator failed";
    }
    return "mutation error";
}

std::string_view describe(const UnlockError& e) noexcept
{
    switch (e.kind)
    {
    case UnlockErrorKind::WrongPassphraseOrCorrupt:
        return "cannot open vault";
    case UnlockErrorKind::UnsupportedFormat:
        return "unsupported or future vault format";
    }
    return "cannot open vault";
}

std::string_view describe(const KeySetupError& e) noexcept
{
    switch (e.kind)
    {
    case KeySetupErrorKind::Locked:
        return "vault is locked";
    case KeySetupErrorKind::RandomFailed:
        return "system random generator failed";
    case KeySetupErrorKind::DerivationFailed:
        return e.cause ? describe(*e.cause) : "key derivation failed";
    case KeySetupErrorKind::AlgorithmUnavailable:
        return "encryption algorithm unavailable in this build";
    }
    return "key setup failed";
}

std::string_view describe(const PersistError& e) noexcept
{
    switch (e.kind)
    {
    case PersistErrorKind::Locked:
        return "vault is locked";
    case PersistErrorKind::SealFailed:
        return e.cause ? describe(*e.cause) : "encryption failed";
    }
    return "persist failed";
}

std::string_view causeName(const UnlockCause& cause) noexcept
{
    if (const auto* d{ std::get_if<DerivationError>(&cause) }; d != nullptr)
    {
        switch (*d)
        {
        case DerivationError::InvalidParams:
            return "DerivationError::InvalidParams";
        case DerivationError::WeakParams:
            return "DerivationError::WeakParams";
        case DerivationError::BackendFailure:
            return "DerivationError::BackendFailure";
        }
    }
    if (const auto* c{ std::get_if<CipherError>(&cause) }; c != nullptr)
    {
        switch (*c)
        {
        case CipherError::AuthenticationFailed:
            return "CipherError::AuthenticationFailed";
        case CipherError::MalformedEnvelope:
            return "CipherError::MalformedEnvelope";
        case CipherError::UnsupportedVersion:
            return "CipherError::UnsupportedVersion";
        case CipherError::AlgorithmUnavailable:
            return "CipherError::AlgorithmUnavailable";
        case CipherError::BackendFailure:
            return "CipherError::BackendFailure";
        }
    }
    if (const auto* k{ std::get_if<CodecError>(&cause) }; k != nullptr)
    {
        switch (*k)
        {
        case CodecError::Malformed:
            return "CodecError::Malformed";
        case CodecError::UnknownVersion:
            return "CodecError::UnknownVersion";
        case CodecError::DuplicateId:
            return "CodecError::DuplicateId";
        }
    }
    return "unknown";
}

} // namespace coffer::core
