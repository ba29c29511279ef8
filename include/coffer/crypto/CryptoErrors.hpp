#ifndef INCLUDE_COFFER_CRYPTO_CRYPTOERRORS_HPP
#define INCLUDE_COFFER_CRYPTO_CRYPTOERRORS_HPP

#include <stdexcept>
#include <string>

namespace coffer::crypto
{

// Thrown by a provider asked for an AEAD algorithm its backend does not implement.
class AlgorithmUnavailable final : public std::runtime_error
{
public:
    explicit AlgorithmUnavailable(const std::string& what) : std::runtime_error(what)
    {
    }
};

} // namespace coffer::crypto

#endif // INCLUDE_COFFER_CRYPTO_CRYPTOERRORS_HPP
