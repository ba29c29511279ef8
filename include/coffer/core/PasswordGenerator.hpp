#ifndef INCLUDE_COFFER_CORE_PASSWORDGENERATOR_HPP
#define INCLUDE_COFFER_CORE_PASSWORDGENERATOR_HPP

#include "coffer/core/Result.hpp"
#include "coffer/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace coffer::core
{

constexpr std::size_t g_generatorDefaultLength{ 16U };
constexpr std::size_t g_generatorMaxLength{ 1024U };
constexpr std::size_t g_generatorComplexMinLength{ 8U };

enum class PasswordGenError : std::uint8_t
{
    InvalidLength,
    NoCharsetEnabled,
    RandomFailed,
};

[[nodiscard]] std::string_view describe(PasswordGenError e) noexcept;

struct PasswordGeneratorOptions final
{
    std::size_t length{ g_generatorDefaultLength };
    bool uppercase{ true };
    bool lowercase{ true };
    bool digits{ true };
    bool symbols{ true };
    // Drops I, O, l, o, 0 and 1.
    bool excludeSimilar{ false };
    // Restricts symbols to !@#$%^&*-_=+.
    bool excludeAmbiguous{ false };
};

class PasswordGenerator final
{
public:
    PasswordGenerator() = default;
    explicit PasswordGenerator(PasswordGeneratorOptions options) noexcept : m_options{ options }
    {
    }

    [[nodiscard]] const PasswordGeneratorOptions& options() const noexcept
    {
        return m_options;
    }

    // Every character drawn uniformly from the union of enabled classes.
    [[nodiscard]] Result<coffer::security::SecureString, PasswordGenError> generate() const;

    // Like generate(), but guarantees at least one character of every enabled class. Needs length >= 8.
    [[nodiscard]] Result<coffer::security::SecureString, PasswordGenError> generateComplex() const;

private:
    PasswordGeneratorOptions m_options{};
};

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_PASSWORDGENERATOR_HPP
