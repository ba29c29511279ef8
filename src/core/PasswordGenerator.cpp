#include "coffer/core/PasswordGenerator.hpp"

#include "coffer/security/SecureRandom.hpp"
#include <string>
#include <utility>
#include <vector>

namespace coffer::core
{
namespace
{

constexpr std::string_view g_upper{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ" };
constexpr std::string_view g_upperDistinct{ "ABCDEFGHJKLMNPQRSTUVWXYZ" };
constexpr std::string_view g_lower{ "abcdefghijklmnopqrstuvwxyz" };
constexpr std::string_view g_lowerDistinct{ "abcdefghijkmnpqrstuvwxyz" };
constexpr std::string_view g_digits{ "0123456789" };
constexpr std::string_view g_digitsDistinct{ "23456789" };
constexpr std::string_view g_symbols{ "!@#$%^&*()-_=+[]{};:'\",.<>/?\\|`~" };
constexpr std::string_view g_symbolsPlain{ "!@#$%^&*-_=+" };

[[nodiscard]] std::vector<std::string_view> enabledClasses(const PasswordGeneratorOptions& o)
{
    std::vector<std::string_view> classes{};
    if (o.uppercase)
    {
        classes.push_back(o.excludeSimilar ? g_upperDistinct : g_upper);
    }
    if (o.lowercase)
    {
        classes.push_back(o.excludeSimilar ? g_lowerDistinct : g_lower);
    }
    if (o.digits)
    {
        classes.push_back(o.excludeSimilar ? g_digitsDistinct : g_digits);
    }
    if (o.symbols)
    {
        classes.push_back(o.excludeAmbiguous ? g_symbolsPlain : g_symbols);
    }
    return classes;
}

[[nodiscard]] bool pick(std::string_view charset, char& out) noexcept
{
    std::size_t index{};
    if (!coffer::security::secureRandomIndex(charset.size(), index))
    {
        return false;
    }
    out = charset[index];
    return true;
}

[[nodiscard]] Result<coffer::security::SecureString, PasswordGenError>
fill(std::string_view charset, std::size_t length, coffer::security::SecureString out)
{
    while (out.size() < length)
    {
        char c{};
        if (!pick(charset, c))
        {
            coffer::security::secureRelease(out);
            return PasswordGenError::RandomFailed;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string_view describe(PasswordGenError e) noexcept
{
    switch (e)
    {
    case PasswordGenError::InvalidLength:
        return "invalid password length";
    case PasswordGenError::NoCharsetEnabled:
        return "no character class enabled";
    case PasswordGenError::RandomFailed:
        return "system random generator failed";
    }
    return "password generation failed";
}

Result<coffer::security::SecureString, PasswordGenError> PasswordGenerator::generate() const
{
    if (m_options.length == 0U || m_options.length > g_generatorMaxLength)
    {
        return PasswordGenError::InvalidLength;
    }
    const auto classes{ enabledClasses(m_options) };
    if (classes.empty())
    {
        return PasswordGenError::NoCharsetEnabled;
    }

    std::string charset{};
    for (const auto c : classes)
    {
        charset += c;
    }

    coffer::security::SecureString out{};
    out.reserve(m_options.length);
    return fill(charset, m_options.length, std::move(out));
}

Result<coffer::security::SecureString, PasswordGenError> PasswordGenerator::generateComplex() const
{
    const auto classes{ enabledClasses(m_options) };
    if (classes.empty())
    {
        return PasswordGenError::NoCharsetEnabled;
    }
    if (m_options.length < g_generatorComplexMinLength || m_options.length > g_generatorMaxLength)
    {
        return PasswordGenError::InvalidLength;
    }

    // One mandatory character per class, the rest from the union, then a Fisher-Yates shuffle.
    coffer::security::SecureString out{};
    out.reserve(m_options.length);
    std::string charset{};
    for (const auto cls : classes)
    {
        char c{};
        if (!pick(cls, c))
        {
            return PasswordGenError::RandomFailed;
        }
        out.push_back(c);
        charset += cls;
    }

    auto filled{ fill(charset, m_options.length, std::move(out)) };
    if (std::holds_alternative<PasswordGenError>(filled))
    {
        return filled;
    }
    auto& password{ std::get<coffer::security::SecureString>(filled) };
    for (std::size_t i{ password.size() - 1U }; i > 0U; --i)
    {
        std::size_t j{};
        if (!coffer::security::secureRandomIndex(i + 1U, j))
        {
            coffer::security::secureRelease(password);
            return PasswordGenError::RandomFailed;
        }
        std::swap(password[i], password[j]);
    }
    return filled;
}

} // namespace coffer::core
