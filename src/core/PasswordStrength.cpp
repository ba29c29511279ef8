#include "coffer/core/PasswordStrength.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace coffer::core
{
namespace
{

constexpr std::array<std::string_view, 25> g_commonPasswords{
    "password", "123456",   "password123", "admin",  "qwerty",     "letmein", "welcome",
    "monkey",   "1234567890", "abc123",    "password1", "123456789", "welcome123", "admin123",
    "root",     "toor",     "pass",        "test",   "guest",      "user",    "azerty",
    "motdepasse", "secret", "changeme",    "default",
};

[[nodiscard]] char asciiLower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] bool isCommon(std::string_view password) noexcept
{
    return std::any_of(g_commonPasswords.begin(), g_commonPasswords.end(),
                       [password](std::string_view common) noexcept
                       {
                           return common.size() == password.size() &&
                                  std::equal(common.begin(), common.end(), password.begin(),
                                             [](char a, char b) noexcept { return a == asciiLower(b); });
                       });
}

// Malformed sequences decode byte by byte, each byte standing for itself.
[[nodiscard]] std::vector<char32_t> codePoints(std::string_view p)
{
    std::vector<char32_t> out;
    out.reserve(p.size());
    std::size_t i{};
    while (i < p.size())
    {
        const auto lead{ static_cast<unsigned char>(p[i]) };
        std::size_t extra{};
        char32_t cp{ lead };
        if (lead >= 0xF0U && lead <= 0xF4U)
        {
            extra = 3U;
            cp = lead & 0x07U;
        }
        else if (lead >= 0xE0U && lead <= 0xEFU)
        {
            extra = 2U;
            cp = lead & 0x0FU;
        }
        else if (lead >= 0xC2U && lead <= 0xDFU)
        {
            extra = 1U;
            cp = lead & 0x1FU;
        }

        bool valid{ i + extra < p.size() };
        for (std::size_t k{ 1U }; valid && k <= extra; ++k)
        {
            const auto cont{ static_cast<unsigned char>(p[i + k]) };
            valid = (cont & 0xC0U) == 0x80U;
            cp = (cp << 6U) | (cont & 0x3FU);
        }
        if (extra != 0U && !valid)
        {
            out.push_back(lead);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1U;
    }
    return out;
}

// Three identical characters in a row.
[[nodiscard]] bool hasRepetition(const std::vector<char32_t>& p) noexcept
{
    for (std::size_t i{ 2U }; i < p.size(); ++i)
    {
        if (p[i] == p[i - 1U] && p[i - 1U] == p[i - 2U])
        {
            return true;
        }
    }
    return false;
}

// Three consecutive characters ascending or descending by one, e.g. "abc", "321".
[[nodiscard]] bool hasSequence(const std::vector<char32_t>& p) noexcept
{
    for (std::size_t i{ 2U }; i < p.size(); ++i)
    {
        const auto a{ static_cast<std::int64_t>(p[i - 2U]) };
        const auto b{ static_cast<std::int64_t>(p[i - 1U]) };
        const auto c{ static_cast<std::int64_t>(p[i]) };
        if ((b - a == 1 && c - b == 1) || (a - b == 1 && b - c == 1))
        {
            return true;
        }
    }
    return false;
}

[[nodiscard]] int characterClasses(std::string_view p) noexcept
{
    bool lower{};
    bool upper{};
    bool digit{};
    bool other{};
    for (const char ch : p)
    {
        const auto c{ static_cast<unsigned char>(ch) };
        lower = lower || (c >= 'a' && c <= 'z');
        upper = upper || (c >= 'A' && c <= 'Z');
        digit = digit || (c >= '0' && c <= '9');
        other = other || !((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'));
    }
    return static_cast<int>(lower) + static_cast<int>(upper) + static_cast<int>(digit) + static_cast<int>(other);
}

[[nodiscard]] StrengthLevel levelFor(int score) noexcept
{
    if (score <= 20)
    {
        return StrengthLevel::VeryWeak;
    }
    if (score <= 40)
    {
        return StrengthLevel::Weak;
    }
    if (score <= 60)
    {
        return StrengthLevel::Medium;
    }
    if (score <= 80)
    {
        return StrengthLevel::Strong;
    }
    return StrengthLevel::VeryStrong;
}

} // namespace

PasswordStrength analyzePasswordStrength(std::string_view password)
{
    PasswordStrength result{};
    int score{};

    if (password.size() < 8U)
    {
        result.issues.push_back(StrengthIssue::TooShort);
        result.suggestions.push_back(StrengthSuggestion::UseEightCharacters);
    }
    else
    {
        score += 20;
    }
    score += (password.size() >= 12U) ? 10 : 0;
    score += (password.size() >= 16U) ? 10 : 0;

    switch (characterClasses(password))
    {
    case 1:
        result.issues.push_back(StrengthIssue::SingleCharacterClass);
        result.suggestions.push_back(StrengthSuggestion::MixAllClasses);
        break;
    case 2:
        score += 15;
        result.suggestions.push_back(StrengthSuggestion::AddDigitsOrSymbols);
        break;
    case 3:
        score += 25;
        result.suggestions.push_back(StrengthSuggestion::AddSymbols);
        break;
    case 4:
        score += 35;
        break;
    default:
        break;
    }

    if (isCommon(password))
    {
        score = 0;
        result.issues.push_back(StrengthIssue::CommonPassword);
        result.suggestions.push_back(StrengthSuggestion::UseGenerator);
    }
    const auto characters{ codePoints(password) };
    if (hasRepetition(characters))
    {
        score = std::max(0, score - 15);
        result.issues.push_back(StrengthIssue::RepeatedCharacters);
        result.suggestions.push_back(StrengthSuggestion::AvoidRepeats);
    }
    if (hasSequence(characters))
    {
        score = std::max(0, score - 10);
        result.issues.push_back(StrengthIssue::PredictableSequence);
        result.suggestions.push_back(StrengthSuggestion::AvoidSequences);
    }

    score = std::clamp(score, 0, 100);
    result.score = static_cast<std::uint8_t>(score);
    result.level = levelFor(score);
    return result;
}

std::string_view toString(StrengthLevel level) noexcept
{
    switch (level)
    {
    case StrengthLevel::VeryWeak:
        return "very weak";
    case StrengthLevel::Weak:
        return "weak";
    case StrengthLevel::Medium:
        return "medium";
    case StrengthLevel::Strong:
        return "strong";
    case StrengthLevel::VeryStrong:
        return "very strong";
    }
    return "unknown";
}

std::string_view describe(StrengthIssue issue) noexcept
{
    switch (issue)
    {
    case StrengthIssue::TooShort:
        return "shorter than 8 characters";
    case StrengthIssue::SingleCharacterClass:
        return "uses a single character class";
    case StrengthIssue::CommonPassword:
        return "appears in the common password list";
    case StrengthIssue::RepeatedCharacters:
        return "repeats a character three times in a row";
    case StrengthIssue::PredictableSequence:
        return "contains a sequence such as abc or 321";
    }
    return "unknown issue";
}

std::string_view describe(StrengthSuggestion suggestion) noexcept
{
    switch (suggestion)
    {
    case StrengthSuggestion::UseEightCharacters:
        return "use at least 8 characters";
    case StrengthSuggestion::MixAllClasses:
        return "mix upper and lower case letters, digits and symbols";
    case StrengthSuggestion::AddDigitsOrSymbols:
        return "add digits or symbols";
    case StrengthSuggestion::AddSymbols:
        return "add symbols";
    case StrengthSuggestion::UseGenerator:
        return "use the generator for a unique password";
    case StrengthSuggestion::AvoidRepeats:
        return "avoid repeats such as aaa or 111";
    case StrengthSuggestion::AvoidSequences:
        return "avoid sequences such as abc or 123";
    }
    return "unknown suggestion";
}

} // namespace coffer::core
