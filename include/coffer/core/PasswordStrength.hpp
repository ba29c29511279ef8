#ifndef INCLUDE_COFFER_CORE_PASSWORDSTRENGTH_HPP
#define INCLUDE_COFFER_CORE_PASSWORDSTRENGTH_HPP

#include <cstdint>
#include <string_view>
#include <vector>

namespace coffer::core
{

enum class StrengthLevel : std::uint8_t
{
    VeryWeak,
    Weak,
    Medium,
    Strong,
    VeryStrong,
};

enum class StrengthIssue : std::uint8_t
{
    TooShort,
    SingleCharacterClass,
    CommonPassword,
    RepeatedCharacters,
    PredictableSequence,
};

enum class StrengthSuggestion : std::uint8_t
{
    UseEightCharacters,
    MixAllClasses,
    AddDigitsOrSymbols,
    AddSymbols,
    UseGenerator,
    AvoidRepeats,
    AvoidSequences,
};

struct PasswordStrength final
{
    std::uint8_t score{};
    StrengthLevel level{ StrengthLevel::VeryWeak };
    std::vector<StrengthIssue> issues;
    std::vector<StrengthSuggestion> suggestions;
};

// Heuristic score in [0, 100]: length tiers and character-class mix add points,
// a common-password hit zeroes the score, repeats and sequences subtract.
// Length counts bytes; repeats and sequences are found on UTF-8 code points.
[[nodiscard]] PasswordStrength analyzePasswordStrength(std::string_view password);

[[nodiscard]] std::string_view toString(StrengthLevel level) noexcept;
[[nodiscard]] std::string_view describe(StrengthIssue issue) noexcept;
[[nodiscard]] std::string_view describe(StrengthSuggestion suggestion) noexcept;

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_PASSWORDSTRENGTH_HPP
