#include "CommandLine.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

namespace coffer::ui::cli
{

std::optional<std::vector<std::string>> splitCommandLine(std::string_view line)
{
    enum class Mode
    {
        None,
        Single,
        Double
    };

    std::vector<std::string> words{};
    std::string current{};
    bool started{ false };
    Mode mode{ Mode::None };

    for (std::size_t i{ 0 }; i < line.size(); ++i)
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1U < line.size() };

        switch (mode)
        {
        case Mode::Single:
            if (c == '\'')
            {
                mode = Mode::None;
            }
            else
            {
                current.push_back(c);
            }
            break;
        case Mode::Double:
            if (c == '"')
            {
                mode = Mode::None;
            }
            else if (c == '\\' && hasNext && (line[i + 1U] == '"' || line[i + 1U] == '\\'))
            {
                current.push_back(line[++i]);
            }
            else
            {
                current.push_back(c);
            }
            break;
        case Mode::None:
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                if (started)
                {
                    words.push_back(std::move(current));
                    current.clear();
                    started = false;
                }
                continue;
            }
            started = true;
            if (c == '\'')
            {
                mode = Mode::Single;
            }
            else if (c == '"')
            {
                mode = Mode::Double;
            }
            else if (c == '\\' && hasNext)
            {
                current.push_back(line[++i]);
            }
            else
            {
                current.push_back(c);
            }
            break;
        }
    }

    if (mode != Mode::None)
    {
        return std::nullopt;
    }
    if (started)
    {
        words.push_back(std::move(current));
    }
    return words;
}

} // namespace coffer::ui::cli
