#include "Tokenizer.hpp"

#include <cctype>
#include <utility>

namespace strongbox::ui::cli
{

std::vector<std::string> Tokenizer::tokenize(std::string_view line)
{
    State state{};
    std::size_t pos{};
    while (pos < line.size())
    {
        switch (state.quote)
        {
        case Quote::None:
            pos += stepUnquoted(state, line, pos);
            break;
        case Quote::Single:
            pos += stepSingle(state, line, pos);
            break;
        case Quote::Double:
            pos += stepDouble(state, line, pos);
            break;
        }
    }

    // An unterminated quote still yields what was typed.
    endWord(state);
    return std::move(state.words);
}

void Tokenizer::endWord(State& state)
{
    if (state.inWord)
    {
        state.words.push_back(std::move(state.word));
    }
    state.word.clear();
    state.inWord = false;
}

std::size_t Tokenizer::stepUnquoted(State& state, std::string_view line, std::size_t pos)
{
    const char c{ line[pos] };
    if (std::isspace(static_cast<unsigned char>(c)) != 0)
    {
        endWord(state);
        return 1U;
    }

    state.inWord = true;
    if (c == '\'')
    {
        state.quote = Quote::Single;
        return 1U;
    }
    if (c == '"')
    {
        state.quote = Quote::Double;
        return 1U;
    }
    if (c == '\\' && pos + 1U < line.size())
    {
        state.word.push_back(line[pos + 1U]);
        return 2U;
    }

    state.word.push_back(c);
    return 1U;
}

std::size_t Tokenizer::stepSingle(State& state, std::string_view line, std::size_t pos)
{
    const char c{ line[pos] };
    if (c == '\'')
    {
        state.quote = Quote::None;
    }
    else
    {
        state.word.push_back(c);
    }
    return 1U;
}

std::size_t Tokenizer::stepDouble(State& state, std::string_view line, std::size_t pos)
{
    const char c{ line[pos] };
    if (c == '"')
    {
        state.quote = Quote::None;
        return 1U;
    }
    if (c == '\\' && pos + 1U < line.size())
    {
        const char next{ line[pos + 1U] };
        if (next == '"' || next == '\\' || next == '$')
        {
            state.word.push_back(next);
            return 2U;
        }
    }

    state.word.push_back(c);
    return 1U;
}

} // namespace strongbox::ui::cli
