#ifndef STRONGBOX_UI_CLI_TOKENIZER_HPP
#define STRONGBOX_UI_CLI_TOKENIZER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace strongbox::ui::cli
{

// Shell-style word splitting: whitespace separates words, single quotes are literal,
// double quotes allow \" \\ and \$ escapes, a backslash outside quotes escapes the next character.
class Tokenizer final
{
public:
    [[nodiscard]] static std::vector<std::string> tokenize(std::string_view line);

private:
    enum class Quote
    {
        None,
        Single,
        Double
    };

    struct State
    {
        std::vector<std::string> words;
        std::string word;
        bool inWord{ false };
        Quote quote{ Quote::None };
    };

    static void endWord(State& state);

    // Each returns the number of characters consumed at `pos`.
    static std::size_t stepUnquoted(State& state, std::string_view line, std::size_t pos);
    static std::size_t stepSingle(State& state, std::string_view line, std::size_t pos);
    static std::size_t stepDouble(State& state, std::string_view line, std::size_t pos);
};

} // namespace strongbox::ui::cli

#endif // STRONGBOX_UI_CLI_TOKENIZER_HPP
