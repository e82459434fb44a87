#ifndef NOPASSPLZ_UI_CLI_TOKENIZER_HPP
#define NOPASSPLZ_UI_CLI_TOKENIZER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace nopassplz::ui::cli
{

// Splits a shell line into words with POSIX-like quoting: '...' is literal, "..." honours
// \" \\ \$ \` escapes, and a bare backslash escapes the next character.
class Tokenizer
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

    struct Word
    {
        std::string text;
        bool started{ false };

        void append(char c)
        {
            text.push_back(c);
            started = true;
        }
    };

    [[nodiscard]] static bool isDoubleQuoteEscapable(char c) noexcept;
    static void flush(Word& word, std::vector<std::string>& out);
};

} // namespace nopassplz::ui::cli

#endif // NOPASSPLZ_UI_CLI_TOKENIZER_HPP
