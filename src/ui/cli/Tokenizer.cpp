#include "Tokenizer.hpp"

#include <cctype>
#include <cstddef>

namespace nopassplz::ui::cli
{

std::vector<std::string> Tokenizer::tokenize(std::string_view line)
{
    std::vector<std::string> out{};
    Word word{};
    Quote quote{ Quote::None };

    std::size_t i{ 0 };
    while (i < line.size())
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1 < line.size() };

        switch (quote)
        {
        case Quote::Single:
            if (c == '\'')
            {
                quote = Quote::None;
            }
            else
            {
                word.append(c);
            }
            break;

        case Quote::Double:
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && hasNext && isDoubleQuoteEscapable(line[i + 1]))
            {
                word.append(line[i + 1]);
                ++i;
            }
            else
            {
                word.append(c);
            }
            break;

        case Quote::None:
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                flush(word, out);
            }
            else if (c == '\'' || c == '"')
            {
                // An empty quoted pair still yields a (blank) word.
                quote = (c == '\'') ? Quote::Single : Quote::Double;
                word.started = true;
            }
            else if (c == '\\' && hasNext)
            {
                word.append(line[i + 1]);
                ++i;
            }
            else
            {
                word.append(c);
            }
            break;
        }
        ++i;
    }

    // An unterminated quote keeps whatever was collected.
    flush(word, out);
    return out;
}

bool Tokenizer::isDoubleQuoteEscapable(char c) noexcept
{
    return c == '"' || c == '\\' || c == '$' || c == '`';
}

void Tokenizer::flush(Word& word, std::vector<std::string>& out)
{
    if (word.started)
    {
        out.push_back(std::move(word.text));
    }
    word.text.clear();
    word.started = false;
}

} // namespace nopassplz::ui::cli
