#include "ConsoleUtils.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

#if defined(__linux__)
#include <sys/mman.h>
#endif

namespace
{

struct StreamRedirector
{
    std::streambuf* oldCin;
    std::streambuf* oldCout;
    std::stringstream input;
    std::stringstream output;

    explicit StreamRedirector(const std::string& inputData) : oldCin(std::cin.rdbuf()), oldCout(std::cout.rdbuf())
    {
        input << inputData;
        std::cin.rdbuf(input.rdbuf());
        std::cout.rdbuf(output.rdbuf());
    }

    StreamRedirector(const StreamRedirector&) = delete;
    StreamRedirector& operator=(const StreamRedirector&) = delete;

    ~StreamRedirector()
    {
        std::cin.rdbuf(oldCin);
        std::cout.rdbuf(oldCout);
        std::cin.clear();
    }
};

} // namespace

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    // Unprivileged runners may refuse mlockall; only the call itself is checked.
    EXPECT_NO_THROW((void)nopassplz::ui::cli::lockProcessMemory());

#if defined(__linux__)
    munlockall();
#endif
}

TEST(ConsoleUtilsTest, ReadPasswordConsumesInputAndPrintsPrompt)
{
    StreamRedirector redirect("secret123\n");

    const std::string prompt = "Enter Password: ";

    auto result = nopassplz::ui::cli::readPassword(prompt);

    EXPECT_EQ(nopassplz::security::asStringView(result), "secret123");
    EXPECT_EQ(redirect.output.str(), prompt + "\n");
}

TEST(ConsoleUtilsTest, ReadPasswordKeepsMultibyteCharacters)
{
    StreamRedirector redirect("p\xC3\xA4ss w\xC3\xB6rd\n");

    auto result = nopassplz::ui::cli::readPassword("Password: ");

    EXPECT_EQ(nopassplz::security::asStringView(result), "p\xC3\xA4ss w\xC3\xB6rd");
}

TEST(ConsoleUtilsTest, ReadPasswordHandlesEmptyInput)
{
    StreamRedirector redirect("\n");

    auto result = nopassplz::ui::cli::readPassword("Pass: ");

    EXPECT_TRUE(nopassplz::security::asStringView(result).empty());
}

TEST(ConsoleUtilsTest, ReadPasswordHandlesEof)
{
    StreamRedirector redirect("");

    auto result = nopassplz::ui::cli::readPassword("Pass: ");

    EXPECT_TRUE(nopassplz::security::asStringView(result).empty());
}
