#include "ConsoleUtils.hpp"
#include "strongbox/security/SecureString.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>

#include <sys/mman.h>

namespace
{

// Swaps std::cin / std::cout for string streams for the lifetime of the object.
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
    }
};

} // namespace

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    // Unprivileged runners may be refused; only the call itself matters here.
    (void)strongbox::ui::cli::lockProcessMemory();
    munlockall();
    SUCCEED();
}

TEST(ConsoleUtilsTest, ReadSecretLineConsumesOneLineAndPrintsPrompt)
{
    StreamRedirector redirect("hunter2\nnext line\n");

    const auto secret{ strongbox::ui::cli::readSecretLine("Snapshot Password: ") };

    EXPECT_EQ(strongbox::security::asStringView(secret), "hunter2");
    EXPECT_EQ(redirect.output.str(), "Snapshot Password: \n");

    std::string rest{};
    std::getline(std::cin, rest);
    EXPECT_EQ(rest, "next line");
}

TEST(ConsoleUtilsTest, ReadSecretLineHandlesEmptyInput)
{
    StreamRedirector redirect("\n");
    EXPECT_TRUE(strongbox::ui::cli::readSecretLine("Pass: ").empty());
}
