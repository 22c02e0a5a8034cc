#include "pch.h"
#include "../../src/Logic/PlanEngine.h"
#include <string>
#include <vector>

TEST(PlanEngineSanitize, ReplacesBadCharactersWithSingleReplacement)
{
    EXPECT_EQ(PlanEngine::Sanitize("bad:name?.txt", ":?", "_"), "bad_name_.txt");
    EXPECT_EQ(PlanEngine::Sanitize("a*b.txt", "*", "-"), "a-b.txt");
}

TEST(PlanEngineSanitize, DeletesBadCharactersWithoutReplacement)
{
    EXPECT_EQ(PlanEngine::Sanitize("a#b%c.txt", PlanEngine::DefaultBadChars, ""), "abc.txt");
    // Anything longer than one character is not a replacement
    EXPECT_EQ(PlanEngine::Sanitize("a:b", ":", "xy"), "ab");
}

TEST(PlanEngineSanitize, CollapsesWhitespaceAndUnderscores)
{
    EXPECT_EQ(PlanEngine::Sanitize("  my   file\tname .txt", ":", ""), "my_file_name_.txt");
    EXPECT_EQ(PlanEngine::Sanitize("a__b___c.txt", ":", ""), "a_b_c.txt");
    EXPECT_EQ(PlanEngine::Sanitize("a _ b.txt", ":", ""), "a_b.txt");
}

TEST(PlanEngineSanitize, GuardsReservedDeviceNames)
{
    EXPECT_EQ(PlanEngine::Sanitize("con.txt", PlanEngine::DefaultBadChars, ""), "con_.txt");
    EXPECT_EQ(PlanEngine::Sanitize("CON", PlanEngine::DefaultBadChars, ""), "CON_");
    EXPECT_EQ(PlanEngine::Sanitize("nul.tar.gz", PlanEngine::DefaultBadChars, ""), "nul_.tar.gz");
    EXPECT_EQ(PlanEngine::Sanitize("Lpt9.log", PlanEngine::DefaultBadChars, ""), "Lpt9_.log");
    EXPECT_EQ(PlanEngine::Sanitize("console.txt", PlanEngine::DefaultBadChars, ""), "console.txt");
    EXPECT_EQ(PlanEngine::Sanitize("com10.txt", PlanEngine::DefaultBadChars, ""), "com10.txt");
}

TEST(PlanEngineSanitize, NeverReturnsEmpty)
{
    EXPECT_EQ(PlanEngine::Sanitize("", ":", "_"), "_");
    EXPECT_EQ(PlanEngine::Sanitize("???", "?", ""), "_");
    EXPECT_EQ(PlanEngine::Sanitize("   ", ":", ""), "_");
}

TEST(PlanEngineSanitize, NeverReturnsDotNames)
{
    EXPECT_EQ(PlanEngine::Sanitize("n.o", "no", ""), "_");
    EXPECT_EQ(PlanEngine::Sanitize("a", "a ", "."), "_");
    EXPECT_EQ(PlanEngine::Sanitize("a.b", "ab", ""), "_");
    EXPECT_EQ(PlanEngine::Sanitize("x:y", ":", "."), "x.y");
    EXPECT_EQ(PlanEngine::Sanitize(PlanEngine::Sanitize("n.o", "no", ""), "no", ""), "_");
}

TEST(PlanEngineSanitize, HandlesMultiByteCharacters)
{
    EXPECT_EQ(PlanEngine::Sanitize("caf\xC3\xA9\xE2\x98\x85.txt", "\xE2\x98\x85", "_"), "caf\xC3\xA9_.txt");
    EXPECT_EQ(PlanEngine::Sanitize("a:b", ":", "\xC3\xA9"), "a\xC3\xA9" "b");
    EXPECT_EQ(PlanEngine::CountCodePoints("\xC3\xA9"), 1u);
    EXPECT_EQ(PlanEngine::CountCodePoints("ab"), 2u);
    EXPECT_EQ(PlanEngine::CountCodePoints(""), 0u);
}

TEST(PlanEngineSanitize, IsIdempotent)
{
    struct Case
    {
        std::string name;
        std::string badChars;
        std::string replacement;
    };
    const std::vector<Case> cases = {
        {"bad:name?.txt", ":?", "_"},
        {"  leading and trailing  ", PlanEngine::DefaultBadChars, ""},
        {"a b", "_", "-"}, // Collapsing produces a bad character
        {"a b", "_", ""},
        {"", "_", ""},
        {"aux .txt", PlanEngine::DefaultBadChars, ""},
        {"x<>y|z.md", PlanEngine::DefaultBadChars, "."},
        {"..hidden..", ".", "_"},
        {"prn", "", ""},
    };

    for (const auto &c : cases)
    {
        const std::string once = PlanEngine::Sanitize(c.name, c.badChars, c.replacement);
        EXPECT_EQ(PlanEngine::Sanitize(once, c.badChars, c.replacement), once) << "input: '" << c.name << "'";
        EXPECT_FALSE(once.empty()) << "input: '" << c.name << "'";
    }
}
