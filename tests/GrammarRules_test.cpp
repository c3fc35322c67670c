#include "Session/GrammarRules.hpp"

#include <gtest/gtest.h>

TEST(GrammarRulesTest, CapitalizesWithoutContext) {
    GrammarRules rules("");
    EXPECT_EQ(rules.SetCaseFirstWord("hello world"), "Hello world");
    EXPECT_EQ(rules.SetCaseFirstWord("  hello world  "), "  Hello world  ");
    EXPECT_EQ(rules.SetCaseFirstWord("42 is the answer"), "42 Is the answer");
    EXPECT_EQ(rules.SetCaseFirstWord("..."), "...");
    EXPECT_EQ(rules.SetCaseFirstWord(""), "");
}

TEST(GrammarRulesTest, CapitalizesAfterSentenceEnd) {
    EXPECT_EQ(GrammarRules("It works.").SetCaseFirstWord("wow that is amazing"), "Wow that is amazing");
    EXPECT_EQ(GrammarRules("Really? ").SetCaseFirstWord("yes it is"), "Yes it is");
    EXPECT_EQ(GrammarRules("Stop!").SetCaseFirstWord("hello"), "Hello");
}

TEST(GrammarRulesTest, LowercasesWhenContinuingASentence) {
    EXPECT_EQ(GrammarRules("I went home,").SetCaseFirstWord("And then we went"), "and then we went");
    EXPECT_EQ(GrammarRules("one thing:").SetCaseFirstWord("But first this"), "but first this");
    EXPECT_EQ(GrammarRules("we ate").SetCaseFirstWord("And then we left"), "and then we left");
    EXPECT_EQ(GrammarRules("it was \xE2\x80\x94").SetCaseFirstWord("Quite good"), "quite good");
}

TEST(GrammarRulesTest, PronounIAlwaysCapitalized) {
    EXPECT_EQ(GrammarRules("and then,").SetCaseFirstWord("i am here"), "I am here");
    EXPECT_EQ(GrammarRules("so").SetCaseFirstWord("i'm done"), "I'm done");
    EXPECT_EQ(GrammarRules("so").SetCaseFirstWord("Idle hands"), "idle hands");
}

TEST(GrammarRulesTest, LeadingSpace) {
    EXPECT_EQ(GrammarRules("word").AddLeadingSpaceIfNeeded("Hello"), " Hello");
    EXPECT_EQ(GrammarRules("end.").AddLeadingSpaceIfNeeded("Hello"), " Hello");
    EXPECT_EQ(GrammarRules("(a)").AddLeadingSpaceIfNeeded("Hello"), " Hello");

    EXPECT_EQ(GrammarRules("").AddLeadingSpaceIfNeeded("Hello"), "Hello");
    EXPECT_EQ(GrammarRules("word ").AddLeadingSpaceIfNeeded("Hello"), "Hello");
    EXPECT_EQ(GrammarRules("line\n").AddLeadingSpaceIfNeeded("Hello"), "Hello");
    EXPECT_EQ(GrammarRules("(").AddLeadingSpaceIfNeeded("Hello"), "Hello");
    EXPECT_EQ(GrammarRules("\"").AddLeadingSpaceIfNeeded("Hello"), "Hello");
    EXPECT_EQ(GrammarRules("word").AddLeadingSpaceIfNeeded(""), "");
}

TEST(GrammarRulesTest, ApplyCombinesBoth) {
    EXPECT_EQ(GrammarRules("This is").Apply("Great"), " great");
    EXPECT_EQ(GrammarRules("Done.").Apply("this is great"), " This is great");
    EXPECT_EQ(GrammarRules("").Apply("mary called"), "Mary called");
    EXPECT_EQ(GrammarRules("ctx").GetCursorContext(), "ctx");
}
