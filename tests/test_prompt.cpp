#include <gtest/gtest.h>
#include "ui/prompt.hpp"

#include <sstream>

TEST(PrompterTest, ReadLinePrintsPromptAndStripsCarriageReturn) {
    std::istringstream in("8080\r\nsecond\n");
    std::ostringstream out;
    Prompter p(in, out);

    std::string answer;
    ASSERT_TRUE(p.read_line("Port: ", answer));
    EXPECT_EQ(answer, "8080");
    ASSERT_TRUE(p.read_line("Again: ", answer));
    EXPECT_EQ(answer, "second");
    EXPECT_FALSE(p.read_line("Gone: ", answer));
    EXPECT_TRUE(answer.empty());
    EXPECT_EQ(out.str(), "Port: Again: Gone: ");
}

TEST(PrompterTest, AskFallsBackOnEmptyAnswer) {
    std::istringstream in("\noperator\n");
    std::ostringstream out;
    Prompter p(in, out);

    EXPECT_EQ(p.ask("User: ", "admin"), "admin");
    EXPECT_EQ(p.ask("User: ", "admin"), "operator");
    EXPECT_EQ(p.ask("User: ", "admin"), "admin");  // end of input
}

TEST(PrompterTest, AskSecretEndsLine) {
    std::istringstream in("hunter2\n\n");
    std::ostringstream out;
    Prompter p(in, out);

    EXPECT_EQ(p.ask_secret("Password: ", "admin"), "hunter2");
    EXPECT_EQ(p.ask_secret("Password: ", "admin"), "admin");
    EXPECT_EQ(out.str(), "Password: \nPassword: \n");
}

TEST(PrompterTest, ConfirmAcceptsOnlyY) {
    std::istringstream in("y\nY\nyes\nn\n\n");
    std::ostringstream out;
    Prompter p(in, out);

    EXPECT_TRUE(p.confirm("? "));
    EXPECT_TRUE(p.confirm("? "));
    EXPECT_FALSE(p.confirm("? "));
    EXPECT_FALSE(p.confirm("? "));
    EXPECT_FALSE(p.confirm("? "));
    EXPECT_FALSE(p.confirm("? "));  // end of input
}

TEST(PrompterTest, WaitForKeyConsumesOneLine) {
    std::istringstream in("anything\n7\n");
    std::ostringstream out;
    Prompter p(in, out);

    p.wait_for_key("Press any key...");
    std::string next;
    ASSERT_TRUE(p.read_line("", next));
    EXPECT_EQ(next, "7");
    EXPECT_EQ(out.str().find("Press any key..."), 0u);
}
