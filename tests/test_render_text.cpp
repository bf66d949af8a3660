#include "snaptext/render/text.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using namespace snaptext::render;

void test_indent_every_line() {
    TEST_EXPECT_EQ(indent("a\nb"), "    a\n    b");
    TEST_EXPECT_EQ(indent("a\nb\n"), "    a\n    b\n");
    TEST_EXPECT_EQ(indent("a", 2), "        a");
    TEST_EXPECT_EQ(indent(""), "");
}

void test_indent_keeps_blank_lines_empty() {
    TEST_EXPECT_EQ(indent("a\n\nb\n\n"), "    a\n\n    b\n\n");
    TEST_EXPECT_EQ(indent("\n"), "\n");
}

void test_indent_treats_carriage_return_as_line_end() {
    TEST_EXPECT_EQ(indent("a\rb"), "    a\r    b");
    TEST_EXPECT_EQ(indent("a\r\nb"), "    a\r\n    b");
    TEST_EXPECT_EQ(normalize_newlines(indent("a\r\nb\rc")), "    a\n    b\n    c");
}

void test_divider() {
    std::string out = "x\n";
    append_divider(out);
    TEST_EXPECT_EQ(out, "x\n" + std::string(65, '-') + "\n");
}

void test_join() {
    TEST_EXPECT_EQ(join({}, "\n"), "");
    TEST_EXPECT_EQ(join({"a"}, "\n"), "a");
    TEST_EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
}

void test_trim_trailing_newline() {
    TEST_EXPECT_EQ(trim_trailing_newline("a\nb\n"), "a\nb");
    TEST_EXPECT_EQ(trim_trailing_newline("a\n\n"), "a\n");
    TEST_EXPECT_EQ(trim_trailing_newline("a"), "a");
    TEST_EXPECT_EQ(trim_trailing_newline(""), "");
}

void test_normalize_newlines() {
    TEST_EXPECT_EQ(normalize_newlines("a\r\nb\rc\nd"), "a\nb\nc\nd");
    TEST_EXPECT_EQ(normalize_newlines("\r\r\n"), "\n\n");
    TEST_EXPECT_EQ(normalize_newlines("\r"), "\n");
    TEST_EXPECT_EQ(normalize_newlines("plain"), "plain");
}

} // namespace

int main() {
    test_indent_every_line();
    test_indent_keeps_blank_lines_empty();
    test_indent_treats_carriage_return_as_line_end();
    test_divider();
    test_join();
    test_trim_trailing_newline();
    test_normalize_newlines();
    return snaptext::tests::run_and_report();
}
