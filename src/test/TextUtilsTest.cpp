#include <cassert>
#include <iostream>
#include "domain/TextUtils.hpp"

using draftlens::domain::TextUtils;

int main() {
    std::cout << "[Test] Starting TextUtils Test..." << std::endl;

    assert(TextUtils::CodePointLength("abc") == 3);
    assert(TextUtils::CodePointLength("中文ab") == 4);
    assert(TextUtils::ByteOffsetOf("中文ab", 2) == 6);
    assert(TextUtils::ByteOffsetOf("中文ab", 10) == 8);
    assert(TextUtils::CodePointIndexOf("中文ab", 6) == 2);
    std::cout << "[PASS] code point indexing" << std::endl;

    assert(TextUtils::IsWhitespace(U' '));
    assert(TextUtils::IsWhitespace(0x3000));
    assert(TextUtils::IsWhitespace(0x00A0));
    assert(!TextUtils::IsWhitespace(U'很'));
    assert(TextUtils::Trim("　 hello \t") == "hello");
    assert(TextUtils::TrimStart("  x ") == "x ");
    assert(TextUtils::IsBlank(" 　\n"));
    assert(!TextUtils::IsBlank(" a "));
    assert(TextUtils::CollapseWhitespace("a  \t b　　c") == "a b c");
    std::cout << "[PASS] whitespace handling" << std::endl;

    auto lines = TextUtils::SplitLines("one\ntwo\n");
    assert(lines.size() == 3);
    assert(lines[0] == "one" && lines[1] == "two" && lines[2].empty());
    assert(TextUtils::SplitLines("").size() == 1);
    std::cout << "[PASS] line splitting" << std::endl;

    assert(TextUtils::NormalizeSeparators("docs\\ch1.md") == "docs/ch1.md");
    assert(TextUtils::EndsWith("/home/u/docs/ch1.md", "docs/ch1.md"));
    assert(!TextUtils::EndsWith("md", "ch1.md"));
    std::cout << "[PASS] path helpers" << std::endl;

    std::cout << "[Test] TextUtils Test completed." << std::endl;
    return 0;
}
