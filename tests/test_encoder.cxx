#include <cassert>
#include <string>

#include "helpers.hxx"

using namespace tapec;

static std::string encoded(const std::string& code, const ExtensionSet& ext = ExtensionSet{}) {
    return spell(encode(sanitize(code, ext), ext));
}

static void test_sanitize() {
    ExtensionSet none;
    assert(sanitize("a+b-c>d<[e]f.g,h", none) == "+-><[].,");
    assert(sanitize("hello world\n", none).empty());
    assert(sanitize("+Y-", none) == "+-");

    ExtensionSet fork;
    assert(fork.add(kForkSymbol, forkExtension()));
    assert(sanitize("+Y-y", fork) == "+Y-");
}

static void test_idioms() {
    assert(encoded("+[-]>[<]<[>]+[+]") == "+c>l<r+c");
    // Replacement is left to right and non-overlapping.
    assert(encoded("+[[-]]") == "+[c]");
    assert(encoded("+[-->]") == "+[-->]");
    // Scans only for the single-step spelling.
    assert(encoded("+[>>]") == "+[>>]");
}

static void test_leading_loops() {
    assert(encoded("[+>.]+.") == "+.");
    assert(encoded("[[-]>[.]]+") == "+");
    assert(encoded("[.][,]+") == "+");
    assert(encoded("a[.]b+") == "+");
    // The clear idiom is no longer a loop by the time dead loops are removed.
    assert(encoded("[-]+") == "c+");
    assert(encoded("+[.]") == "+[.]");
    assert(encoded("").empty());
}

static void test_extensions() {
    ExtensionSet ext;
    assert(ext.empty());
    assert(!ext.add('+', Extension{"x;", {}}));
    assert(ext.add(kForkSymbol, forkExtension()));
    assert(!ext.add(kForkSymbol, forkExtension()));
    assert(ext.add('#', Extension{"fflush(stdout);", {"stdio.h", "unistd.h"}}));
    assert(ext.contains('Y') && ext.contains('#') && !ext.contains('!'));
    assert(ext.find('!') == nullptr);
    assert(ext.find('Y')->statement == "p[0] = fork() == 0 ? 0 : 1;");
    const auto headers = ext.headers();
    assert(headers.size() == 2);
    assert(encoded("+Y.#", ext) == "+Y.#");
}

static void test_brackets() {
    assert(checkBrackets("") == 0);
    assert(checkBrackets("+[->[+]<]") == 0);
    assert(checkBrackets("]") == 1);
    assert(checkBrackets("a]b[") == 1);
    assert(checkBrackets("[[]") == 2);
}

int main() {
    test_sanitize();
    test_idioms();
    test_leading_loops();
    test_extensions();
    test_brackets();
    return 0;
}
