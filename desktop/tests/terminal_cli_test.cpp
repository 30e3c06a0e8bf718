#include "terminal_cli.h"
#include "test_support.h"
#include <iostream>
#include <string>

bool test_lowercase_commands() {
    std::cout << "Testing command lowercasing..." << std::endl;
    TEST_ASSERT(to_lower_copy("SCAN") == "scan", "ASCII letters are lowered");
    TEST_ASSERT(to_lower_copy("LogFilter") == "logfilter", "Mixed case is lowered");
    TEST_ASSERT(to_lower_copy("send 42!") == "send 42!", "Digits and punctuation are kept");
    TEST_ASSERT(to_lower_copy("").empty(), "Empty input stays empty");

    std::cout << "Lowercase Commands Test Passed!" << std::endl;
    return true;
}

bool test_lowercase_keeps_utf8_bytes() {
    std::cout << "Testing non-ASCII input..." << std::endl;
    // "ÉCRAN" and "Ω" as UTF-8; the high bytes are negative as plain char
    const std::string accented = "\xC3\x89" "CRAN";
    const std::string lowered = to_lower_copy(accented);
    TEST_ASSERT(lowered.size() == accented.size(), "Length is unchanged");
    TEST_ASSERT(lowered.substr(0, 2) == "\xC3\x89", "Multi-byte sequence passes through");
    TEST_ASSERT(lowered.substr(2) == "cran", "Trailing ASCII is lowered");
    TEST_ASSERT(to_lower_copy("\xCE\xA9") == "\xCE\xA9", "Other UTF-8 bytes pass through");
    TEST_ASSERT(to_lower_copy("\xFF\x80") == "\xFF\x80", "Arbitrary high bytes pass through");

    std::cout << "UTF-8 Input Test Passed!" << std::endl;
    return true;
}

int main() {
    configure_unit_test_runtime();
    std::cout << "Running TerminalCLI Tests..." << std::endl;

    test_lowercase_commands();
    test_lowercase_keeps_utf8_bytes();

    if (tests_failed == 0) {
        std::cout << "ALL TERMINAL CLI TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
