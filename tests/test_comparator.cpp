#include "test_common.h"
#include "gauntlet/comparator.h"

using namespace gauntlet;

int main() {
    // exact match
    {
        Diff d = compare_output("42\n", "42\n");
        expect_true(d.equal, "identical bytes equal");
        expect_true(d.text.empty(), "no diff text");
    }

    // empty against empty
    {
        Diff d = compare_output("", "");
        expect_true(d.equal, "empty outputs equal");
        expect_true(d.text.empty(), "no diff text for empty");
    }

    // one flipped byte
    {
        Diff d = compare_output("abd", "abc");
        expect_true(!d.equal, "flipped byte differs");
        expect_eq_ll((long long)d.first_diff_offset, 2, "offset of flipped byte");
        expect_eq_ll((long long)d.expected_size, 3, "expected size unchanged");
        expect_eq_ll((long long)d.generated_size, 3, "generated size unchanged");
    }

    // no whitespace normalization
    {
        Diff d = compare_output("42", "42\n");
        expect_true(!d.equal, "missing newline differs");
        expect_eq_ll((long long)d.first_diff_offset, 2, "offset at end of shorter");
        expect_eq_ll((long long)d.expected_size, 3, "expected size");
        expect_eq_ll((long long)d.generated_size, 2, "generated size");
    }

    // text diff names the line
    {
        Diff d = compare_output("a\nb\nX\n", "a\nb\nc\n");
        expect_true(!d.equal, "differs");
        expect_eq_ll((long long)d.first_diff_offset, 4, "offset");
        expect_true(d.text.find("line 3") != std::string::npos, "line number: " + d.text);
        expect_true(d.text.find("- c") != std::string::npos, "expected line shown");
        expect_true(d.text.find("+ X") != std::string::npos, "generated line shown");
    }

    // binary diff falls back to hex
    {
        std::string a("\x00\x01\x02", 3);
        std::string b("\x00\x01\x03", 3);
        Diff d = compare_output(a, b);
        expect_true(!d.equal, "binary differs");
        expect_true(d.text.find("00 01 03") != std::string::npos, "hex of expected: " + d.text);
        expect_true(d.text.find("00 01 02") != std::string::npos, "hex of generated");
    }

    // trimming
    {
        std::string big(600, 'y');
        std::string t = trim_bytes(big, 512);
        expect_eq_str(t, std::string(512, 'y') + "\n... (output trimmed to 512 bytes)", "trimmed record");
        expect_eq_str(trim_bytes("short", 512), "short", "short input untouched");
    }

    expect_eq_str(escape_bytes(std::string("a\nb\x01", 4)), "a\\nb\\x01", "escape");
    expect_true(looks_like_text("x\ty\r\n"), "text");
    expect_true(!looks_like_text(std::string("\x00", 1)), "nul is not text");

    std::cerr << "test_comparator: ALL PASSED" << std::endl;
    return 0;
}
