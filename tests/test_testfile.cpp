#include "test_common.h"
#include "gauntlet/testfile.h"

using namespace gauntlet;

int main() {
    TempDir tmp("gauntlet_test_testfile");
    const auto& d = tmp.path;

    // sibling .out beats in-file CHECK directives
    write_file(d / "a.c", "int main() {}\n// CHECK:from-directive\n");
    write_file(d / "a.out", "from-sibling\n");
    {
        TestFile t(d / "a.c");
        expect_true(t.valid(), "a.c valid");
        expect_eq_str(t.expected_out(), "from-sibling\n", "sibling wins");
        expect_eq_str(t.stem(), "a", "stem");
        expect_eq_str(t.extension(), ".c", "extension");
        expect_eq_str(t.file(), "a.c", "file name");
    }

    // multiple directives join with newline, CR stripped, needs the comment before it
    write_file(d / "b.c", "// CHECK:1\r\nCHECK:ignored\n  // CHECK:2\n// INPUT:7\n");
    {
        TestFile t(d / "b.c");
        expect_true(t.valid(), "b.c valid");
        expect_eq_str(t.expected_out(), "1\n2", "joined directives");
        expect_eq_str(t.input_stream(), "7", "input directive");
    }

    // CHECK_FILE relative to the test, INPUT_FILE likewise
    write_file(d / "refs" / "exp.txt", "expected bytes");
    write_file(d / "refs" / "in.txt", "stdin bytes");
    write_file(d / "c.c", "// CHECK_FILE:refs/exp.txt\n// INPUT_FILE:refs/in.txt\n");
    {
        TestFile t(d / "c.c");
        expect_true(t.valid(), "c.c valid");
        expect_eq_str(t.expected_out(), "expected bytes", "CHECK_FILE contents");
        expect_eq_str(t.input_stream(), "stdin bytes", "INPUT_FILE contents");
    }

    // missing CHECK_FILE makes the fixture invalid
    write_file(d / "e.c", "// CHECK_FILE:missing.txt\n");
    {
        TestFile t(d / "e.c");
        expect_true(!t.valid(), "e.c invalid");
        expect_eq_ll((long long)t.errors().size(), 1, "one error");
        expect_true(t.errors()[0].message.find("Failed to locate path supplied to CHECK_FILE:") == 0,
                    "error message: " + t.errors()[0].message);
        auto r = t.resolve_expected_out();
        expect_true(std::holds_alternative<TestFileError>(r), "resolve returns error");
    }

    // an empty sibling still short-circuits the directive
    write_file(d / "f.c", "// CHECK:not-used\n");
    write_file(d / "f.out", "");
    {
        TestFile t(d / "f.c");
        expect_eq_str(t.expected_out(), "", "empty sibling wins");
    }

    // nothing present -> empty
    write_file(d / "g.c", "int x;\n");
    {
        TestFile t(d / "g.c");
        expect_true(t.valid(), "g.c valid");
        expect_eq_str(t.expected_out(), "", "default expected");
        expect_eq_str(t.input_stream(), "", "default input");
        expect_eq_str(t.contents(), "int x;\n", "contents");
    }

    // mirrored tree: input/pkg/h.c -> output/pkg/h.out, input-stream/pkg/h.ins
    write_file(d / "input" / "pkg" / "h.c", "// CHECK:directive\n");
    write_file(d / "output" / "pkg" / "h.out", "mirrored\n");
    write_file(d / "input-stream" / "pkg" / "h.ins", "mirrored-in\n");
    {
        TestFile t(d / "input" / "pkg" / "h.c");
        expect_eq_str(t.expected_out(), "mirrored\n", "mirrored .out");
        expect_eq_str(t.input_stream(), "mirrored-in\n", "mirrored .ins");
    }

    // custom comment syntax
    write_file(d / "k.py", "# CHECK:hash\n// CHECK:slash\n");
    {
        TestFileOptions opts;
        opts.comment_syntax = "#";
        TestFile t(d / "k.py", opts);
        expect_eq_str(t.expected_out(), "hash", "comment syntax #");
    }

    std::cerr << "test_testfile: ALL PASSED" << std::endl;
    return 0;
}
