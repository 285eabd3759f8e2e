#ifndef UNICFG_TESTS_PARSER__
#define UNICFG_TESTS_PARSER__

#include "unicfg_test_harness.hh"

namespace unicfg::tests
{

static bool empty_and_comment_only_input()
{
    ordered_node empty = unicfg::parse("", memory_options());
    EXPECT(empty.is_mapping() && empty.size() == 0, "empty input");

    ordered_node comments = unicfg::parse(
        "// nothing here\n"
        "/* or\n"
        "   here */\n"
        "\n", memory_options());
    EXPECT(comments.is_mapping() && comments.size() == 0,
        "comment-only input");
    return true;
}

static bool dotted_sections_nest()
{
    constexpr char const * src =
        "top = 1\n"
        "[Network.HTTP.CORS]\n"
        "enabled = true\n"
        "[ Network . HTTP ]\n"
        "port = 80\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_number(doc, "top", 1), "keys before any header are top-level");
    EXPECT(has_bool(doc, "Network.HTTP.CORS.enabled", true), "nested section");
    EXPECT(has_number(doc, "Network.HTTP.port", 80),
        "section segments are trimmed");
    return true;
}

static bool redeclared_sections_merge()
{
    constexpr char const * src =
        "[A]\n"
        "x = 1\n"
        "[B]\n"
        "y = 2\n"
        "[A]\n"
        "x = 3\n"
        "z = 4\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_number(doc, "A.x", 3), "later assignment wins");
    EXPECT(has_number(doc, "A.z", 4), "new key joins existing section");
    EXPECT(has_number(doc, "B.y", 2), "other section untouched");

    auto it = doc.map_items().begin();
    EXPECT(it->first.get_value<std::string>() == "A",
        "sections keep first-seen order");
    return true;
}

static bool assignment_replaces_non_mapping_on_path()
{
    constexpr char const * src =
        "a = 5\n"
        "[a]\n"
        "b = 1\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_number(doc, "a.b", 1), "scalar replaced by a section mapping");
    return true;
}

static bool values_split_on_first_unquoted_equals()
{
    constexpr char const * src =
        "query = \"a=b\"\n"
        "include = 7\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_string(doc, "query", "a=b"), "quoted = stays in the value");
    EXPECT(has_number(doc, "include", 7),
        "an assignment to 'include' is not a directive");
    return true;
}

static bool references_resolve_absolute_then_relative()
{
    constexpr char const * src =
        "[Server]\n"
        "port = 8080\n"
        "copy = port\n"
        "url = \"host:\" + port\n"
        "[Client]\n"
        "target = Server.port\n"
        "next = Server.port + 1\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_number(doc, "Server.copy", 8080), "relative to the section");
    EXPECT(has_string(doc, "Server.url", "host:8080"), "operand reference");
    EXPECT(has_number(doc, "Client.target", 8080), "absolute reference");
    EXPECT(has_number(doc, "Client.next", 8081), "reference in arithmetic");
    return true;
}

static bool references_index_and_key()
{
    constexpr char const * src =
        "[Data]\n"
        "users = [{\"name\": \"alice\", \"roles\": [\"admin\"]}, {\"name\": \"bob\"}]\n"
        "matrix = [[1, 2], [3, 4]]\n"
        "[Use]\n"
        "first = Data.users[0][\"name\"]\n"
        "second = Data.users[1]['name']\n"
        "role = Data.users[0].roles[0]\n"
        "cell = Data.matrix[1][0]\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_string(doc, "Use.first", "alice"), "index then quoted key");
    EXPECT(has_string(doc, "Use.second", "bob"), "single-quoted key");
    EXPECT(has_string(doc, "Use.role", "admin"), "dot step after an index");
    EXPECT(has_number(doc, "Use.cell", 3), "nested indices");
    return true;
}

static bool bad_references_fail()
{
    constexpr char const * prefix =
        "[Data]\n"
        "list = [1, 2]\n"
        "obj = {\"k\": 1}\n";

    Options const opts = memory_options();
    std::string const base(prefix);

    EXPECT_THROWS(unicfg::parse(base + "x = missing\n", opts),
        unicfg::ReferenceError, "undefined reference");
    EXPECT_THROWS(unicfg::parse(base + "x = list[2]\n", opts),
        unicfg::ReferenceError, "index out of bounds");
    EXPECT_THROWS(unicfg::parse(base + "x = list[99999999999999999999]\n", opts),
        unicfg::ReferenceError, "index beyond the integer range");
    EXPECT_THROWS(unicfg::parse(base + "x = obj[0]\n", opts),
        unicfg::ReferenceError, "index into a mapping");
    EXPECT_THROWS(unicfg::parse(base + "x = obj[\"nope\"]\n", opts),
        unicfg::ReferenceError, "missing key");
    EXPECT_THROWS(unicfg::parse(base + "x = later\nlater = 1\n", opts),
        unicfg::ReferenceError, "forward references are not visible");
    return true;
}

static bool multi_line_structured_values()
{
    constexpr char const * src =
        "[S]\n"
        "list = [\n"
        "  1,\n"
        "\n"
        "  2, // two\n"
        "  3\n"
        "]\n"
        "obj = {\n"
        "  \"a\": 1,\n"
        "  \"b\": [1, 2]\n"
        "}\n"
        "after = 5\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    ordered_node const * list = find_path(doc, "S.list");
    EXPECT(list && list->is_sequence() && list->size() == 3,
        "array over several lines");
    EXPECT(has_number(doc, "S.obj.a", 1), "object over several lines");
    EXPECT(find_path(doc, "S.obj.b")->size() == 2, "nested array member");
    EXPECT(has_number(doc, "S.after", 5), "assembly resumes after the value");
    return true;
}

static bool stray_lines()
{
    ordered_node doc = unicfg::parse("x = 1\n],\n", memory_options());
    EXPECT(has_number(doc, "x", 1), "structural leftovers are skipped");

    EXPECT_THROWS(unicfg::parse("x = 1\ngarbage\n", memory_options()),
        unicfg::SyntaxError, "line without '=' is rejected");
    EXPECT_THROWS(unicfg::parse("= 1\n", memory_options()),
        unicfg::SyntaxError, "missing key is rejected");
    EXPECT_THROWS(unicfg::parse("[]\n", memory_options()),
        unicfg::SyntaxError, "empty section name is rejected");
    EXPECT_THROWS(unicfg::parse("[a..b]\n", memory_options()),
        unicfg::SyntaxError, "empty section segment is rejected");
    EXPECT_THROWS(unicfg::parse("x = [1, 2\ny = 3\n", memory_options()),
        unicfg::SyntaxError, "unterminated array is rejected");
    return true;
}

static bool errors_carry_line_and_section()
{
    constexpr char const * src =
        "/* header\n"
        "   comment */\n"
        "[Net.HTTP]\n"
        "a = 1\n"
        "b = missing\n";

    try {
        unicfg::parse(src, memory_options());
    }
    catch (unicfg::ReferenceError const & e) {
        EXPECT(e.kind() == ErrorKind::Reference, "kind");
        EXPECT(e.line() == 5, "line counts survive block comments");
        EXPECT(e.detail() == "Cannot resolve reference: missing",
            "detail names the fragment");
        EXPECT(std::string(e.what())
            == "line 5 [Net.HTTP]: Cannot resolve reference: missing",
            "message carries line and section");
        return true;
    }
    EXPECT(false, "expected a reference error");
    return false;
}

static bool defaults_fill_absent_and_null_keys()
{
    constexpr char const * src =
        "[Config]\n"
        "existing_key = \"existing_value\"\n"
        "null_key = null\n"
        "\n"
        "[Defaults]\n"
        "Config.existing_key = \"default_value\"\n"
        "Config.null_key = \"default_for_null\"\n"
        "Config.new_key = \"new_default_value\"\n"
        "Other.deep.limit = 10 * 2\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_string(doc, "Config.existing_key", "existing_value"),
        "present keys are untouched");
    EXPECT(has_string(doc, "Config.null_key", "default_for_null"),
        "null keys are filled");
    EXPECT(has_string(doc, "Config.new_key", "new_default_value"),
        "absent keys are created");
    EXPECT(has_number(doc, "Other.deep.limit", 20),
        "intermediate mappings are created");
    EXPECT(find_path(doc, "Defaults") == nullptr,
        "the defaults block is not part of the document");
    return true;
}

static bool defaults_evaluate_in_the_last_section()
{
    constexpr char const * src =
        "[S]\n"
        "k = 1\n"
        "[Defaults]\n"
        "X.y = k\n"
        "X.z = k + S.k\n";

    ordered_node doc = unicfg::parse(src, memory_options());
    EXPECT(has_number(doc, "X.y", 1),
        "references resolve relative to the section still in effect");
    EXPECT(has_number(doc, "X.z", 2), "same for expression operands");
    return true;
}

static bool out_of_range_errors_are_located()
{
    constexpr char const * src =
        "[Data]\n"
        "list = [1]\n"
        "x = list[99999999999999999999]\n";

    try {
        unicfg::parse(src, memory_options());
    }
    catch (unicfg::Error const & e) {
        EXPECT(e.kind() == ErrorKind::Reference, "reported as a reference error");
        EXPECT(e.line() == 3, "stamped with its line");
        return true;
    }
    EXPECT(false, "expected a reference error");
    return false;
}

static bool defaults_block_rules()
{
    constexpr char const * repeated =
        "[defaults]\n"
        "A.x = 1\n"
        "A.x = 2\n";
    ordered_node doc = unicfg::parse(repeated, memory_options());
    EXPECT(has_number(doc, "A.x", 2), "header is case-insensitive, last wins");

    constexpr char const * multi =
        "[Defaults]\n"
        "A.list = [\n"
        "  1, 2\n"
        "]\n";
    doc = unicfg::parse(multi, memory_options());
    EXPECT(find_path(doc, "A.list")->size() == 2, "multi-line default value");

    EXPECT_THROWS(unicfg::parse("[Defaults]\nA.x = 1\n[After]\ny = 2\n",
        memory_options()), unicfg::SyntaxError,
        "a header after [Defaults] is rejected");
    EXPECT_THROWS(unicfg::parse("[Defaults]\nA..x = 1\n", memory_options()),
        unicfg::SyntaxError, "empty path segment is rejected");
    return true;
}

static bool parser_is_reusable()
{
    Parser parser(memory_options());
    ordered_node first = parser.parse("[A]\nx = 1\n[Defaults]\nA.y = 2\n");
    ordered_node second = parser.parse("z = 3\n");

    EXPECT(has_number(first, "A.y", 2), "first document complete");
    EXPECT(find_path(second, "A") == nullptr, "no state leaks between calls");
    EXPECT(has_number(second, "z", 3), "second document complete");

    std::istringstream in("[S]\nk = \"v\"\n");
    EXPECT(has_string(parser.parse(in), "S.k", "v"), "stream input");
    return true;
}

static bool yaml_output_keeps_integers()
{
    ordered_node doc = unicfg::parse("[S]\nport = 8080\n", memory_options());
    std::string const yaml = to_yaml(doc);
    EXPECT(yaml.find("port: 8080") != std::string::npos,
        "integral numbers render as integers");
    EXPECT(yaml.find("8080.0") == std::string::npos, "no trailing .0");
    return true;
}

inline void run_parser_tests()
{
    SUBCAT("structure");
    RUN_TEST(empty_and_comment_only_input);
    RUN_TEST(dotted_sections_nest);
    RUN_TEST(redeclared_sections_merge);
    RUN_TEST(assignment_replaces_non_mapping_on_path);
    RUN_TEST(values_split_on_first_unquoted_equals);
    RUN_TEST(multi_line_structured_values);
    RUN_TEST(stray_lines);
    SUBCAT("references");
    RUN_TEST(references_resolve_absolute_then_relative);
    RUN_TEST(references_index_and_key);
    RUN_TEST(bad_references_fail);
    SUBCAT("errors");
    RUN_TEST(errors_carry_line_and_section);
    RUN_TEST(out_of_range_errors_are_located);
    SUBCAT("defaults");
    RUN_TEST(defaults_fill_absent_and_null_keys);
    RUN_TEST(defaults_evaluate_in_the_last_section);
    RUN_TEST(defaults_block_rules);
    SUBCAT("api");
    RUN_TEST(parser_is_reusable);
    RUN_TEST(yaml_output_keeps_integers);
}

}

#endif
