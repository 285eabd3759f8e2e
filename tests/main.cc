#include "unicfg_test_harness.hh"
#include "unicfg_text_tests.hh"
#include "unicfg_eval_tests.hh"
#include "unicfg_parser_tests.hh"
#include "unicfg_include_tests.hh"

#include <iostream>

namespace unicfg::tests
{
    std::vector<test_result> results;
    std::string last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace unicfg::tests;

    #ifdef UNICFG_TESTS_TEXT__
        run_tests("Lexical preprocessing", run_text_tests);
    #endif

    #ifdef UNICFG_TESTS_EVAL__
        run_tests("Value evaluation", run_eval_tests);
    #endif

    #ifdef UNICFG_TESTS_PARSER__
        run_tests("Document assembly", run_parser_tests);
    #endif

    #ifdef UNICFG_TESTS_INCLUDE__
        run_tests("Includes", run_include_tests);
    #endif

    size_t failed = 0;
    for (auto const & r : results)
        if (!r.passed) ++failed;

    std::cout << '\n' << (results.size() - failed) << '/' << results.size()
              << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
