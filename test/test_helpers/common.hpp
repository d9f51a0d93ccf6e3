#pragma once

#include "gtest/gtest.h"
#include "src/diag/diagnostic.hpp"
#include "src/ir/helper.hpp"
#include "src/ir/ir.hpp"
#include "src/ir/pretty_print/pretty_print.hpp"
#include "src/ir/reader/reader.hpp"
#include "src/pass/pass.hpp"
#include "src/pipeline/options.hpp"
#include <string>
#include <string_view>
#include <type_traits>

namespace test::helpers {

/**
 * @brief Shared fixtures for IR tests.
 *
 * Inputs and expectations are written in the IR text form. Expected trees are
 * read back and printed so that comparisons ignore layout and spans.
 */

inline ir::NodePtr parse(std::string_view text) {
    return ir::reader::read_node(text);
}

inline ir::PatternPtr parse_pattern(std::string_view text) {
    return ir::reader::read_pattern(text);
}

// Canonical compact rendering of IR text.
inline std::string canonical(std::string_view text) {
    return ir::to_string(parse(text));
}

inline std::string print(const ir::NodePtr& node) {
    return ir::to_string(node);
}

/**
 * @brief Base class for pass tests: options, a collecting sink and a context
 * that passes can report through.
 */
class PassTestBase : public ::testing::Test {
protected:
    pipeline::PipelineOptions options;
    diag::CollectingSink sink;
    pass::PassContext context{options, sink, "test"};

    template <typename Pass>
    ir::NodePtr run_pass(const ir::NodePtr& input) {
        if constexpr (std::is_constructible_v<Pass, pass::PassContext&>) {
            Pass instance(context);
            return instance.run(input);
        } else {
            Pass instance;
            return instance.run(input);
        }
    }

    template <typename Pass>
    std::string apply(std::string_view text) {
        return print(run_pass<Pass>(parse(text)));
    }

    // The pass leaves `text` pointer-identical.
    template <typename Pass>
    bool leaves_unchanged(std::string_view text) {
        auto input = parse(text);
        return run_pass<Pass>(input) == input;
    }
};

} // namespace test::helpers
