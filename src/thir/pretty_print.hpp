#pragma once

#include "const/const.hpp"
#include "thir/pattern.hpp"
#include "type/type.hpp"

#include <ostream>
#include <string>

namespace thir {

// Single-line, Rust-like rendering of a pattern tree, e.g.
// `&&Option::Some(0: n)` or `0u8..=5u8`.
class PatternPrinter {
public:
    PatternPrinter(std::ostream& out, const type::TypeContext& types) : out_(out), types_(types) {}

    void print(const Pat& pat);
    void print_const(const const_eval::Const& value);

private:
    std::ostream& out_;
    const type::TypeContext& types_;

    void print_fields(const std::vector<FieldPat>& fields);
    void print_sequence(const std::vector<PatPtr>& prefix, const PatPtr& slice,
                        const std::vector<PatPtr>& suffix);
    void print_valtree(const const_eval::ValTree& tree);
    void print_scalar(type::TypeId ty, const const_eval::ScalarInt& scalar);
};

std::string to_string(const type::TypeContext& types, const Pat& pat);
std::string to_string(const type::TypeContext& types, const const_eval::Const& value);

} // namespace thir
