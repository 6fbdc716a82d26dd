#include "thir/pattern.hpp"

#include "utils/helpers.hpp"

#include <type_traits>

namespace thir {

namespace {

bool same_ptr(const PatPtr& lhs, const PatPtr& rhs) {
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return *lhs == *rhs;
}

bool same_list(const std::vector<PatPtr>& lhs, const std::vector<PatPtr>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (!same_ptr(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

bool same_fields(const std::vector<FieldPat>& lhs, const std::vector<FieldPat>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (!(lhs[i] == rhs[i])) {
            return false;
        }
    }
    return true;
}

bool same_kind(const Wild&, const Wild&) { return true; }

bool same_kind(const AscribeUserType& a, const AscribeUserType& b) {
    return a.ascription == b.ascription && same_ptr(a.subpattern, b.subpattern);
}

bool same_kind(const Binding& a, const Binding& b) {
    return a.mutability == b.mutability && a.name == b.name && a.mode == b.mode &&
           a.var == b.var && a.ty == b.ty && a.is_primary == b.is_primary &&
           same_ptr(a.subpattern, b.subpattern);
}

bool same_kind(const Variant& a, const Variant& b) {
    return a.adt == b.adt && a.args == b.args && a.variant_index == b.variant_index &&
           same_fields(a.subpatterns, b.subpatterns);
}

bool same_kind(const Leaf& a, const Leaf& b) { return same_fields(a.subpatterns, b.subpatterns); }

bool same_kind(const Deref& a, const Deref& b) { return same_ptr(a.subpattern, b.subpattern); }

bool same_kind(const Constant& a, const Constant& b) { return a.value == b.value; }

bool same_kind(const Range& a, const Range& b) {
    return a.lo == b.lo && a.hi == b.hi && a.end == b.end;
}

bool same_kind(const Slice& a, const Slice& b) {
    return same_list(a.prefix, b.prefix) && same_ptr(a.slice, b.slice) && same_list(a.suffix, b.suffix);
}

bool same_kind(const Array& a, const Array& b) {
    return same_list(a.prefix, b.prefix) && same_ptr(a.slice, b.slice) && same_list(a.suffix, b.suffix);
}

bool same_kind(const Or& a, const Or& b) { return same_list(a.pats, b.pats); }

bool same_kind(const Error& a, const Error& b) { return a.diagnostic == b.diagnostic; }

void push_list(std::vector<const Pat*>& out, const std::vector<PatPtr>& pats) {
    for (const auto& pat : pats) {
        out.push_back(pat.get());
    }
}

void push_fields(std::vector<const Pat*>& out, const std::vector<FieldPat>& fields) {
    for (const auto& field : fields) {
        out.push_back(field.pattern.get());
    }
}

} // namespace

bool operator==(const FieldPat& lhs, const FieldPat& rhs) {
    return lhs.field == rhs.field && same_ptr(lhs.pattern, rhs.pattern);
}

bool operator==(const Pat& lhs, const Pat& rhs) {
    if (lhs.ty != rhs.ty || lhs.span != rhs.span || lhs.kind.index() != rhs.kind.index()) {
        return false;
    }
    return std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        return same_kind(node, std::get<T>(rhs.kind));
    }, lhs.kind);
}

std::vector<const Pat*> children(const Pat& pat) {
    std::vector<const Pat*> out;
    std::visit(Overloaded{
        [](const Wild&) {},
        [](const Constant&) {},
        [](const Range&) {},
        [](const Error&) {},
        [&](const AscribeUserType& node) { out.push_back(node.subpattern.get()); },
        [&](const Binding& node) {
            if (node.subpattern) {
                out.push_back(node.subpattern.get());
            }
        },
        [&](const Variant& node) { push_fields(out, node.subpatterns); },
        [&](const Leaf& node) { push_fields(out, node.subpatterns); },
        [&](const Deref& node) { out.push_back(node.subpattern.get()); },
        [&](const Slice& node) {
            push_list(out, node.prefix);
            if (node.slice) {
                out.push_back(node.slice.get());
            }
            push_list(out, node.suffix);
        },
        [&](const Array& node) {
            push_list(out, node.prefix);
            if (node.slice) {
                out.push_back(node.slice.get());
            }
            push_list(out, node.suffix);
        },
        [&](const Or& node) { push_list(out, node.pats); },
    }, pat.kind);
    return out;
}

size_t count_errors(const Pat& pat) {
    size_t errors = 0;
    walk(pat, [&](const Pat& node) {
        if (node.is<Error>()) {
            ++errors;
        }
    });
    return errors;
}

} // namespace thir
