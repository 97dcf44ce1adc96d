#pragma once

#include "util/error.hh"

// Visitor is a helper type to be used with std::visit. Usage:
//
// ```
// std::visit(Visitor {
//   [&](const srl::Entry::Direct& d) {
//     ...
//   },
//   [&](const srl::Entry::Reconstructed& r) {
//     ...
//   },
// }, entry.location);
// ```
//
// source: https://en.cppreference.com/w/cpp/utility/variant/visit
template<class... Ts>
struct Visitor: Ts... { using Ts::operator()...; };

// Deduction guide for Visitor.
template<class... Ts>
Visitor(Ts...) -> Visitor<Ts...>;
