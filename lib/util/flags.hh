#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace util {

// Flag is a named bit value in a fixed-order flag table. Several flags may
// share a name; lookups by value return the first flag with that value.
template <typename T>
struct Flag {
    const wchar_t* name;
    T value;
};

template <typename T>
struct Decomposition {
    // members are the matched flags, highest value first.
    std::vector<const Flag<T>*> members;

    // not_covered holds the bits of the input that no flag accounts for.
    T not_covered;
};

template <typename T, size_t L>
static const Flag<T>* flag_byvalue(
    const Flag<T> (&flags)[L],
    T value) {
    for (size_t i = 0; i < L; ++i) {
        if (flags[i].value == value)
            return &flags[i];
    }

    return nullptr;
}

// decompose returns the flags of the table that together make up value. If a
// single flag matches value exactly it is returned alone.
template <typename T, size_t L>
Decomposition<T> decompose(
    const Flag<T> (&flags)[L],
    T value) {
    Decomposition<T> d;
    d.not_covered = value;

    for (size_t i = 0; i < L; ++i) {
        T member_value = flags[i].value;
        if (member_value && (member_value & value) == member_value) {
            d.members.push_back(&flags[i]);
            d.not_covered &= ~member_value;
        }
    }

    // Try to cover what is left one bit at a time, highest bit first.
    T remaining = d.not_covered;
    while (remaining) {
        T bit = T(1);
        while (remaining >> 1 >= bit)
            bit <<= 1;

        if (const Flag<T>* f = flag_byvalue(flags, bit)) {
            d.members.push_back(f);
            d.not_covered &= ~bit;
        }
        remaining &= ~bit;
    }

    if (d.members.empty()) {
        if (const Flag<T>* f = flag_byvalue(flags, value))
            d.members.push_back(f);
    }

    std::stable_sort(d.members.begin(), d.members.end(),
        [](const Flag<T>* l, const Flag<T>* r) {
            return l->value > r->value;
        });

    // A flag naming the exact value stands in for its parts.
    if (d.members.size() > 1 && d.members.front()->value == value)
        d.members.erase(d.members.begin() + 1, d.members.end());

    return d;
}

}
