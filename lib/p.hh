#pragma once

#include <cstddef>
#include <utility>

// P is a type that wraps a non-owned reference to a value. The referenced
// value must outlive the P. A moved-from P is null.
template <typename T>
struct P {
    T* get() const {
        return x;
    }

    P& operator=(const P<T>& rhs) = delete;

    P& operator=(P<T>&& rhs) {
        x = std::exchange(rhs.x, nullptr);
        return *this;
    }

    P& operator=(T* x) {
        this->x = x;
        return *this;
    }

    T* operator->() const {
        return x;
    }

    T& operator*() const {
        return *x;
    }

    explicit operator bool() const {
        return x != nullptr;
    }

    P():
        x(nullptr) {}

    explicit P(T* x):
        x(x) {}

    P(P&& rhs):
        x(std::exchange(rhs.x, nullptr)) {}

    ~P() {}

    P(const P&) = delete;

private:
    T* x;
};
