#pragma once

#include <new>

#include "pl/move.h"

namespace pl {

// nullopt support for compatibility with std::optional patterns
struct nullopt_t {};
constexpr nullopt_t nullopt{};

// Value-or-nothing with inline storage. Never allocates.
template <typename T> class Optional {
  public:
    Optional() : mHasValue(false) {}
    Optional(nullopt_t) : mHasValue(false) {}
    Optional(const Optional &other) : mHasValue(false) {
        if (other.mHasValue) {
            construct(*other.ptr());
        }
    }
    Optional(Optional &&other) noexcept : mHasValue(false) {
        if (other.mHasValue) {
            construct(pl::move(*other.ptr()));
        }
    }

    Optional(const T &value) : mHasValue(false) { construct(value); }
    Optional(T &&value) : mHasValue(false) { construct(pl::move(value)); }
    ~Optional() { reset(); }

    void emplace(T &&value) {
        reset();
        construct(pl::move(value));
    }

    bool empty() const { return !mHasValue; }
    bool has_value() const { return mHasValue; }  // std::optional compatibility
    T *ptr() { return mHasValue ? reinterpret_cast<T *>(mStorage) : nullptr; }
    const T *ptr() const {
        return mHasValue ? reinterpret_cast<const T *>(mStorage) : nullptr;
    }

    void reset() {
        if (mHasValue) {
            ptr()->~T();
            mHasValue = false;
        }
    }

    /// Moves the value out and leaves the optional empty. Returns an
    /// empty optional if there was nothing to take.
    Optional take() {
        Optional out(pl::move(*this));
        reset();
        return out;
    }

    Optional &operator=(const Optional &other) {
        if (this != &other) {
            reset();
            if (other.mHasValue) {
                construct(*other.ptr());
            }
        }
        return *this;
    }

    Optional &operator=(Optional &&other) noexcept {
        if (this != &other) {
            reset();
            if (other.mHasValue) {
                construct(pl::move(*other.ptr()));
            }
        }
        return *this;
    }

    Optional &operator=(nullopt_t) {
        reset();
        return *this;
    }

    Optional &operator=(const T &value) {
        reset();
        construct(value);
        return *this;
    }

    Optional &operator=(T &&value) {
        reset();
        construct(pl::move(value));
        return *this;
    }

    bool operator!() const { return empty(); }

    // Explicit conversion to bool for contextual boolean evaluation
    explicit operator bool() const { return !empty(); }

    bool operator==(const Optional &other) const {
        if (empty() && other.empty()) {
            return true;
        }
        if (empty() || other.empty()) {
            return false;
        }
        return *ptr() == *other.ptr();
    }

    bool operator!=(const Optional &other) const { return !(*this == other); }

    bool operator==(const T &value) const {
        if (empty()) {
            return false;
        }
        return *ptr() == value;
    }

    bool operator==(nullopt_t) const { return empty(); }
    bool operator!=(nullopt_t) const { return !empty(); }

    T &operator*() { return *ptr(); }
    const T &operator*() const { return *ptr(); }
    T *operator->() { return ptr(); }
    const T *operator->() const { return ptr(); }

  private:
    template <typename U> void construct(U &&value) {
        new (mStorage) T(pl::forward<U>(value));
        mHasValue = true;
    }

    alignas(T) unsigned char mStorage[sizeof(T)];
    bool mHasValue;
};

} // namespace pl
