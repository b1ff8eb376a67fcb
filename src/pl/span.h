#pragma once

#include "pl/int.h"

namespace pl {

// span<T> is a pointer with a length. It is used to hand arrays around
// without a separate length parameter and without owning the storage.
template <typename T> class span {
  public:
    span() : mData(nullptr), mSize(0) {}
    span(T *data, pl::size size) : mData(data), mSize(size) {}

    // T[] -> span<T>, also U[] -> span<const U>
    template <typename U, pl::size ARRAYSIZE>
    span(U (&array)[ARRAYSIZE]) : mData(array), mSize(ARRAYSIZE) {}

    span(const span &other) : mData(other.mData), mSize(other.mSize) {}

    span &operator=(const span &other) {
        mData = other.mData;
        mSize = other.mSize;
        return *this;
    }

    // Automatic promotion to span<const T>
    operator span<const T>() const { return span<const T>(mData, mSize); }

    T &operator[](pl::size index) { return mData[index]; }
    const T &operator[](pl::size index) const { return mData[index]; }

    T *begin() const { return mData; }
    T *end() const { return mData + mSize; }

    T *data() const { return mData; }
    pl::size size() const { return mSize; }
    pl::size length() const { return mSize; }
    bool empty() const { return mSize == 0; }

    // Clamps to the available range instead of reading past the end.
    span slice(pl::size start, pl::size end) const {
        if (start > mSize) {
            start = mSize;
        }
        if (end > mSize) {
            end = mSize;
        }
        if (end < start) {
            end = start;
        }
        return span(mData + start, end - start);
    }

    span slice(pl::size start) const { return slice(start, mSize); }

  private:
    T *mData;
    pl::size mSize;
};

} // namespace pl
