#pragma once

#include "pulseled_config.h"
#include "pl/int.h"

namespace pl {

/// Builds one line of text in an inline buffer. Output past the capacity
/// is dropped, never reallocated, so this is safe to use from the
/// transmit path and on targets without a heap.
class StrStream {
  public:
    enum { kCapacity = PULSELED_STRSTREAM_CAPACITY };

    StrStream();

    StrStream &operator<<(const char *str);
    StrStream &operator<<(char c);
    StrStream &operator<<(bool b);
    // u8 streams as a number, not a character.
    StrStream &operator<<(u8 n);
    StrStream &operator<<(i16 n);
    StrStream &operator<<(u16 n);
    StrStream &operator<<(int n);
    StrStream &operator<<(unsigned int n);
    StrStream &operator<<(long n);
    StrStream &operator<<(unsigned long n);
    StrStream &operator<<(long long n);
    StrStream &operator<<(unsigned long long n);
    StrStream &operator<<(const void *p);

    const char *c_str() const { return mBuf; }
    pl::size size() const { return mLen; }
    bool truncated() const { return mTruncated; }
    void clear();

    /// Switches integer output to hexadecimal (with a 0x prefix).
    StrStream &hex();
    StrStream &dec();

  private:
    void append(const char *str, pl::size len);
    void appendUnsigned(unsigned long long n);
    void appendSigned(long long n);

    char mBuf[kCapacity + 1];
    pl::size mLen;
    bool mTruncated;
    bool mHex;
};

} // namespace pl
