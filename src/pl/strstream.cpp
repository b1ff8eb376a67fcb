#include "pl/strstream.h"

namespace pl {

StrStream::StrStream() : mLen(0), mTruncated(false), mHex(false) {
    mBuf[0] = '\0';
}

void StrStream::clear() {
    mLen = 0;
    mTruncated = false;
    mBuf[0] = '\0';
}

StrStream &StrStream::hex() {
    mHex = true;
    return *this;
}

StrStream &StrStream::dec() {
    mHex = false;
    return *this;
}

void StrStream::append(const char *str, pl::size len) {
    for (pl::size i = 0; i < len; ++i) {
        if (mLen >= kCapacity) {
            mTruncated = true;
            break;
        }
        mBuf[mLen++] = str[i];
    }
    mBuf[mLen] = '\0';
}

void StrStream::appendUnsigned(unsigned long long n) {
    // 20 digits covers 2^64 in decimal.
    char digits[24];
    pl::size count = 0;
    const unsigned base = mHex ? 16 : 10;
    do {
        const unsigned d = static_cast<unsigned>(n % base);
        digits[count++] = static_cast<char>(d < 10 ? '0' + d : 'a' + (d - 10));
        n /= base;
    } while (n != 0);
    if (mHex) {
        append("0x", 2);
    }
    while (count > 0) {
        --count;
        append(&digits[count], 1);
    }
}

void StrStream::appendSigned(long long n) {
    if (n < 0 && !mHex) {
        append("-", 1);
        // Negate through unsigned so LLONG_MIN does not overflow.
        appendUnsigned(0ULL - static_cast<unsigned long long>(n));
        return;
    }
    appendUnsigned(static_cast<unsigned long long>(n));
}

StrStream &StrStream::operator<<(const char *str) {
    if (!str) {
        str = "(null)";
    }
    pl::size len = 0;
    while (str[len] != '\0') {
        ++len;
    }
    append(str, len);
    return *this;
}

StrStream &StrStream::operator<<(char c) {
    append(&c, 1);
    return *this;
}

StrStream &StrStream::operator<<(bool b) { return *this << (b ? "true" : "false"); }

StrStream &StrStream::operator<<(u8 n) {
    appendUnsigned(n);
    return *this;
}

StrStream &StrStream::operator<<(i16 n) {
    appendSigned(n);
    return *this;
}

StrStream &StrStream::operator<<(u16 n) {
    appendUnsigned(n);
    return *this;
}

StrStream &StrStream::operator<<(int n) {
    appendSigned(n);
    return *this;
}

StrStream &StrStream::operator<<(unsigned int n) {
    appendUnsigned(n);
    return *this;
}

StrStream &StrStream::operator<<(long n) {
    appendSigned(n);
    return *this;
}

StrStream &StrStream::operator<<(unsigned long n) {
    appendUnsigned(n);
    return *this;
}

StrStream &StrStream::operator<<(long long n) {
    appendSigned(n);
    return *this;
}

StrStream &StrStream::operator<<(unsigned long long n) {
    appendUnsigned(n);
    return *this;
}

StrStream &StrStream::operator<<(const void *p) {
    const bool wasHex = mHex;
    mHex = true;
    appendUnsigned(reinterpret_cast<pl::uptr>(p));
    mHex = wasHex;
    return *this;
}

} // namespace pl
