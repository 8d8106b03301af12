#include "keynet/crypto/field25519.hpp"
#include <cstring>

namespace keynet::crypto {

using u64 = uint64_t;
__extension__ using u128 = unsigned __int128;

static constexpr u64 MASK51 = FieldElement::MASK51;

namespace {

u64 load64_le(const uint8_t* p) {
    u64 r = 0;
    for (int i = 7; i >= 0; --i) {
        r = (r << 8) | p[i];
    }
    return r;
}

}  // namespace

// Limb i holds bits [51*i, 51*i + 51) of the little-endian encoding.
FieldElement FieldElement::from_bytes(std::span<const uint8_t, 32> bytes) {
    u64 l0 = load64_le(&bytes[0]) & MASK51;
    u64 l1 = (load64_le(&bytes[6]) >> 3) & MASK51;
    u64 l2 = (load64_le(&bytes[12]) >> 6) & MASK51;
    u64 l3 = (load64_le(&bytes[19]) >> 1) & MASK51;
    u64 l4 = (load64_le(&bytes[24]) >> 12) & MASK51;
    return FieldElement(l0, l1, l2, l3, l4);
}

void FieldElement::to_bytes(std::span<uint8_t, 32> out) const {
    FieldElement t = *this;
    t.reduce();

    // Pack 255 bits into one little-endian 256-bit accumulator, 64 bits at a time
    const u64* l = t.limbs_;
    u64 words[4] = {
        l[0] | (l[1] << 51),
        (l[1] >> 13) | (l[2] << 38),
        (l[2] >> 26) | (l[3] << 25),
        (l[3] >> 39) | (l[4] << 12),
    };

    for (int w = 0; w < 4; ++w) {
        for (int b = 0; b < 8; ++b) {
            out[w * 8 + b] = static_cast<uint8_t>(words[w] >> (8 * b));
        }
    }
}

std::array<uint8_t, 32> FieldElement::to_bytes() const {
    std::array<uint8_t, 32> out{};
    to_bytes(out);
    return out;
}

void FieldElement::carry() {
    limbs_[1] += limbs_[0] >> 51; limbs_[0] &= MASK51;
    limbs_[2] += limbs_[1] >> 51; limbs_[1] &= MASK51;
    limbs_[3] += limbs_[2] >> 51; limbs_[2] &= MASK51;
    limbs_[4] += limbs_[3] >> 51; limbs_[3] &= MASK51;
    limbs_[0] += (limbs_[4] >> 51) * 19; limbs_[4] &= MASK51;
}

void FieldElement::reduce() {
    carry();
    carry();

    // q = 1 iff value >= p; then add 19*q and drop bit 255
    u64 q = (limbs_[0] + 19) >> 51;
    q = (limbs_[1] + q) >> 51;
    q = (limbs_[2] + q) >> 51;
    q = (limbs_[3] + q) >> 51;
    q = (limbs_[4] + q) >> 51;

    limbs_[0] += 19 * q;

    limbs_[1] += limbs_[0] >> 51; limbs_[0] &= MASK51;
    limbs_[2] += limbs_[1] >> 51; limbs_[1] &= MASK51;
    limbs_[3] += limbs_[2] >> 51; limbs_[2] &= MASK51;
    limbs_[4] += limbs_[3] >> 51; limbs_[3] &= MASK51;
    limbs_[4] &= MASK51;
}

FieldElement FieldElement::operator+(const FieldElement& rhs) const {
    FieldElement r(
        limbs_[0] + rhs.limbs_[0],
        limbs_[1] + rhs.limbs_[1],
        limbs_[2] + rhs.limbs_[2],
        limbs_[3] + rhs.limbs_[3],
        limbs_[4] + rhs.limbs_[4]
    );
    r.carry();
    return r;
}

FieldElement FieldElement::operator-(const FieldElement& rhs) const {
    // Bias by 2p so no limb underflows
    FieldElement r(
        (limbs_[0] + 0xfffffffffffda) - rhs.limbs_[0],
        (limbs_[1] + 0xffffffffffffe) - rhs.limbs_[1],
        (limbs_[2] + 0xffffffffffffe) - rhs.limbs_[2],
        (limbs_[3] + 0xffffffffffffe) - rhs.limbs_[3],
        (limbs_[4] + 0xffffffffffffe) - rhs.limbs_[4]
    );
    r.carry();
    return r;
}

FieldElement FieldElement::operator*(const FieldElement& rhs) const {
    const u64* a = limbs_;
    const u64* b = rhs.limbs_;

    // 2^255 = 19 (mod p), so limbs that wrap past limb 4 are folded back times 19
    u64 b1_19 = b[1] * 19;
    u64 b2_19 = b[2] * 19;
    u64 b3_19 = b[3] * 19;
    u64 b4_19 = b[4] * 19;

    u128 t0 = (u128)a[0] * b[0] + (u128)a[4] * b1_19 + (u128)a[3] * b2_19
            + (u128)a[2] * b3_19 + (u128)a[1] * b4_19;
    u128 t1 = (u128)a[1] * b[0] + (u128)a[0] * b[1] + (u128)a[4] * b2_19
            + (u128)a[3] * b3_19 + (u128)a[2] * b4_19;
    u128 t2 = (u128)a[2] * b[0] + (u128)a[1] * b[1] + (u128)a[0] * b[2]
            + (u128)a[4] * b3_19 + (u128)a[3] * b4_19;
    u128 t3 = (u128)a[3] * b[0] + (u128)a[2] * b[1] + (u128)a[1] * b[2]
            + (u128)a[0] * b[3] + (u128)a[4] * b4_19;
    u128 t4 = (u128)a[4] * b[0] + (u128)a[3] * b[1] + (u128)a[2] * b[2]
            + (u128)a[1] * b[3] + (u128)a[0] * b[4];

    u64 r0 = static_cast<u64>(t0) & MASK51; t1 += static_cast<u64>(t0 >> 51);
    u64 r1 = static_cast<u64>(t1) & MASK51; t2 += static_cast<u64>(t1 >> 51);
    u64 r2 = static_cast<u64>(t2) & MASK51; t3 += static_cast<u64>(t2 >> 51);
    u64 r3 = static_cast<u64>(t3) & MASK51; t4 += static_cast<u64>(t3 >> 51);
    u64 r4 = static_cast<u64>(t4) & MASK51;
    r0 += static_cast<u64>(t4 >> 51) * 19;
    r1 += r0 >> 51; r0 &= MASK51;

    return FieldElement(r0, r1, r2, r3, r4);
}

FieldElement FieldElement::square() const {
    u64 a0 = limbs_[0], a1 = limbs_[1], a2 = limbs_[2], a3 = limbs_[3], a4 = limbs_[4];
    u64 a3_19 = a3 * 19;
    u64 a4_19 = a4 * 19;

    u128 s0 = (u128)a0 * a0 + 2 * ((u128)a1 * a4_19 + (u128)a2 * a3_19);
    u128 s1 = 2 * ((u128)a0 * a1 + (u128)a2 * a4_19) + (u128)a3 * a3_19;
    u128 s2 = 2 * ((u128)a0 * a2 + (u128)a3 * a4_19) + (u128)a1 * a1;
    u128 s3 = 2 * ((u128)a0 * a3 + (u128)a1 * a2) + (u128)a4 * a4_19;
    u128 s4 = 2 * ((u128)a0 * a4 + (u128)a1 * a3) + (u128)a2 * a2;

    u64 r0 = static_cast<u64>(s0) & MASK51; s1 += static_cast<u64>(s0 >> 51);
    u64 r1 = static_cast<u64>(s1) & MASK51; s2 += static_cast<u64>(s1 >> 51);
    u64 r2 = static_cast<u64>(s2) & MASK51; s3 += static_cast<u64>(s2 >> 51);
    u64 r3 = static_cast<u64>(s3) & MASK51; s4 += static_cast<u64>(s3 >> 51);
    u64 r4 = static_cast<u64>(s4) & MASK51;
    r0 += static_cast<u64>(s4 >> 51) * 19;
    r1 += r0 >> 51; r0 &= MASK51;

    return FieldElement(r0, r1, r2, r3, r4);
}

FieldElement FieldElement::square_n(int n) const {
    FieldElement r = *this;
    for (int i = 0; i < n; ++i) {
        r = r.square();
    }
    return r;
}

bool FieldElement::operator==(const FieldElement& rhs) const {
    auto a = to_bytes();
    auto b = rhs.to_bytes();
    uint8_t diff = 0;
    for (int i = 0; i < 32; ++i) {
        diff |= a[i] ^ b[i];
    }
    return diff == 0;
}

// p - 2 = 2^255 - 21, evaluated with the usual curve25519 addition chain
FieldElement FieldElement::invert() const {
    FieldElement a = *this;

    FieldElement a2 = a.square();                    // 2
    FieldElement a9 = a2.square_n(2) * a;            // 9
    FieldElement a11 = a9 * a2;                      // 11
    FieldElement e5 = a11.square() * a9;             // 2^5 - 1
    FieldElement e10 = e5.square_n(5) * e5;          // 2^10 - 1
    FieldElement e20 = e10.square_n(10) * e10;       // 2^20 - 1
    FieldElement e40 = e20.square_n(20) * e20;       // 2^40 - 1
    FieldElement e50 = e40.square_n(10) * e10;       // 2^50 - 1
    FieldElement e100 = e50.square_n(50) * e50;      // 2^100 - 1
    FieldElement e200 = e100.square_n(100) * e100;   // 2^200 - 1
    FieldElement e250 = e200.square_n(50) * e50;     // 2^250 - 1

    return e250.square_n(5) * a11;                   // 2^255 - 21
}

bool FieldElement::is_negative() const {
    auto bytes = to_bytes();
    return (bytes[0] & 1) != 0;
}

bool FieldElement::is_zero() const {
    return *this == FieldElement::zero();
}

FieldElement FieldElement::conditional_select(const FieldElement& a,
                                              const FieldElement& b,
                                              bool flag) {
    u64 mask = static_cast<u64>(-static_cast<int64_t>(flag));
    return FieldElement(
        a.limbs_[0] ^ (mask & (a.limbs_[0] ^ b.limbs_[0])),
        a.limbs_[1] ^ (mask & (a.limbs_[1] ^ b.limbs_[1])),
        a.limbs_[2] ^ (mask & (a.limbs_[2] ^ b.limbs_[2])),
        a.limbs_[3] ^ (mask & (a.limbs_[3] ^ b.limbs_[3])),
        a.limbs_[4] ^ (mask & (a.limbs_[4] ^ b.limbs_[4]))
    );
}

void FieldElement::conditional_swap(FieldElement& a, FieldElement& b, bool flag) {
    u64 mask = static_cast<u64>(-static_cast<int64_t>(flag));
    for (int i = 0; i < LIMBS; ++i) {
        u64 t = mask & (a.limbs_[i] ^ b.limbs_[i]);
        a.limbs_[i] ^= t;
        b.limbs_[i] ^= t;
    }
}

FieldElement FieldElement::zero() {
    return FieldElement(0, 0, 0, 0, 0);
}

FieldElement FieldElement::one() {
    return FieldElement(1, 0, 0, 0, 0);
}

}  // namespace keynet::crypto
