#include "keynet/crypto/edwards25519.hpp"

namespace keynet::crypto {

namespace {

// 2*d, d = -121665/121666
constexpr uint8_t D2_BYTES[32] = {
    0x59, 0xf1, 0xb2, 0x26, 0x94, 0x9b, 0xd6, 0xeb,
    0x56, 0xb1, 0x83, 0x82, 0x9a, 0x14, 0xe0, 0x00,
    0x30, 0xd1, 0xf3, 0xee, 0xf2, 0x80, 0x8e, 0x19,
    0xe7, 0xfc, 0xdf, 0x56, 0xdc, 0xd9, 0x06, 0x24,
};

// Base point B = (x, 4/5) with x even
constexpr uint8_t BASE_X_BYTES[32] = {
    0x1a, 0xd5, 0x25, 0x8f, 0x60, 0x2d, 0x56, 0xc9,
    0xb2, 0xa7, 0x25, 0x95, 0x60, 0xc7, 0x2c, 0x69,
    0x5c, 0xdc, 0xd6, 0xfd, 0x31, 0xe2, 0xa4, 0xc0,
    0xfe, 0x53, 0x6e, 0xcd, 0xd3, 0x36, 0x69, 0x21,
};

constexpr uint8_t BASE_Y_BYTES[32] = {
    0x58, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
    0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
    0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
    0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
};

const FieldElement& curve_d2() {
    static const FieldElement d2 = FieldElement::from_bytes(std::span<const uint8_t, 32>(D2_BYTES));
    return d2;
}

}  // namespace

EdwardsPoint::EdwardsPoint()
    : x_(FieldElement::zero())
    , y_(FieldElement::one())
    , z_(FieldElement::one())
    , t_(FieldElement::zero()) {}

EdwardsPoint EdwardsPoint::identity() {
    return EdwardsPoint();
}

EdwardsPoint EdwardsPoint::base_point() {
    static const EdwardsPoint base = [] {
        auto x = FieldElement::from_bytes(std::span<const uint8_t, 32>(BASE_X_BYTES));
        auto y = FieldElement::from_bytes(std::span<const uint8_t, 32>(BASE_Y_BYTES));
        return EdwardsPoint(x, y, FieldElement::one(), x * y);
    }();
    return base;
}

// add-2008-hwcd-3 (a = -1)
EdwardsPoint EdwardsPoint::operator+(const EdwardsPoint& rhs) const {
    FieldElement a = (y_ - x_) * (rhs.y_ - rhs.x_);
    FieldElement b = (y_ + x_) * (rhs.y_ + rhs.x_);
    FieldElement c = t_ * curve_d2() * rhs.t_;
    FieldElement zz = z_ * rhs.z_;
    FieldElement d = zz + zz;

    FieldElement e = b - a;
    FieldElement f = d - c;
    FieldElement g = d + c;
    FieldElement h = b + a;

    return EdwardsPoint(e * f, g * h, f * g, e * h);
}

void EdwardsPoint::conditional_swap(EdwardsPoint& a, EdwardsPoint& b, bool flag) {
    FieldElement::conditional_swap(a.x_, b.x_, flag);
    FieldElement::conditional_swap(a.y_, b.y_, flag);
    FieldElement::conditional_swap(a.z_, b.z_, flag);
    FieldElement::conditional_swap(a.t_, b.t_, flag);
}

EdwardsPoint EdwardsPoint::scalar_mul(std::span<const uint8_t, 32> scalar) const {
    // Montgomery ladder: invariant r1 = r0 + P
    EdwardsPoint r0 = identity();
    EdwardsPoint r1 = *this;

    for (int i = 255; i >= 0; --i) {
        bool bit = ((scalar[i / 8] >> (i % 8)) & 1) != 0;
        conditional_swap(r0, r1, bit);
        r1 = r0 + r1;
        r0 = r0.twice();
        conditional_swap(r0, r1, bit);
    }

    return r0;
}

EdwardsPoint EdwardsPoint::scalar_mul_base(std::span<const uint8_t, 32> scalar) {
    return base_point().scalar_mul(scalar);
}

std::array<uint8_t, 32> EdwardsPoint::compress() const {
    FieldElement z_inv = z_.invert();
    FieldElement x = x_ * z_inv;
    FieldElement y = y_ * z_inv;

    auto out = y.to_bytes();
    out[31] |= static_cast<uint8_t>(x.is_negative() ? 0x80 : 0x00);
    return out;
}

bool EdwardsPoint::operator==(const EdwardsPoint& rhs) const {
    // x1/z1 == x2/z2 and y1/z1 == y2/z2
    return (x_ * rhs.z_) == (rhs.x_ * z_) && (y_ * rhs.z_) == (rhs.y_ * z_);
}

}  // namespace keynet::crypto
