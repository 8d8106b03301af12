#pragma once

#include "keynet/crypto/field25519.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace keynet::crypto {

// Point on the twisted Edwards curve -x^2 + y^2 = 1 + d*x^2*y^2 over
// GF(2^255-19), in extended coordinates (X:Y:Z:T) with x = X/Z, y = Y/Z, T = XY/Z.
class EdwardsPoint {
public:
    // Neutral element (0, 1)
    EdwardsPoint();

    static EdwardsPoint identity();
    static EdwardsPoint base_point();

    // Unified addition (also valid for doubling)
    [[nodiscard]] EdwardsPoint operator+(const EdwardsPoint& rhs) const;
    [[nodiscard]] EdwardsPoint twice() const { return *this + *this; }

    // scalar * this, with the scalar as 32 little-endian bytes. Runs a fixed
    // 256-step ladder regardless of the scalar value.
    [[nodiscard]] EdwardsPoint scalar_mul(std::span<const uint8_t, 32> scalar) const;

    // scalar * B
    [[nodiscard]] static EdwardsPoint scalar_mul_base(std::span<const uint8_t, 32> scalar);

    // RFC 8032 compressed encoding: y with the sign of x in bit 255
    [[nodiscard]] std::array<uint8_t, 32> compress() const;

    // Projective equality
    [[nodiscard]] bool operator==(const EdwardsPoint& rhs) const;

    static void conditional_swap(EdwardsPoint& a, EdwardsPoint& b, bool flag);

private:
    EdwardsPoint(const FieldElement& x, const FieldElement& y,
                 const FieldElement& z, const FieldElement& t)
        : x_(x), y_(y), z_(z), t_(t) {}

    FieldElement x_;
    FieldElement y_;
    FieldElement z_;
    FieldElement t_;
};

}  // namespace keynet::crypto
