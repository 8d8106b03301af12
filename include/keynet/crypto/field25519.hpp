#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace keynet::crypto {

// Element of GF(2^255-19) in radix-2^51 (5 limbs). Arithmetic, swaps and
// selects do not branch on limb values. Products use __int128 intermediates.
class FieldElement {
public:
    static constexpr int LIMBS = 5;
    static constexpr uint64_t MASK51 = (1ULL << 51) - 1;

    FieldElement() : limbs_{} {}

    explicit FieldElement(uint64_t l0, uint64_t l1, uint64_t l2,
                          uint64_t l3, uint64_t l4)
        : limbs_{l0, l1, l2, l3, l4} {}

    // Little-endian, bit 255 ignored
    static FieldElement from_bytes(std::span<const uint8_t, 32> bytes);

    // Canonical little-endian encoding
    void to_bytes(std::span<uint8_t, 32> out) const;
    [[nodiscard]] std::array<uint8_t, 32> to_bytes() const;

    [[nodiscard]] FieldElement operator+(const FieldElement& rhs) const;
    [[nodiscard]] FieldElement operator-(const FieldElement& rhs) const;
    [[nodiscard]] FieldElement operator*(const FieldElement& rhs) const;

    [[nodiscard]] bool operator==(const FieldElement& rhs) const;
    [[nodiscard]] bool operator!=(const FieldElement& rhs) const { return !(*this == rhs); }

    [[nodiscard]] FieldElement square() const;
    [[nodiscard]] FieldElement square_n(int n) const;

    // a^(p-2)
    [[nodiscard]] FieldElement invert() const;

    // Low bit of the canonical encoding (the "sign" of an x coordinate)
    [[nodiscard]] bool is_negative() const;
    [[nodiscard]] bool is_zero() const;

    // Returns a if flag is false, b if flag is true
    static FieldElement conditional_select(const FieldElement& a,
                                           const FieldElement& b,
                                           bool flag);
    static void conditional_swap(FieldElement& a, FieldElement& b, bool flag);

    static FieldElement zero();
    static FieldElement one();

private:
    uint64_t limbs_[LIMBS];

    // Propagate carries so every limb fits in 51 bits (plus a small excess in limb 0)
    void carry();

    // Reduce to the canonical range [0, p)
    void reduce();
};

}  // namespace keynet::crypto
