#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace retrace::core {

// Random (version 4) UUID held as two 64-bit halves. Checkpoint ids are
// minted from these so ids stay unique across sessions sharing a project.
class UUID {
public:
    UUID() = default;

    static UUID generate() {
        static thread_local std::mt19937_64 gen{std::random_device{}()};
        UUID out;
        out.hi_ = (gen() & ~0xF000ULL) | 0x4000ULL;                            // version 4
        out.lo_ = (gen() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant
        return out;
    }

    // Canonical 8-4-4-4-12 form only; anything else yields the nil UUID
    static UUID from_string(std::string_view text) {
        if (text.size() != 36) return {};
        UUID out;
        int nibbles = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') return {};
                continue;
            }
            auto v = hex_value(text[i]);
            if (!v) return {};
            uint64_t& half = nibbles < 16 ? out.hi_ : out.lo_;
            half = (half << 4) | *v;
            ++nibbles;
        }
        return out;
    }

    std::string to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (int n = 0; n < 32; ++n) {
            if (n == 8 || n == 12 || n == 16 || n == 20) out.push_back('-');
            uint64_t half = n < 16 ? hi_ : lo_;
            int shift = 60 - 4 * (n % 16);
            out.push_back(digits[(half >> shift) & 0xF]);
        }
        return out;
    }

    bool is_valid() const { return hi_ != 0 || lo_ != 0; }

    bool operator==(const UUID& other) const { return hi_ == other.hi_ && lo_ == other.lo_; }
    bool operator!=(const UUID& other) const { return !(*this == other); }

private:
    uint64_t hi_ = 0;
    uint64_t lo_ = 0;

    static std::optional<uint64_t> hex_value(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint64_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint64_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint64_t>(c - 'A' + 10);
        return std::nullopt;
    }
};

inline std::string generate_checkpoint_id() {
    return UUID::generate().to_string();
}

}  // namespace retrace::core
