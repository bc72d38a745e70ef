#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace zobrist {

/// Rotate a 64-bit word left by r bits. Only r mod 64 counts.
constexpr uint64_t rotl64(uint64_t x, unsigned r) noexcept {
    r &= 63;
    return (x << r) | (x >> ((64 - r) & 63));
}

/// The "Fx" hash used by rustc and Firefox: one rotate, one xor and one
/// multiply per machine word. Fast and deterministic, but not collision
/// resistant against adversarial input.
///
/// Input is consumed as 64-bit words. Byte strings are split into
/// 8/4/2/1-byte chunks, each chunk read little-endian-as-stored.
class FxHasher {
  public:
    static constexpr uint64_t seed = 0x517cc1b727220a95ULL;
    static constexpr unsigned rotate = 5;

    constexpr FxHasher() noexcept : state_(0) {}
    /// Resume from a digest returned by finish().
    constexpr explicit FxHasher(uint64_t state) noexcept : state_(state) {}

    // ----- word input -----

    constexpr void write_u64(uint64_t word) noexcept {
        state_ = (rotl64(state_, rotate) ^ word) * seed;
    }

    /// Feed raw bytes.
    void write(const void *data, std::size_t len) noexcept {
        const auto *p = static_cast<const unsigned char *>(data);
        while (len >= 8) {
            uint64_t w;
            std::memcpy(&w, p, 8);
            write_u64(w);
            p += 8;
            len -= 8;
        }
        if (len >= 4) {
            uint32_t w;
            std::memcpy(&w, p, 4);
            write_u64(w);
            p += 4;
            len -= 4;
        }
        if (len >= 2) {
            uint16_t w;
            std::memcpy(&w, p, 2);
            write_u64(w);
            p += 2;
            len -= 2;
        }
        if (len >= 1)
            write_u64(*p);
    }

    /// Current digest. Does not reset the hasher.
    constexpr uint64_t finish() const noexcept { return state_; }

  private:
    uint64_t state_;
};

// ============================================================
// HashAppend: how a value of type T is fed into an FxHasher.
//
// Specialise HashAppend<T> for your own element types:
//
//   namespace zobrist {
//   template <> struct HashAppend<Move> {
//       void operator()(FxHasher &h, const Move &m) const {
//           hash_append(h, m.from);
//           hash_append(h, m.to);
//       }
//   };
//   }
// ============================================================

template <class T, class Enable = void>
struct HashAppend;

template <class T>
void hash_append(FxHasher &h, const T &v) {
    HashAppend<T>{}(h, v);
}

template <class T>
struct HashAppend<T, std::enable_if_t<std::is_integral_v<T>>> {
    void operator()(FxHasher &h, T v) const noexcept {
        // Sign-extend so that int(-1) and long(-1) hash alike.
        if constexpr (std::is_signed_v<T>)
            h.write_u64(static_cast<uint64_t>(static_cast<int64_t>(v)));
        else
            h.write_u64(static_cast<uint64_t>(v));
    }
};

template <class T>
struct HashAppend<T, std::enable_if_t<std::is_enum_v<T>>> {
    void operator()(FxHasher &h, T v) const {
        hash_append(h, static_cast<std::underlying_type_t<T>>(v));
    }
};

template <class A, class B>
struct HashAppend<std::pair<A, B>> {
    void operator()(FxHasher &h, const std::pair<A, B> &v) const {
        hash_append(h, v.first);
        hash_append(h, v.second);
    }
};

template <class... Ts>
struct HashAppend<std::tuple<Ts...>> {
    void operator()(FxHasher &h, const std::tuple<Ts...> &v) const {
        std::apply([&h](const Ts &...xs) { (hash_append(h, xs), ...); }, v);
    }
};

template <class T, std::size_t N>
struct HashAppend<std::array<T, N>> {
    void operator()(FxHasher &h, const std::array<T, N> &v) const {
        for (const auto &x : v)
            hash_append(h, x);
    }
};

template <class T>
struct HashAppend<std::optional<T>> {
    void operator()(FxHasher &h, const std::optional<T> &v) const {
        h.write_u64(v.has_value() ? 1 : 0);
        if (v)
            hash_append(h, *v);
    }
};

template <>
struct HashAppend<std::string_view> {
    void operator()(FxHasher &h, std::string_view s) const noexcept {
        h.write(s.data(), s.size());
        // Length terminator keeps ("ab","c") apart from ("a","bc").
        h.write_u64(s.size());
    }
};

template <>
struct HashAppend<std::string> {
    void operator()(FxHasher &h, const std::string &s) const noexcept {
        hash_append(h, std::string_view(s));
    }
};

/// Digest of a single value, starting from a fresh hasher.
template <class T>
uint64_t fx_hash(const T &v) {
    FxHasher h;
    hash_append(h, v);
    return h.finish();
}

} // namespace zobrist
