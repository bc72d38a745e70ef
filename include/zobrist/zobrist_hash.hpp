#pragma once

#include "config.hpp"
#include "fx_hasher.hpp"

#if ZOBRIST_VERIFY_ENABLED
#include "bounded_set.hpp"
#include "diagnostics.hpp"

#include <optional>
#endif

#include <cstdint>

namespace zobrist {

/// Zobrist hashing of a mutable set of elements of type E.
///
/// The fingerprint is the XOR of fx_hash(e) over every element the caller
/// has added and not yet removed. Since XOR is commutative and self-inverse
/// the fingerprint does not depend on the order of calls, and add() and
/// remove() are the same bit operation. There is no table of random keys:
/// each element is hashed on the fly, so the type needs no context.
///
/// The set itself is not stored. Which elements are "present" is entirely
/// up to the caller's sequence of add()/remove() calls.
///
/// With ZOBRIST_CHECK_SET_BEHAVIOR=1 in a build without NDEBUG every call
/// is first checked against an embedded BoundedSet: adding a present element
/// or removing an absent one aborts. Otherwise the check is compiled out
/// and the object is a single uint64_t.
///
/// Example (see examples/chess_board.hpp):
///
///   ZobristHash<std::tuple<std::size_t, std::size_t, Piece>> z;
///   z.add({1, 0, Piece::WhitePawn});
///   uint64_t before = z.value();
///   z.remove({1, 0, Piece::WhitePawn});
///   z.add({1, 0, Piece::WhitePawn});
///   assert(z.value() == before);
template <class E>
class ZobristHash {
  public:
    using value_type = E;

    /// The empty set, fingerprint 0.
    ZobristHash() noexcept = default;

    /// Restore from a previously extracted fingerprint. The element set
    /// behind `raw` is unknown, so a restored instance is never checked.
#if ZOBRIST_VERIFY_ENABLED
    explicit ZobristHash(uint64_t raw) noexcept
        : hash_(raw), checker_(std::nullopt) {}
#else
    explicit ZobristHash(uint64_t raw) noexcept : hash_(raw) {}
#endif

    static ZobristHash empty() noexcept { return ZobristHash(); }
    static ZobristHash from_raw(uint64_t raw) noexcept {
        return ZobristHash(raw);
    }

#if ZOBRIST_VERIFY_ENABLED
    void add(const E &key) {
        if (checker_ && checker_->size() == checker_->capacity() &&
            !checker_->contains(key))
            ZOBRIST_FATAL("ZobristHash::add: checker cannot track more than "
                          "%zu elements; raise ZOBRIST_CHECKER_CAPACITY or "
                          "build without ZOBRIST_CHECK_SET_BEHAVIOR",
                          checker_->capacity());
        ZOBRIST_VERIFY(!checker_ || checker_->insert(key),
                       "ZobristHash::add: element is already in the set");
        toggle(key);
    }

    void remove(const E &key) {
        ZOBRIST_VERIFY(!checker_ || checker_->remove(key),
                       "ZobristHash::remove: element is not in the set");
        toggle(key);
    }

    /// False for instances restored with from_raw().
    bool is_checked() const noexcept { return checker_.has_value(); }
#else
    void add(const E &key) { toggle(key); }

    void remove(const E &key) { toggle(key); }

    static constexpr bool is_checked() noexcept { return false; }
#endif

    uint64_t value() const noexcept { return hash_; }
    explicit operator uint64_t() const noexcept { return hash_; }

    friend bool operator==(const ZobristHash &a, const ZobristHash &b) noexcept {
        return a.hash_ == b.hash_;
    }
    friend bool operator!=(const ZobristHash &a, const ZobristHash &b) noexcept {
        return a.hash_ != b.hash_;
    }

  private:
    void toggle(const E &key) { hash_ ^= fx_hash(key); }

    uint64_t hash_ = 0;
#if ZOBRIST_VERIFY_ENABLED
    std::optional<BoundedSet<E, checker_capacity>> checker_{std::in_place};
#endif
};

} // namespace zobrist
