#pragma once

#include "diagnostics.hpp"
#include "fx_hasher.hpp"

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <utility>

namespace zobrist {

/// A fixed-capacity set of elements of type E, stored as the FxHash digests
/// ("probe keys") of the elements in a plain array. Capacity is the maximum
/// number of elements present at the same time.
///
/// The occupied slots always form the prefix [0, size()). Lookup is a linear
/// scan of that prefix; removal swaps the last occupied slot into the hole.
///
/// The set never allocates and is trivially copyable: a copy is a fully
/// independent set. Two distinct elements with the same probe key are
/// indistinguishable.
///
/// Inserting a new element into a full set is fatal.
template <class E, std::size_t Capacity>
class BoundedSet {
    static_assert(Capacity > 0, "Capacity must be > 0");

  public:
    using value_type = E;
    using key_type = uint64_t;

    constexpr BoundedSet() noexcept : keys_{}, len_(0) {}

    /// Build a set holding every element of [first, last).
    template <class It>
    BoundedSet(It first, It last) : BoundedSet() {
        for (; first != last; ++first)
            insert(*first);
    }

    /// Build a set holding every element of a container, e.g. a
    /// std::unordered_set<E>.
    template <class Container,
              class = decltype(std::begin(std::declval<const Container &>()))>
    explicit BoundedSet(const Container &c)
        : BoundedSet(std::begin(c), std::end(c)) {}

    static constexpr BoundedSet empty() noexcept { return BoundedSet(); }

    /// Insert `key`. Returns false, without mutating, if an element with the
    /// same probe key is already present.
    bool insert(const E &key) {
        const key_type p = fx_hash(key);
        if (find(p) != npos)
            return false;
        if (len_ == Capacity)
            ZOBRIST_FATAL("BoundedSet::insert: capacity of %zu elements exceeded",
                          Capacity);
        keys_[len_++] = p;
        return true;
    }

    /// Remove `key`. Returns true if it was present.
    bool remove(const E &key) {
        std::size_t i = find(fx_hash(key));
        if (i == npos)
            return false;
        assert(len_ > 0);
        std::swap(keys_[i], keys_[len_ - 1]);
        --len_;
        return true;
    }

    bool contains(const E &key) const { return find(fx_hash(key)) != npos; }

    /// Number of elements currently present.
    constexpr std::size_t size() const noexcept { return len_; }

    constexpr bool is_empty() const noexcept { return len_ == 0; }

    static constexpr std::size_t capacity() noexcept { return Capacity; }

    /// Same probe keys in the same slots.
    friend bool operator==(const BoundedSet &a, const BoundedSet &b) noexcept {
        if (a.len_ != b.len_)
            return false;
        for (std::size_t i = 0; i < a.len_; ++i) {
            if (a.keys_[i] != b.keys_[i])
                return false;
        }
        return true;
    }
    friend bool operator!=(const BoundedSet &a, const BoundedSet &b) noexcept {
        return !(a == b);
    }

  private:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    std::size_t find(key_type p) const noexcept {
        for (std::size_t i = 0; i < len_; ++i) {
            if (keys_[i] == p)
                return i;
        }
        return npos;
    }

    std::array<key_type, Capacity> keys_;
    std::size_t len_;
};

} // namespace zobrist
