/**
 * @file factoradic.hpp
 * @brief Factorial number system and permutation indexing.
 *
 * Permutation indices give a compact way to enumerate or sample all 9! boards.
 */

#ifndef __FACTORADIC_HPP___
#define __FACTORADIC_HPP___

#include <cstdint>
#include <ostream>
#include <vector>

/**
 * @brief A number in the factorial base.
 *
 * Digits are stored least significant first; digit i is in [0, i], so digit 0
 * is always zero.
 */
class Factoradic {

private:
    std::vector<uint64_t> digits;
public:
    explicit Factoradic(uint64_t n);
    explicit Factoradic(const std::vector<uint64_t>& digits);

    uint64_t to_integer() const;

    /**
     * @brief Digits most significant first, left-padded with zeros to `width`.
     */
    std::vector<uint64_t> to_rev_vec(size_t width = 0) const;

    const std::vector<uint64_t>& get_digits() const;

    /**
     * @brief Digit-wise sum with carry.
     *
     * @throws std::invalid_argument if the operands have different lengths.
     */
    Factoradic operator+(const Factoradic& other) const;

    bool operator==(const Factoradic& rhs) const;
};

/**
 * @brief Writes `Fact[d_n, ..., d_0]`.
 */
std::ostream& operator<<(std::ostream& out, const Factoradic& value);

uint64_t factorial(unsigned n);

/**
 * @brief The `index`-th permutation of `items` in lexicographic order of positions.
 *
 * @throws std::out_of_range if `index >= items.size()!`.
 */
std::vector<int> nth_permutation(const std::vector<int>& items, uint64_t index);

/**
 * @brief Lexicographic index of a permutation of 0..n-1; inverse of `nth_permutation`.
 *
 * @throws std::invalid_argument if `perm` is not a permutation of 0..n-1.
 */
uint64_t permutation_rank(const std::vector<int>& perm);

#endif // __FACTORADIC_HPP___
