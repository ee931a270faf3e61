/**
 * @file puzzle_errors.hpp
 * @brief Exception types raised when a puzzle instance is rejected.
 */

#ifndef __PUZZLE_ERRORS_HPP___
#define __PUZZLE_ERRORS_HPP___

#include <stdexcept>
#include <string>

/**
 * @brief Common base for every rejection reported by the solver.
 *
 * Catch `PuzzleError` to handle all three error kinds at once.
 */
class PuzzleError {
public:
    virtual ~PuzzleError() = default;
};

/**
 * @brief A board does not hold exactly 9 symbols.
 */
class SizeMismatchError : public std::invalid_argument, public PuzzleError {
public:
    explicit SizeMismatchError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Start and goal are not permutations of the same 9 symbols
 * (repeated symbol, foreign symbol, missing or repeated blank).
 */
class AlphabetMismatchError : public std::invalid_argument, public PuzzleError {
public:
    explicit AlphabetMismatchError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief The goal cannot be reached from the start.
 */
class UnsolvableError : public std::runtime_error, public PuzzleError {
public:
    explicit UnsolvableError(const std::string& what) : std::runtime_error(what) {}
};

#endif // __PUZZLE_ERRORS_HPP___
