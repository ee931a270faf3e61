#ifndef __STATE_FILE_OPERATIONS_HPP___
#define __STATE_FILE_OPERATIONS_HPP___

#include <string>
#include <vector>

/**
 * @file state_file_operations.hpp
 * @brief Simple helpers to read/write boards from plain text files.
 *
 * The file format is a minimal plain-text format: the first line contains
 * `side_length` (always 3) and the blank symbol, followed by the 9 symbols of
 * the board in row-major order.
 */

/**
 * @brief A board read from a file together with its blank symbol.
 */
struct BoardFile {
    std::vector<int> board;
    int blank;
};

/**
 * @brief Read a board from a simple plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened or is malformed.
 * @return Board symbols and blank symbol.
 */
BoardFile read_board_from_file(const std::string& filename);

/**
 * @brief Write a board to a simple plain-text file.
 *
 * @param board Board symbols in row-major order.
 * @param blank Blank symbol.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_board_to_file(const std::vector<int>& board, int blank, const std::string& filename);

/**
 * @brief Parse a 9-character board such as "123456780"; each character is one symbol.
 *
 * @throws SizeMismatchError if `text` is not 9 characters long.
 */
std::vector<int> parse_board(const std::string& text);

#endif // __STATE_FILE_OPERATIONS_HPP___
