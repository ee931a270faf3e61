/**
 * @file trace_printer.hpp
 * @brief Text rendering of boards and solution traces.
 */

#ifndef __TRACE_PRINTER_HPP___
#define __TRACE_PRINTER_HPP___

#include <ostream>
#include <string>
#include <vector>

#include "packed_state.hpp"

/**
 * @brief Print one board as three rows, blank shown as a space.
 *
 * Symbols in the printable ASCII range are written as characters, all other
 * values as integers.
 */
void print_board(std::ostream& out, const std::vector<int>& board, int blank);

/**
 * @brief Print every board of a trace, each followed by an empty line.
 */
void print_trace(std::ostream& out, const std::vector<std::vector<int>>& boards, int blank);

/**
 * @brief Print a packed trace directly as tile codes.
 */
void print_packed_trace(std::ostream& out, const std::vector<PackedState>& trace);

/**
 * @brief `0b...` literal of a state, 32 digits wide.
 */
std::string format_packed_state(PackedState state);

#endif // __TRACE_PRINTER_HPP___
