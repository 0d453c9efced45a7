#pragma once

#include <string>

#include "box_shape.hpp"
#include "sudoku.hpp"

/**
 * Parses a puzzle from text.
 *
 * Values are separated by whitespace, commas or '|'; '.' and '0' mark empty
 * cells. For grids up to 9x9 a token may also pack one digit per cell, so
 * "9.63.4.81." rows and single 81-character lines are accepted. Lines starting
 * with '#' and separator lines made of '-' and '+' are skipped, which makes
 * print_grid() output readable again.
 *
 * @throws std::invalid_argument when the text does not hold exactly N*N values.
 */
Grid parse_grid(const std::string& text, const BoxShape& shape);

// Reads and parses a puzzle file; throws std::runtime_error if it cannot be read.
Grid load_grid(const std::string& path, const BoxShape& shape);

// One row per line, values separated by single spaces.
std::string format_grid(const Grid& grid);
