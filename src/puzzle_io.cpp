#include "puzzle_io.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

static bool is_separator_line(const std::string& line) {
    bool has_rule = false;
    for (char ch : line) {
        if (ch == '-' || ch == '+') has_rule = true;
        else if (!std::isspace(static_cast<unsigned char>(ch))) return false;
    }
    return has_rule;
}

static int parse_value(const std::string& token, int n) {
    if (token == ".") return 0;
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(token, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("unexpected token '" + token + "' in puzzle");
    }
    if (used != token.size() || value < 0 || value > n) {
        throw std::invalid_argument("value '" + token + "' is outside 0.." + std::to_string(n));
    }
    return value;
}

Grid parse_grid(const std::string& text, const BoxShape& shape) {
    shape.validate();
    const int n = shape.size();

    std::vector<int> values;
    values.reserve(shape.cell_count());

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#' || is_separator_line(line)) continue;

        std::replace_if(line.begin(), line.end(),
                        [](char ch) { return ch == ',' || ch == '|'; }, ' ');

        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            bool packed = n <= 9 && token.size() > 1 &&
                          std::all_of(token.begin(), token.end(), [](char ch) {
                              return ch == '.' || std::isdigit(static_cast<unsigned char>(ch));
                          });
            if (!packed) {
                values.push_back(parse_value(token, n));
                continue;
            }
            for (char ch : token) values.push_back(parse_value(std::string(1, ch), n));
        }
    }

    if (static_cast<int>(values.size()) != shape.cell_count()) {
        throw std::invalid_argument("expected " + std::to_string(shape.cell_count()) +
                                    " values for a " + std::to_string(n) + "x" +
                                    std::to_string(n) + " grid, found " +
                                    std::to_string(values.size()));
    }

    Grid grid = make_empty_grid(shape);
    for (int i = 0; i < shape.cell_count(); ++i) grid[i / n][i % n] = values[i];
    return grid;
}

Grid load_grid(const std::string& path, const BoxShape& shape) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("could not read puzzle file " + path);

    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_grid(contents.str(), shape);
}

std::string format_grid(const Grid& grid) {
    std::ostringstream out;
    for (const auto& row : grid) {
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) out << ' ';
            out << row[c];
        }
        out << '\n';
    }
    return out.str();
}
