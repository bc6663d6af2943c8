#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace testbox {

/**
 * @brief Looks up an environment variable of the harness process
 * @param key name of the variable
 * @param def_value returned when the variable is not set
 * @return value of the variable, or def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief Splits "KEY=VALUE" at the first '='
 * @throw std::invalid_argument when there is no '=' or the key is empty
 */
std::pair<std::string, std::string> split_assignment(const std::string &entry);

/**
 * @brief Parses a duration given in (possibly fractional) seconds, e.g. "1.5"
 * @throw std::invalid_argument when the text is not a finite non-negative number
 */
std::chrono::milliseconds parse_seconds(const std::string &text);

bool is_number(const std::string &s);

}  // namespace testbox
