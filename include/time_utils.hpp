#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a duration in milliseconds as a short string like 1m2.345s.
 */
std::string format_elapsed(std::chrono::milliseconds dur);

/**
 * @brief Convert a calendar time to the packed MS-DOS date/time pair used by
 *        zip headers.
 *
 * Times before 1980 clamp to 1980-01-01 00:00:00.
 *
 * @param t        Time to convert (interpreted as local time).
 * @param dos_date Output date field.
 * @param dos_time Output time field.
 */
void to_dos_datetime(std::time_t t, unsigned short& dos_date, unsigned short& dos_time);

#endif // TIME_UTILS_HPP
