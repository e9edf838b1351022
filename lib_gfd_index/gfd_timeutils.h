#ifndef GFD_TIMEUTILS_H
#define GFD_TIMEUTILS_H


#include <string>
#include <optional>


namespace gfd
{


bool is_leap_year(long y);


/*
* pre: 1 <= m <= 12
*/
unsigned days_in_month(long y, unsigned m);


/*
* Number of days from 1970-01-01 to the given proleptic Gregorian
* date (negative for earlier dates).
* pre: 1 <= m <= 12 and 1 <= d <= days_in_month(y, m)
*/
long days_from_civil(long y, unsigned m, unsigned d);


/*
* Convert a Gregorian date fragment into an integer day count, so
* fragments of the same datatype can be compared and ordered:
*   gYear       "YYYY"     -> days_from_civil(Y, 1, 1)
*   gYearMonth  "YYYY-MM"  -> days_from_civil(Y, M, 1)
*   gMonth      "--MM"     -> zero-based day of year of M-01
*   gMonthDay   "--MM-DD"  -> zero-based day of year of M-D
*   gDay        "---DD"    -> D - 1
* Day-of-year values are taken in a leap year so that "--02-29"
* is valid. A trailing timezone (Z, +HH:MM, -HH:MM) is ignored.
* Returns std::nullopt if `lexical` is malformed or `datatype` is
* not one of the five fragment datatypes.
*/
std::optional<long> gfrag_to_days(const std::string& lexical, const std::string& datatype);


}  // namespace gfd


#endif  // GFD_TIMEUTILS_H
