#ifndef GFD_CAST_H
#define GFD_CAST_H


#include <string>
#include <variant>
#include <optional>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "gfd_types.h"
#include "gfd_vocab.h"


namespace gfd
{


/*
* A literal value in comparable form. Raw lexical forms, and
* anything which failed to convert, stay as `std::string`.
* Numbers become doubles, datetimes become UTC `ptime`s and date
* fragments become day counts (see `gfrag_to_days`).
*/
typedef std::variant<std::string, double, boost::posix_time::ptime, long> NormalValue;


/*
* Canonicalise `value` according to the family of `datatype`:
* NUMERIC    -> parsed as a double
* DATETIME   -> parsed as an ISO-8601 datetime (bare dates at midnight)
* DATEFRAG   -> converted to a day count
* STRING     -> whitespace trimmed and lower-cased
* Any other datatype leaves the value as is, and so does a
* conversion failure; nothing is thrown.
* Only the `std::string` alternative is ever converted, so
* cast_value(cast_value(v, d), d) == cast_value(v, d).
*/
NormalValue cast_value(NormalValue value, const std::string& datatype);


/*
* Canonicalise a literal's lexical value under its indexed
* datatype (see `literal_datatype`).
*/
NormalValue cast_literal(const Literal& l, const Vocabulary& vocab);


/*
* Render a normal value as a string. Distinct values of the same
* alternative render distinctly.
*/
std::string normal_value_str(const NormalValue& v);


std::optional<double> parse_double(const std::string& s);


/*
* Parse an ISO-8601 extended datetime, with optional fractional
* seconds and an optional `Z` / `+HH:MM` / `-HH:MM` offset, which
* is applied so that the result is in UTC. A bare date is taken
* at midnight.
*/
std::optional<boost::posix_time::ptime> parse_datetime(const std::string& s);


}  // namespace gfd


#endif  // GFD_CAST_H
