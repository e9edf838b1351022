#include <cctype>
#include <limits>
#include <sstream>
#include <locale>
#include <algorithm>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "gfd_cast.h"
#include "gfd_timeutils.h"


namespace gfd
{


namespace
{


std::string trim(const std::string& s)
{
	auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
	auto first = std::find_if_not(s.begin(), s.end(), is_space);
	auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
	return (first < last) ? std::string(first, last) : std::string();
}


std::string to_lower(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(),
		[](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
	return s;
}


/*
* Split a trailing timezone off `s` and return its offset from
* UTC in minutes (0 if there is no timezone).
* Returns std::nullopt if the timezone is malformed.
*/
std::optional<long> split_timezone(std::string& s)
{
	if (!s.empty() && s.back() == 'Z')
	{
		s.pop_back();
		return 0;
	}

	if (s.size() < 6)
		return 0;

	const size_t tz = s.size() - 6;
	if ((s[tz] != '+' && s[tz] != '-') || s[tz + 3] != ':')
		return 0;

	for (size_t i : { tz + 1, tz + 2, tz + 4, tz + 5 })
		if (!std::isdigit(static_cast<unsigned char>(s[i])))
			return std::nullopt;

	const long hours = (s[tz + 1] - '0') * 10 + (s[tz + 2] - '0');
	const long minutes = (s[tz + 4] - '0') * 10 + (s[tz + 5] - '0');
	if (hours > 14 || minutes > 59)
		return std::nullopt;

	const long sign = (s[tz] == '-') ? -1 : 1;
	s.erase(tz);
	return sign * (hours * 60 + minutes);
}


struct NormalValueToStringVisitor
{
	std::string operator()(const std::string& s) const
	{
		return s;
	}
	std::string operator()(double d) const
	{
		std::ostringstream os;
		os.precision(std::numeric_limits<double>::max_digits10);
		os << d;
		return os.str();
	}
	std::string operator()(const boost::posix_time::ptime& t) const
	{
		return boost::posix_time::to_iso_extended_string(t);
	}
	std::string operator()(long days) const
	{
		return std::to_string(days);
	}
};


}  // namespace


std::optional<double> parse_double(const std::string& s)
{
	const std::string t = trim(s);
	if (t.empty())
		return std::nullopt;

	// decimal notation only (no hex), whatever the global locale
	std::istringstream is(t);
	is.imbue(std::locale::classic());

	double d = 0.0;
	is >> d;

	// the whole string must be a number
	if (is.fail() || !is.eof())
		return std::nullopt;

	return d;
}


std::optional<boost::posix_time::ptime> parse_datetime(const std::string& s)
{
	std::string t = trim(s);

	auto offset = split_timezone(t);
	if (!offset)
		return std::nullopt;

	// bare date
	if (t.find('T') == std::string::npos)
		t += "T00:00:00";

	try
	{
		const auto result = boost::posix_time::from_iso_extended_string(t);
		if (result.is_special())
			return std::nullopt;
		return result - boost::posix_time::minutes(*offset);
	}
	catch (const std::exception&)
	{
		// boost reports malformed input by throwing
		// (bad_lexical_cast, bad_day_of_month, ...)
		return std::nullopt;
	}
}


NormalValue cast_value(NormalValue value, const std::string& datatype)
{
	const std::string* s = std::get_if<std::string>(&value);
	if (s == nullptr)
		return value;  // already canonical

	switch (datatype_family(datatype))
	{
	case DatatypeFamily::NUMERIC:
		if (auto d = parse_double(*s))
			return *d;
		break;
	case DatatypeFamily::DATETIME:
		if (auto t = parse_datetime(*s))
			return *t;
		break;
	case DatatypeFamily::DATEFRAG:
		if (auto days = gfrag_to_days(*s, datatype))
			return *days;
		break;
	case DatatypeFamily::STRING:
		return to_lower(trim(*s));
	case DatatypeFamily::OTHER:
		break;
	}

	return value;
}


NormalValue cast_literal(const Literal& l, const Vocabulary& vocab)
{
	return cast_value(l.val, literal_datatype(l, vocab).val);
}


std::string normal_value_str(const NormalValue& v)
{
	return std::visit(NormalValueToStringVisitor(), v);
}


}  // namespace gfd
