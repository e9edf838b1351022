#include <cctype>
#include "gfd_timeutils.h"
#include "gfd_vocab.h"
#include "gfd_assert.h"


namespace gfd
{


namespace
{


// leap, so that every month-day combination exists
const long REFERENCE_YEAR = 2000;


/*
* Parse exactly `n` digits of `s` starting at `pos`.
*/
std::optional<unsigned> parse_digits(const std::string& s, size_t pos, size_t n)
{
	if (pos + n > s.size())
		return std::nullopt;

	unsigned result = 0;
	for (size_t i = pos; i < pos + n; ++i)
	{
		if (!std::isdigit(static_cast<unsigned char>(s[i])))
			return std::nullopt;
		result = result * 10 + static_cast<unsigned>(s[i] - '0');
	}
	return result;
}


/*
* Years have an optional minus sign and at least four digits,
* with no leading zeros beyond four digits.
*/
std::optional<long> parse_year(const std::string& s)
{
	const bool negative = (!s.empty() && s[0] == '-');
	const size_t start = negative ? 1 : 0;
	const size_t n = s.size() - start;

	if (n < 4 || n > 12 || (n > 4 && s[start] == '0'))
		return std::nullopt;

	long result = 0;
	for (size_t i = start; i < s.size(); ++i)
	{
		if (!std::isdigit(static_cast<unsigned char>(s[i])))
			return std::nullopt;
		result = result * 10 + (s[i] - '0');
	}
	return negative ? -result : result;
}


std::string strip_timezone(const std::string& s)
{
	if (!s.empty() && s.back() == 'Z')
		return s.substr(0, s.size() - 1);

	if (s.size() >= 6)
	{
		const size_t tz = s.size() - 6;
		if ((s[tz] == '+' || s[tz] == '-') && s[tz + 3] == ':'
			&& parse_digits(s, tz + 1, 2) && parse_digits(s, tz + 4, 2))
			return s.substr(0, tz);
	}

	return s;
}


std::optional<unsigned> parse_month(const std::string& s, size_t pos)
{
	auto m = parse_digits(s, pos, 2);
	if (!m || *m < 1 || *m > 12)
		return std::nullopt;
	return m;
}


long day_of_reference_year(unsigned m, unsigned d)
{
	return days_from_civil(REFERENCE_YEAR, m, d) - days_from_civil(REFERENCE_YEAR, 1, 1);
}


}  // namespace


bool is_leap_year(long y)
{
	return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}


unsigned days_in_month(long y, unsigned m)
{
	GFD_CHECK_PRECOND(m >= 1 && m <= 12);

	static const unsigned DAYS[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
	if (m == 2 && is_leap_year(y))
		return 29;
	return DAYS[m - 1];
}


long days_from_civil(long y, unsigned m, unsigned d)
{
	GFD_CHECK_PRECOND(m >= 1 && m <= 12);
	GFD_CHECK_PRECOND(d >= 1 && d <= days_in_month(y, m));

	// shift the year to start in March, so the leap day is last
	y -= (m <= 2) ? 1 : 0;
	const long era = (y >= 0 ? y : y - 399) / 400;
	const long yoe = y - era * 400;  // [0, 399]
	const long doy = (153 * static_cast<long>(m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;  // [0, 365]
	const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;  // [0, 146096]
	return era * 146097 + doe - 719468;
}


std::optional<long> gfrag_to_days(const std::string& lexical, const std::string& datatype)
{
	const std::string s = strip_timezone(lexical);

	if (datatype == xsd::G_YEAR)
	{
		auto y = parse_year(s);
		if (!y)
			return std::nullopt;
		return days_from_civil(*y, 1, 1);
	}
	else if (datatype == xsd::G_YEAR_MONTH)
	{
		// the year may itself start with a minus sign, so split
		// on the last one
		const size_t split = s.rfind('-');
		if (split == std::string::npos || split == 0 || s.size() - split != 3)
			return std::nullopt;

		auto y = parse_year(s.substr(0, split));
		auto m = parse_month(s, split + 1);
		if (!y || !m)
			return std::nullopt;
		return days_from_civil(*y, *m, 1);
	}
	else if (datatype == xsd::G_MONTH)
	{
		if (s.size() != 4 || s.compare(0, 2, "--") != 0)
			return std::nullopt;

		auto m = parse_month(s, 2);
		if (!m)
			return std::nullopt;
		return day_of_reference_year(*m, 1);
	}
	else if (datatype == xsd::G_MONTH_DAY)
	{
		if (s.size() != 7 || s.compare(0, 2, "--") != 0 || s[4] != '-')
			return std::nullopt;

		auto m = parse_month(s, 2);
		auto d = parse_digits(s, 5, 2);
		if (!m || !d || *d < 1 || *d > days_in_month(REFERENCE_YEAR, *m))
			return std::nullopt;
		return day_of_reference_year(*m, *d);
	}
	else if (datatype == xsd::G_DAY)
	{
		if (s.size() != 5 || s.compare(0, 3, "---") != 0)
			return std::nullopt;

		auto d = parse_digits(s, 3, 2);
		if (!d || *d < 1 || *d > 31)
			return std::nullopt;
		return static_cast<long>(*d) - 1;
	}
	else
		return std::nullopt;
}


}  // namespace gfd
