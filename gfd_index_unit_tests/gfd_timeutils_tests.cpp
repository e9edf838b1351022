#include <boost/test/unit_test.hpp>
#include "gfd_timeutils.h"
#include "gfd_vocab.h"


using namespace gfd;


BOOST_AUTO_TEST_SUITE(TimeUtilsTests);


BOOST_AUTO_TEST_CASE(TestLeapYears)
{
    BOOST_CHECK(is_leap_year(2000));
    BOOST_CHECK(is_leap_year(2024));
    BOOST_CHECK(!is_leap_year(1900));
    BOOST_CHECK(!is_leap_year(2023));
    BOOST_CHECK_EQUAL(days_in_month(2024, 2), 29u);
    BOOST_CHECK_EQUAL(days_in_month(2023, 2), 28u);
    BOOST_CHECK_EQUAL(days_in_month(2023, 12), 31u);
}


BOOST_AUTO_TEST_CASE(TestDaysFromCivil)
{
    BOOST_CHECK_EQUAL(days_from_civil(1970, 1, 1), 0);
    BOOST_CHECK_EQUAL(days_from_civil(1969, 12, 31), -1);
    BOOST_CHECK_EQUAL(days_from_civil(2000, 3, 1), 11017);
    BOOST_CHECK_EQUAL(days_from_civil(2020, 1, 1), 18262);
}


BOOST_AUTO_TEST_CASE(TestYearFragments)
{
    BOOST_CHECK(gfrag_to_days("2020", xsd::G_YEAR) == 18262L);
    BOOST_CHECK(gfrag_to_days("2020Z", xsd::G_YEAR) == 18262L);
    BOOST_CHECK(gfrag_to_days("2020+01:00", xsd::G_YEAR) == 18262L);
    BOOST_CHECK(gfrag_to_days("-0044", xsd::G_YEAR) == days_from_civil(-44, 1, 1));
    BOOST_CHECK(gfrag_to_days("12020", xsd::G_YEAR) == days_from_civil(12020, 1, 1));

    BOOST_CHECK(!gfrag_to_days("20", xsd::G_YEAR));
    BOOST_CHECK(!gfrag_to_days("02020", xsd::G_YEAR));
    BOOST_CHECK(!gfrag_to_days("two thousand", xsd::G_YEAR));
}


BOOST_AUTO_TEST_CASE(TestYearMonthFragments)
{
    BOOST_CHECK(gfrag_to_days("2020-03", xsd::G_YEAR_MONTH) == 18322L);
    BOOST_CHECK(gfrag_to_days("-0044-03", xsd::G_YEAR_MONTH) == days_from_civil(-44, 3, 1));

    BOOST_CHECK(!gfrag_to_days("2020-13", xsd::G_YEAR_MONTH));
    BOOST_CHECK(!gfrag_to_days("2020-3", xsd::G_YEAR_MONTH));
    BOOST_CHECK(!gfrag_to_days("2020", xsd::G_YEAR_MONTH));
}


BOOST_AUTO_TEST_CASE(TestMonthAndDayFragments)
{
    BOOST_CHECK(gfrag_to_days("--01", xsd::G_MONTH) == 0L);
    BOOST_CHECK(gfrag_to_days("--03", xsd::G_MONTH) == 60L);
    BOOST_CHECK(gfrag_to_days("--05-20", xsd::G_MONTH_DAY) == 140L);
    BOOST_CHECK(gfrag_to_days("--05-20Z", xsd::G_MONTH_DAY) == 140L);
    BOOST_CHECK(gfrag_to_days("--02-29", xsd::G_MONTH_DAY) == 59L);
    BOOST_CHECK(gfrag_to_days("---01", xsd::G_DAY) == 0L);
    BOOST_CHECK(gfrag_to_days("---31", xsd::G_DAY) == 30L);

    BOOST_CHECK(!gfrag_to_days("--02-30", xsd::G_MONTH_DAY));
    BOOST_CHECK(!gfrag_to_days("--00", xsd::G_MONTH));
    BOOST_CHECK(!gfrag_to_days("---32", xsd::G_DAY));
    BOOST_CHECK(!gfrag_to_days("05-20", xsd::G_MONTH_DAY));
}


BOOST_AUTO_TEST_CASE(TestNonFragmentDatatype)
{
    BOOST_CHECK(!gfrag_to_days("2020", xsd::INTEGER));
    BOOST_CHECK(!gfrag_to_days("--05-20", xsd::STRING));
}


BOOST_AUTO_TEST_SUITE_END();  // TimeUtilsTests
