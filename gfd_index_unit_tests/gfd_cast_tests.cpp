#include <vector>
#include <utility>
#include <boost/test/unit_test.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "gfd_cast.h"
#include "gfd_vocab.h"


using namespace gfd;
namespace pt = boost::posix_time;
namespace gr = boost::gregorian;


BOOST_AUTO_TEST_SUITE(CastTests);


BOOST_AUTO_TEST_CASE(TestNumeric)
{
    auto v = cast_value(std::string("42"), xsd::INTEGER);
    BOOST_REQUIRE(std::holds_alternative<double>(v));
    BOOST_CHECK_EQUAL(std::get<double>(v), 42.0);

    v = cast_value(std::string(" 3.5 "), xsd::DOUBLE);
    BOOST_REQUIRE(std::holds_alternative<double>(v));
    BOOST_CHECK_EQUAL(std::get<double>(v), 3.5);

    // "1" and "1.0" are the same number
    BOOST_CHECK(cast_value(std::string("1"), xsd::DECIMAL)
        == cast_value(std::string("1.0"), xsd::DECIMAL));
}


BOOST_AUTO_TEST_CASE(TestBadNumericIsUnchanged)
{
    auto v = cast_value(std::string("forty two"), xsd::INTEGER);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "forty two");

    v = cast_value(std::string("42abc"), xsd::INTEGER);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "42abc");

    v = cast_value(std::string(""), xsd::DOUBLE);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
}


BOOST_AUTO_TEST_CASE(TestHexIsNotNumeric)
{
    BOOST_CHECK(!parse_double("0x10").has_value());
    BOOST_CHECK(!parse_double("0X1A").has_value());
    BOOST_CHECK(!parse_double("0x1p4").has_value());

    auto v = cast_value(std::string("0x10"), xsd::INTEGER);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "0x10");

    // ordinary decimal and exponent forms still parse
    BOOST_REQUIRE(parse_double("-2.5e3").has_value());
    BOOST_CHECK_EQUAL(*parse_double("-2.5e3"), -2500.0);
    BOOST_REQUIRE(parse_double("+7").has_value());
    BOOST_CHECK_EQUAL(*parse_double("+7"), 7.0);
}


BOOST_AUTO_TEST_CASE(TestDateTime)
{
    auto v = cast_value(std::string("2020-05-20T10:30:00"), xsd::DATE_TIME);
    BOOST_REQUIRE(std::holds_alternative<pt::ptime>(v));
    BOOST_CHECK(std::get<pt::ptime>(v)
        == pt::ptime(gr::date(2020, 5, 20), pt::hours(10) + pt::minutes(30)));
}


BOOST_AUTO_TEST_CASE(TestBareDateIsMidnight)
{
    auto v = cast_value(std::string("2020-05-20"), xsd::DATE);
    BOOST_REQUIRE(std::holds_alternative<pt::ptime>(v));
    BOOST_CHECK(std::get<pt::ptime>(v) == pt::ptime(gr::date(2020, 5, 20)));
    BOOST_CHECK(v == cast_value(std::string("2020-05-20T00:00:00"), xsd::DATE_TIME));
}


BOOST_AUTO_TEST_CASE(TestTimezonesAreNormalisedToUTC)
{
    auto utc = cast_value(std::string("2020-05-20T10:00:00Z"), xsd::DATE_TIME);
    auto plus_two = cast_value(std::string("2020-05-20T12:00:00+02:00"), xsd::DATE_TIME);
    auto minus_one = cast_value(std::string("2020-05-20T09:00:00-01:00"), xsd::DATE_TIME);
    BOOST_REQUIRE(std::holds_alternative<pt::ptime>(utc));
    BOOST_CHECK(utc == plus_two);
    BOOST_CHECK(utc == minus_one);
}


BOOST_AUTO_TEST_CASE(TestBadDateTimeIsUnchanged)
{
    auto v = cast_value(std::string("yesterday"), xsd::DATE_TIME);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "yesterday");

    v = cast_value(std::string("2020-02-30"), xsd::DATE);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
}


BOOST_AUTO_TEST_CASE(TestDateFragment)
{
    auto v = cast_value(std::string("--05-20"), xsd::G_MONTH_DAY);
    BOOST_REQUIRE(std::holds_alternative<long>(v));
    BOOST_CHECK_EQUAL(std::get<long>(v), 140);

    v = cast_value(std::string("--13-01"), xsd::G_MONTH_DAY);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "--13-01");
}


BOOST_AUTO_TEST_CASE(TestString)
{
    auto v = cast_value(std::string("  Alice\t"), xsd::STRING);
    BOOST_REQUIRE(std::holds_alternative<std::string>(v));
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "alice");

    BOOST_CHECK(cast_value(std::string("Alice"), xsd::STRING)
        == cast_value(std::string("ALICE"), xsd::NS + "token"));
}


BOOST_AUTO_TEST_CASE(TestOtherDatatypesAreUnchanged)
{
    auto v = cast_value(std::string(" Alice "), xsd::ANY_TYPE);
    BOOST_CHECK_EQUAL(std::get<std::string>(v), " Alice ");

    v = cast_value(std::string("42"), "http://example.org/myType");
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "42");
}


BOOST_AUTO_TEST_CASE(TestIdempotent)
{
    const std::vector<std::pair<std::string, std::string>> cases = {
        { "42", xsd::INTEGER }, { "4.2e1", xsd::DOUBLE }, { "oops", xsd::DOUBLE },
        { "2020-05-20", xsd::DATE }, { "2020-05-20T10:00:00+01:00", xsd::DATE_TIME },
        { "never", xsd::DATE_TIME }, { "--05-20", xsd::G_MONTH_DAY }, { "2020", xsd::G_YEAR },
        { "140", xsd::G_MONTH_DAY }, { " MiXeD ", xsd::STRING }, { " MiXeD ", xsd::ANY_TYPE }
    };

    for (const auto& [val, dtype] : cases)
    {
        const NormalValue once = cast_value(val, dtype);
        const NormalValue twice = cast_value(once, dtype);
        BOOST_CHECK_MESSAGE(once == twice, "not idempotent on " << val);
    }
}


BOOST_AUTO_TEST_CASE(TestCastLiteralUsesIndexedDatatype)
{
    const Vocabulary vocab;

    // language tagged literals are strings
    auto v = cast_literal(Literal{ " ALICE ", "", "en" }, vocab);
    BOOST_CHECK_EQUAL(std::get<std::string>(v), "alice");

    // plain literals are not
    v = cast_literal(Literal{ " ALICE " }, vocab);
    BOOST_CHECK_EQUAL(std::get<std::string>(v), " ALICE ");

    v = cast_literal(Literal{ "7", xsd::INTEGER }, vocab);
    BOOST_CHECK_EQUAL(std::get<double>(v), 7.0);
}


BOOST_AUTO_TEST_CASE(TestNormalValueStr)
{
    BOOST_CHECK_EQUAL(normal_value_str(NormalValue(1.5)), "1.5");
    BOOST_CHECK_EQUAL(normal_value_str(NormalValue(140L)), "140");
    BOOST_CHECK_EQUAL(normal_value_str(NormalValue(std::string("abc"))), "abc");
    BOOST_CHECK_EQUAL(normal_value_str(NormalValue(pt::ptime(gr::date(2020, 5, 20)))),
        "2020-05-20T00:00:00");
}


BOOST_AUTO_TEST_CASE(TestDatatypeFamily)
{
    BOOST_CHECK(datatype_family(xsd::INTEGER) == DatatypeFamily::NUMERIC);
    BOOST_CHECK(datatype_family(xsd::NS + "unsignedByte") == DatatypeFamily::NUMERIC);
    BOOST_CHECK(datatype_family(xsd::DATE) == DatatypeFamily::DATETIME);
    BOOST_CHECK(datatype_family(xsd::G_DAY) == DatatypeFamily::DATEFRAG);
    BOOST_CHECK(datatype_family(xsd::STRING) == DatatypeFamily::STRING);
    BOOST_CHECK(datatype_family(xsd::ANY_TYPE) == DatatypeFamily::OTHER);
    BOOST_CHECK(datatype_family("http://example.org/integer") == DatatypeFamily::OTHER);
}


BOOST_AUTO_TEST_SUITE_END();  // CastTests
