#include <string>
#include <boost/test/unit_test.hpp>
#include "gfd_default_map.h"
#include "gfd_types.h"


using namespace gfd;


BOOST_AUTO_TEST_SUITE(DefaultMapTests);


BOOST_AUTO_TEST_CASE(TestMissingKeyGivesDefault)
{
    DefaultMap<int, std::string> m("none");
    BOOST_CHECK_EQUAL(m.get(3), "none");
    BOOST_CHECK_EQUAL(m[3], "none");
}


BOOST_AUTO_TEST_CASE(TestLookupDoesNotInsert)
{
    DefaultMap<int, std::string> m("none");
    m.get(3);
    m[4];
    BOOST_CHECK(!m.contains_key(3));
    BOOST_CHECK(!m.contains_key(4));
    BOOST_CHECK(m.empty());
}


BOOST_AUTO_TEST_CASE(TestSetAndOverwrite)
{
    DefaultMap<int, std::string> m("none");
    m.set(1, "a");
    BOOST_CHECK_EQUAL(m.get(1), "a");
    m.set(1, "b");
    BOOST_CHECK_EQUAL(m.get(1), "b");
    BOOST_CHECK(m.contains_key(1));
    BOOST_CHECK_EQUAL(m.size(), 1u);
}


BOOST_AUTO_TEST_CASE(TestStoringDefaultValueCountsAsPresent)
{
    DefaultMap<int, std::string> m("none");
    m.set(2, "none");
    BOOST_CHECK(m.contains_key(2));
}


BOOST_AUTO_TEST_CASE(TestSlotUnionsIntoSets)
{
    DefaultMap<int, CodedResourceSet> m;
    m.slot(1).insert(10);
    m.slot(1).insert(11);
    m.slot(1).insert(10);
    BOOST_CHECK_EQUAL(m.get(1).size(), 2u);
    BOOST_CHECK(m.get(2).empty());
    BOOST_CHECK_EQUAL(m.size(), 1u);

    // the default itself is never modified through a slot
    BOOST_CHECK(m.default_value().empty());
}


BOOST_AUTO_TEST_CASE(TestErase)
{
    DefaultMap<int, std::string> m("none");
    m.set(1, "a");
    BOOST_CHECK(m.erase(1));
    BOOST_CHECK(!m.erase(1));
    BOOST_CHECK_EQUAL(m.get(1), "none");
}


BOOST_AUTO_TEST_CASE(TestIterationCoversStoredKeysOnly)
{
    DefaultMap<int, int> m(-1);
    m.set(1, 10);
    m.set(2, 20);
    m.get(3);

    int key_sum = 0, value_sum = 0;
    for (const auto& entry : m)
    {
        key_sum += entry.first;
        value_sum += entry.second;
    }
    BOOST_CHECK_EQUAL(key_sum, 3);
    BOOST_CHECK_EQUAL(value_sum, 30);
}


BOOST_AUTO_TEST_SUITE_END();  // DefaultMapTests
