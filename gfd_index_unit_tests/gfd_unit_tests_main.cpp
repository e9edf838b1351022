#define BOOST_TEST_MODULE GfdIndexUnitTests
#include <boost/test/unit_test.hpp>
