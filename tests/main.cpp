#define BOOST_TEST_MODULE magpie_mq_tests
#include <boost/test/unit_test.hpp>
