#include "random_seed.hpp"

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/included/unit_test.hpp>

#include <ctime>
#include <iostream>
#include <string>

namespace {
   uint32_t seed = 0;

   void report_fc_exception( const fc::exception& e ) {
      elog( "${e}", ("e", e.to_detail_string()) );
      BOOST_TEST_FAIL( std::string( "unexpected " ) + e.name() + " (" + std::to_string( e.code() ) + ")" );
   }
}

namespace starkname::test {
   uint32_t random_seed() { return seed; }
}

// arguments after "--" reach this function: unit_test -- --verbose --seed=1234
boost::unit_test::test_suite* init_unit_test_suite( int argc, char* argv[] ) {
   bool verbose = false;
   seed = static_cast<uint32_t>( std::time( nullptr ) );

   for( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[i];
      if( arg == "--verbose" )
         verbose = true;
      else if( boost::algorithm::starts_with( arg, "--seed=" ) )
         seed = boost::lexical_cast<uint32_t>( arg.substr( 7 ) );
   }

   fc::logger::get( DEFAULT_LOGGER ).set_log_level( verbose ? fc::log_level::debug : fc::log_level::off );
   boost::unit_test::unit_test_monitor.register_exception_translator<fc::exception>( &report_fc_exception );

   std::cout << "starkname unit tests, random seed " << seed << " (rerun with -- --seed=" << seed << ")" << std::endl;
   return nullptr;
}
