#include <starkname/codec/decoder.hpp>
#include <starkname/codec/encoder.hpp>
#include <starkname/resolver/domain.hpp>
#include <starkname/resolver/naming_contract.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace starkname;
namespace bpo = boost::program_options;
using bpo::options_description;
using bpo::variables_map;

struct stark_name_cli {
   void set_program_options( options_description& cli );
   int  run();

   std::string print( const codec::felt& value )const {
      return hex ? codec::to_hex( value ) : codec::to_decimal( value );
   }

   std::string               command;
   std::vector<std::string>  arguments;
   bool                      hex     = false;
   bool                      verbose = false;
   bool                      help    = false;
};

void stark_name_cli::set_program_options( options_description& cli ) {
   cli.add_options()
         ("command", bpo::value<std::string>(&command),
          "encode | decode | encode-domain | decode-domain | naming-contract")
         ("argument", bpo::value<std::vector<std::string>>(&arguments),
          "labels, domains, field elements or a network name, depending on the command")
         ("hex", bpo::bool_switch(&hex)->default_value(false),
          "Print field elements as 0x-prefixed hex instead of decimal.")
         ("verbose,v", bpo::bool_switch(&verbose)->default_value(false),
          "Log at debug level.")
         ("help,h", bpo::bool_switch(&help)->default_value(false),
          "Print this help message and exit.");
}

int stark_name_cli::run() {
   if( command == "encode" ) {
      for( const auto& label : arguments )
         std::cout << print( codec::encode( label ) ) << std::endl;
   } else if( command == "decode" ) {
      for( const auto& value : arguments )
         std::cout << codec::decode( codec::felt_from_string( value ) ) << std::endl;
   } else if( command == "encode-domain" ) {
      for( const auto& domain : arguments ) {
         const auto labels = resolver::encode_domain( domain );
         dlog( "${domain} has ${n} labels", ("domain", domain)("n", labels.size()) );
         for( const auto& label : labels )
            std::cout << print( label ) << std::endl;
      }
   } else if( command == "decode-domain" ) {
      std::vector<codec::felt> labels;
      for( const auto& value : arguments )
         labels.push_back( codec::felt_from_string( value ) );
      std::cout << resolver::decode_domain( labels ) << std::endl;
   } else if( command == "naming-contract" ) {
      for( const auto& network : arguments ) {
         const auto chain_id = resolver::parse_chain_id( network );
         std::cout << codec::to_hex( resolver::naming_contract_address( chain_id ) ) << std::endl;
      }
   } else {
      std::cerr << "unknown command '" << command << "'" << std::endl;
      return -1;
   }
   return 0;
}

int main(int argc, char** argv) {
   options_description cli ("stark-name command line options");
   try {
      stark_name_cli app;
      app.set_program_options(cli);

      bpo::positional_options_description positional;
      positional.add("command", 1).add("argument", -1);

      variables_map vmap;
      bpo::store(bpo::command_line_parser(argc, argv).options(cli).positional(positional).run(), vmap);
      bpo::notify(vmap);

      if (app.help || app.command.empty()) {
         std::ostream& outs = app.help ? std::cout : std::cerr;
         outs << "Converts stark name labels to field elements and back" << std::endl;
         outs << "  Usage: stark-name <command> [arguments...]" << std::endl << std::endl;
         cli.print(outs);
         return app.help ? 0 : -1;
      }

      fc::logger::get(DEFAULT_LOGGER).set_log_level(app.verbose ? fc::log_level::debug : fc::log_level::info);
      return app.run();
   } catch( const fc::exception& e ) {
      elog( "${e}", ("e", e.to_detail_string()));
      return -1;
   } catch( const boost::exception& e ) {
      elog("${e}", ("e",boost::diagnostic_information(e)));
      return -1;
   } catch( const std::exception& e ) {
      elog("${e}", ("e",e.what()));
      return -1;
   } catch( ... ) {
      elog("unknown exception");
      return -1;
   }
}
