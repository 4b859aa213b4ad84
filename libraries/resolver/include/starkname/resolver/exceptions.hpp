#pragma once

#include <starkname/codec/exceptions.hpp>

namespace starkname::resolver {

   FC_DECLARE_EXCEPTION( resolver_exception,
                         4100000, "resolver exception" )

      FC_DECLARE_DERIVED_EXCEPTION( invalid_domain_exception,           resolver_exception,
                                    4100001, "Invalid domain" )
      FC_DECLARE_DERIVED_EXCEPTION( connection_exception,               resolver_exception,
                                    4100002, "Contract call failed" )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_contract_result_exception,  resolver_exception,
                                    4100003, "Invalid contract result" )
      FC_DECLARE_DERIVED_EXCEPTION( name_not_found_exception,           resolver_exception,
                                    4100004, "Stark name not found" )
      FC_DECLARE_DERIVED_EXCEPTION( unsupported_network_exception,      resolver_exception,
                                    4100005, "Resolution not supported on this network" )

} // starkname::resolver
