#pragma once
#include <starkname/codec/felt.hpp>

#include <string>
#include <vector>

namespace starkname::resolver {

   using codec::felt;

   struct contract_call {
      felt               contract_address;
      std::string        entrypoint;
      std::vector<felt>  calldata;
   };

   /**
    *  Read-only access to a chain. Implementations own the transport (RPC endpoint,
    *  timeouts, retries); the resolver only sees felts. Any failure should be thrown,
    *  the resolver reports it as a connection_exception.
    */
   class call_provider {
      public:
         virtual ~call_provider() = default;

         virtual felt chain_id() = 0;
         virtual std::vector<felt> call_contract( const contract_call& call ) = 0;
   };

} // starkname::resolver
