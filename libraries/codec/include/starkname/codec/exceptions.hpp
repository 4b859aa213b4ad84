#pragma once

#include <fc/exception/exception.hpp>

#define STARKNAME_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define STARKNAME_THROW( exc_type, FORMAT, ... ) \
    throw exc_type( FC_LOG_MESSAGE( error, FORMAT, __VA_ARGS__ ) );

/**
 * Rethrows anything that is not already a starkname exception as `exception_type`,
 * keeping the log of a caught fc::exception. Allocation failures pass through.
 */
#define STARKNAME_RETHROW_EXCEPTIONS( exception_type, FORMAT, ... ) \
   catch( const std::bad_alloc& ) {\
      throw;\
   } catch( const starkname::codec::codec_exception& ) {\
      throw;\
   } catch( const fc::exception& e ) { \
      exception_type new_exception(FC_LOG_MESSAGE( warn, FORMAT, __VA_ARGS__ )); \
      for (const auto& log: e.get_log()) { \
         new_exception.append_log(log); \
      } \
      throw new_exception; \
   } catch( const std::exception& e ) {  \
      exception_type fce(FC_LOG_MESSAGE( warn, FORMAT" (${what})" ,__VA_ARGS__("what",e.what()))); \
      throw fce;\
   }

namespace starkname::codec {

   FC_DECLARE_EXCEPTION( codec_exception,
                         4000000, "codec exception" )

      FC_DECLARE_DERIVED_EXCEPTION( unknown_character_exception,  codec_exception,
                                    4000001, "Unknown character" )
      FC_DECLARE_DERIVED_EXCEPTION( label_too_long_exception,     codec_exception,
                                    4000002, "Label does not fit in a field element" )
      FC_DECLARE_DERIVED_EXCEPTION( felt_parse_exception,         codec_exception,
                                    4000003, "Invalid field element" )
      FC_DECLARE_DERIVED_EXCEPTION( felt_out_of_range_exception,  codec_exception,
                                    4000004, "Field element out of range" )

} // starkname::codec
