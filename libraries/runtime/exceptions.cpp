#include <stratum/runtime/exceptions.hpp>
#include <stratum/runtime/types.hpp>

namespace stratum { namespace runtime {

std::optional<uint64_t> exception_error_code( const fc::exception& e ) {
   const runtime_exception* e_ptr = dynamic_cast<const runtime_exception*>( &e );

   if( e_ptr == nullptr ) return {};

   return e_ptr->error_code;
}

execution_status execution_status::from_exception( const fc::exception& e ) {
   execution_status status;
   status.code = e.code();
   status.error_code = exception_error_code( e );
   status.description = e.top_message();
   return status;
}

} } // stratum::runtime
