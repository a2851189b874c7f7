#pragma once

#include <fc/exception/exception.hpp>
#include <boost/interprocess/exceptions.hpp>


#define STRATUM_ASSERT( expr, exc_type, FORMAT, ... )                 \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define STRATUM_THROW( exc_type, FORMAT, ... ) \
    throw exc_type( FC_LOG_MESSAGE( error, FORMAT, __VA_ARGS__ ) );

/**
 * Used by services to abort a call with a service defined error code. The code
 * ends up in execution_status::error_code so that it can be recorded in the ledger.
 */
#define STRATUM_SERVICE_ASSERT( expr, CODE, FORMAT, ... )             \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) ) {                                                    \
      stratum::runtime::service_error_exception _e(                   \
         FC_LOG_MESSAGE( error, FORMAT, __VA_ARGS__ ) );              \
      _e.error_code = static_cast<uint64_t>(CODE);                    \
      throw _e;                                                       \
   }                                                                  \
   FC_MULTILINE_MACRO_END

/**
 * Rethrows anything that is not already a runtime_exception as exception_type,
 * keeping the original log messages.
 */
#define STRATUM_RETHROW_EXCEPTIONS( exception_type, FORMAT, ... ) \
   catch( const std::bad_alloc& ) {\
      throw;\
   } catch( const boost::interprocess::bad_alloc& ) {\
      throw;\
   } catch (stratum::runtime::runtime_exception& e) { \
      FC_RETHROW_EXCEPTION( e, warn, FORMAT, __VA_ARGS__ ); \
   } catch (fc::exception& e) { \
      exception_type new_exception(FC_LOG_MESSAGE( warn, FORMAT, __VA_ARGS__ )); \
      for (const auto& log: e.get_log()) { \
         new_exception.append_log(log); \
      } \
      throw new_exception; \
   } catch( const std::exception& e ) {  \
      exception_type fce(FC_LOG_MESSAGE( warn, FORMAT" (${what})" ,__VA_ARGS__("what",e.what()))); \
      throw fce;\
   }


#define FC_DECLARE_DERIVED_EXCEPTION_WITH_ERROR_CODE( TYPE, BASE, CODE, WHAT ) \
   class TYPE : public BASE  \
   { \
      public: \
       enum code_enum { \
          code_value = CODE, \
       }; \
       explicit TYPE( int64_t code, const std::string& name_value, const std::string& what_value ) \
       :BASE( code, name_value, what_value ){} \
       explicit TYPE( fc::log_message&& m, int64_t code, const std::string& name_value, const std::string& what_value ) \
       :BASE( std::move(m), code, name_value, what_value ){} \
       explicit TYPE( fc::log_messages&& m, int64_t code, const std::string& name_value, const std::string& what_value )\
       :BASE( std::move(m), code, name_value, what_value ){}\
       explicit TYPE( const fc::log_messages& m, int64_t code, const std::string& name_value, const std::string& what_value )\
       :BASE( m, code, name_value, what_value ){}\
       TYPE( const std::string& what_value, const fc::log_messages& m ) \
       :BASE( m, CODE, BOOST_PP_STRINGIZE(TYPE), what_value ){} \
       TYPE( fc::log_message&& m ) \
       :BASE( fc::move(m), CODE, BOOST_PP_STRINGIZE(TYPE), WHAT ){}\
       TYPE( fc::log_messages msgs ) \
       :BASE( fc::move( msgs ), CODE, BOOST_PP_STRINGIZE(TYPE), WHAT ) {} \
       TYPE( const TYPE& c ) \
       :BASE(c),error_code(c.error_code) {} \
       TYPE( const BASE& c ) \
       :BASE(c){} \
       TYPE():BASE(CODE, BOOST_PP_STRINGIZE(TYPE), WHAT){}\
       \
       virtual std::shared_ptr<fc::exception> dynamic_copy_exception()const\
       { return std::make_shared<TYPE>( *this ); } \
       virtual NO_RETURN void     dynamic_rethrow_exception()const \
       { if( code() == CODE ) throw *this;\
         else fc::exception::dynamic_rethrow_exception(); \
       } \
       std::optional<uint64_t> error_code; \
   };

namespace stratum { namespace runtime {

   FC_DECLARE_DERIVED_EXCEPTION_WITH_ERROR_CODE( runtime_exception, fc::exception,
                                                 3200000, "runtime exception" )

   FC_DECLARE_DERIVED_EXCEPTION( deploy_exception, runtime_exception,
                                 3210000, "artifact deployment exception" )

      FC_DECLARE_DERIVED_EXCEPTION( deploy_wrong_runtime,        deploy_exception,
                                    3210001, "Wrong runtime" )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_artifact_exception,  deploy_exception,
                                    3210002, "Unknown artifact" )
      FC_DECLARE_DERIVED_EXCEPTION( artifact_deploy_failed,      deploy_exception,
                                    3210003, "Artifact deployment failed" )

   FC_DECLARE_DERIVED_EXCEPTION( init_exception, runtime_exception,
                                 3220000, "service initialization exception" )

      FC_DECLARE_DERIVED_EXCEPTION( init_wrong_runtime,          init_exception,
                                    3220001, "Wrong runtime" )
      FC_DECLARE_DERIVED_EXCEPTION( artifact_not_deployed,       init_exception,
                                    3220002, "Artifact is not deployed" )
      FC_DECLARE_DERIVED_EXCEPTION( service_already_exists,      init_exception,
                                    3220003, "Service instance already exists" )
      FC_DECLARE_DERIVED_EXCEPTION( service_init_failed,         init_exception,
                                    3220004, "Service initialization failed" )

   FC_DECLARE_DERIVED_EXCEPTION( execution_exception, runtime_exception,
                                 3230000, "execution exception" )

      FC_DECLARE_DERIVED_EXCEPTION( execution_wrong_runtime,     execution_exception,
                                    3230001, "Wrong runtime" )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_method_exception,    execution_exception,
                                    3230002, "Unknown method" )
      FC_DECLARE_DERIVED_EXCEPTION( service_error_exception,     execution_exception,
                                    3230003, "Service error" )
      FC_DECLARE_DERIVED_EXCEPTION( dispatcher_action_exception, execution_exception,
                                    3230004, "Dispatcher action failed" )
      FC_DECLARE_DERIVED_EXCEPTION( nested_action_exception,     execution_exception,
                                    3230005, "Dispatcher action enqueued further actions" )

   FC_DECLARE_DERIVED_EXCEPTION( foreign_runtime_exception, runtime_exception,
                                 3240000, "foreign runtime exception" )

   FC_DECLARE_DERIVED_EXCEPTION( plugin_config_exception, runtime_exception,
                                 3250000, "Incorrect plugin configuration" )

   FC_DECLARE_DERIVED_EXCEPTION( api_exception, runtime_exception,
                                 3260000, "service API exception" )

      FC_DECLARE_DERIVED_EXCEPTION( not_a_validator_exception,   api_exception,
                                    3260001, "Node is not a validator" )
      FC_DECLARE_DERIVED_EXCEPTION( broadcast_exception,         api_exception,
                                    3260002, "Unable to broadcast transaction" )

   /// Service defined error code carried by e, if any
   std::optional<uint64_t> exception_error_code( const fc::exception& e );

} } // stratum::runtime
