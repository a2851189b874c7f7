#include <stratum/runtime/foreign_runtime.hpp>
#include <stratum/runtime/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace stratum { namespace runtime {

namespace {

   template<typename E>
   [[noreturn]] void raise( const foreign_response& r ) {
      E e( FC_LOG_MESSAGE( error, "foreign runtime: ${d}", ("d", r.description) ) );
      e.error_code = r.error_code;
      throw e;
   }

   /// Raises the exception named by the backend, or DefaultException for codes this node does not know
   template<typename DefaultException>
   void check_response( const foreign_response& r ) {
      if( r.code == 0 ) return;
      switch( r.code ) {
         case deploy_wrong_runtime::code_value:        raise<deploy_wrong_runtime>( r );
         case unknown_artifact_exception::code_value:  raise<unknown_artifact_exception>( r );
         case artifact_deploy_failed::code_value:      raise<artifact_deploy_failed>( r );
         case init_wrong_runtime::code_value:          raise<init_wrong_runtime>( r );
         case artifact_not_deployed::code_value:       raise<artifact_not_deployed>( r );
         case service_already_exists::code_value:      raise<service_already_exists>( r );
         case service_init_failed::code_value:         raise<service_init_failed>( r );
         case execution_wrong_runtime::code_value:     raise<execution_wrong_runtime>( r );
         case unknown_method_exception::code_value:    raise<unknown_method_exception>( r );
         case service_error_exception::code_value:     raise<service_error_exception>( r );
         default:                                      raise<DefaultException>( r );
      }
   }

}

foreign_runtime::foreign_runtime( runtime_id_type id, unique_ptr<foreign_endpoint> endpoint )
:_id( id ),_endpoint( move(endpoint) ) {
   FC_ASSERT( _endpoint, "foreign runtime ${id} requires an endpoint", ("id", id) );
}

foreign_runtime::~foreign_runtime() = default;

bool foreign_runtime::has_instance( instance_id_type instance_id )const {
   return _instances.count( instance_id ) > 0;
}

foreign_response foreign_runtime::send( const foreign_request& request ) {
   try {
      auto raw = _endpoint->roundtrip( fc::raw::pack( request ) );
      return fc::raw::unpack<foreign_response>( raw );
   } STRATUM_RETHROW_EXCEPTIONS( foreign_runtime_exception, "roundtrip to foreign runtime ${id} failed", ("id", _id) )
}

void foreign_runtime::apply_writes( chainbase::database& fork, const vector<state_write>& writes,
                                    const std::set<instance_id_type>& allowed ) {
   for( const auto& w : writes ) {
      STRATUM_ASSERT( allowed.count( w.instance_id ), foreign_runtime_exception,
                      "foreign runtime ${id} attempted to write to instance ${i}", ("id", _id)("i", w.instance_id) );
      service_state state( fork, w.instance_id );
      if( w.value )
         state.set( w.key, *w.value );
      else
         state.erase( w.key );
   }
}

void foreign_runtime::start_deploy( const artifact_spec& artifact ) {
   STRATUM_ASSERT( artifact.runtime_id == _id, deploy_wrong_runtime,
                   "artifact runtime ${r} is not foreign runtime ${id}", ("r", artifact.runtime_id)("id", _id) );
   check_response<artifact_deploy_failed>( send( foreign_deploy_request{ artifact } ) );
}

deploy_status foreign_runtime::check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete ) {
   STRATUM_ASSERT( artifact.runtime_id == _id, deploy_wrong_runtime,
                   "artifact runtime ${r} is not foreign runtime ${id}", ("r", artifact.runtime_id)("id", _id) );
   auto r = send( foreign_deploy_status_request{ artifact, cancel_if_incomplete } );
   check_response<artifact_deploy_failed>( r );
   return r.status;
}

void foreign_runtime::init_service( runtime_context& ctx, const artifact_spec& artifact,
                                    const service_constructor& constructor ) {
   STRATUM_ASSERT( artifact.runtime_id == _id, init_wrong_runtime,
                   "artifact runtime ${r} is not foreign runtime ${id}", ("r", artifact.runtime_id)("id", _id) );
   STRATUM_ASSERT( !has_instance( constructor.instance_id ), service_already_exists,
                   "service instance ${i} already exists", ("i", constructor.instance_id) );

   auto r = send( foreign_init_request{ artifact, constructor, ctx.author, ctx.tx_hash } );
   check_response<service_init_failed>( r );

   {
      auto session = ctx.fork.start_undo_session( true );
      try {
         apply_writes( ctx.fork, r.writes, { constructor.instance_id } );
      } STRATUM_RETHROW_EXCEPTIONS( service_init_failed, "initialization of service ${i} failed",
                                    ("i", constructor.instance_id) )
      session.squash();
   }
   for( auto& a : r.actions ) {
      ctx.dispatch_action( move(a) );
   }

   _instances.insert( constructor.instance_id );
   ilog( "started foreign service ${i} in runtime ${id}", ("i", constructor.instance_id)("id", _id) );
}

void foreign_runtime::execute( runtime_context& ctx, const call_info& call, const bytes& payload ) {
   STRATUM_ASSERT( has_instance( call.instance_id ), execution_wrong_runtime,
                   "Wrong runtime: instance ${i} is not started in foreign runtime ${id}",
                   ("i", call.instance_id)("id", _id) );

   auto r = send( foreign_execute_request{ call, payload, ctx.author, ctx.tx_hash } );
   check_response<service_error_exception>( r );

   apply_writes( ctx.fork, r.writes, _instances );
   for( auto& a : r.actions ) {
      ctx.dispatch_action( move(a) );
   }
}

vector<pair<instance_id_type, digest_type>> foreign_runtime::state_hashes( const chainbase::database& snapshot )const {
   vector<pair<instance_id_type, digest_type>> result;
   for( auto i : _instances ) {
      result.emplace_back( i, service_state_hash( snapshot, i ) );
   }
   return result;
}

void foreign_runtime::before_commit( chainbase::database& fork ) {
   auto r = send( foreign_commit_request{ false } );
   check_response<foreign_runtime_exception>( r );
   apply_writes( fork, r.writes, _instances );
}

void foreign_runtime::after_commit( const chainbase::database& ) {
   try {
      auto r = send( foreign_commit_request{ true } );
      check_response<foreign_runtime_exception>( r );
      if( !r.writes.empty() )
         wlog( "foreign runtime ${id} returned ${n} writes after commit, ignoring them",
               ("id", _id)("n", r.writes.size()) );
   } catch( const fc::exception& e ) {
      elog( "after_commit of foreign runtime ${id} failed: ${e}", ("id", _id)("e", e.to_detail_string()) );
   }
}

} } // stratum::runtime
