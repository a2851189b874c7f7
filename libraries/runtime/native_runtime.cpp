#include <stratum/runtime/native_runtime.hpp>
#include <stratum/runtime/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/scoped_exit.hpp>

namespace stratum { namespace runtime {

artifact_spec native_artifact_id::to_spec()const {
   artifact_spec spec;
   spec.runtime_id = native_runtime::id;
   spec.raw_spec = fc::raw::pack( *this );
   return spec;
}

native_artifact_id native_artifact_id::from_spec( const artifact_spec& spec ) {
   try {
      return fc::raw::unpack<native_artifact_id>( spec.raw_spec );
   } STRATUM_RETHROW_EXCEPTIONS( unknown_artifact_exception, "malformed native artifact specification of ${s} bytes",
                                 ("s", spec.raw_spec.size()) )
}

native_runtime::native_runtime() = default;
native_runtime::~native_runtime() = default;

void native_runtime::add_service_factory( unique_ptr<service_factory> factory ) {
   auto artifact = factory->artifact();
   dlog( "registered native service factory ${a}", ("a", artifact.to_string()) );
   _factories[artifact] = move(factory);
}

artifact_spec native_runtime::add_builtin_service( unique_ptr<service_factory> factory, instance_id_type instance_id,
                                                   const string& instance_name ) {
   STRATUM_ASSERT( _instances.find( instance_id ) == _instances.end(), service_already_exists,
                   "service instance ${id} already exists", ("id", instance_id) );

   auto artifact = factory->artifact();
   service_instance inst;
   inst.id = instance_id;
   inst.name = instance_name;
   inst.artifact = artifact;
   inst.instance = factory->create_instance();

   _factories[artifact] = move(factory);
   _deployed.insert( artifact );
   _instances.emplace( instance_id, move(inst) );

   ilog( "added builtin service ${name} (${id}) from ${a}",
         ("name", instance_name)("id", instance_id)("a", artifact.to_string()) );
   return artifact.to_spec();
}

bool native_runtime::has_instance( instance_id_type instance_id )const {
   return _instances.find( instance_id ) != _instances.end();
}

native_artifact_id native_runtime::parse_artifact( const artifact_spec& artifact )const {
   auto id = native_artifact_id::from_spec( artifact );
   STRATUM_ASSERT( _factories.find( id ) != _factories.end(), unknown_artifact_exception,
                   "unknown native artifact ${a}", ("a", id.to_string()) );
   return id;
}

void native_runtime::start_deploy( const artifact_spec& artifact ) {
   STRATUM_ASSERT( artifact.runtime_id == id, deploy_wrong_runtime,
                   "artifact runtime ${r} is not the native runtime", ("r", artifact.runtime_id) );
   auto artifact_id = parse_artifact( artifact );
   if( _deployed.insert( artifact_id ).second ) {
      ilog( "deployed native artifact ${a}", ("a", artifact_id.to_string()) );
   }
}

deploy_status native_runtime::check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete ) {
   STRATUM_ASSERT( artifact.runtime_id == id, deploy_wrong_runtime,
                   "artifact runtime ${r} is not the native runtime", ("r", artifact.runtime_id) );
   auto artifact_id = parse_artifact( artifact );
   if( _deployed.count( artifact_id ) )
      return deploy_status::deployed;
   if( cancel_if_incomplete ) {
      wlog( "deployment of ${a} was never started, reporting failure", ("a", artifact_id.to_string()) );
      return deploy_status::failed;
   }
   return deploy_status::pending;
}

void native_runtime::init_service( runtime_context& ctx, const artifact_spec& artifact,
                                   const service_constructor& constructor ) {
   STRATUM_ASSERT( artifact.runtime_id == id, init_wrong_runtime,
                   "artifact runtime ${r} is not the native runtime", ("r", artifact.runtime_id) );

   native_artifact_id artifact_id;
   try {
      artifact_id = fc::raw::unpack<native_artifact_id>( artifact.raw_spec );
   } catch( const fc::exception& e ) {
      STRATUM_THROW( artifact_not_deployed, "malformed native artifact specification: ${e}", ("e", e.to_string()) );
   }

   STRATUM_ASSERT( _deployed.count( artifact_id ), artifact_not_deployed,
                   "artifact ${a} is not deployed", ("a", artifact_id.to_string()) );
   STRATUM_ASSERT( _instances.find( constructor.instance_id ) == _instances.end(), service_already_exists,
                   "service instance ${id} already exists", ("id", constructor.instance_id) );

   service_instance inst;
   inst.id = constructor.instance_id;
   inst.name = artifact_id.name + "-" + std::to_string( constructor.instance_id );
   inst.artifact = artifact_id;
   inst.instance = _factories.at( artifact_id )->create_instance();

   {
      auto session = ctx.fork.start_undo_session( true );
      auto queued = ctx.pending_actions();
      auto drop_actions = fc::make_scoped_exit( [&ctx, queued]() { ctx.discard_actions( queued ); } );
      service_context sctx( ctx, inst.id, inst.name );
      try {
         inst.instance->initialize( sctx, constructor.data );
      } catch( const fc::exception& e ) {
         service_init_failed err( FC_LOG_MESSAGE( error, "initialization of service ${name} failed",
                                                  ("name", inst.name) ) );
         for( const auto& log : e.get_log() ) {
            err.append_log( log );
         }
         err.error_code = exception_error_code( e );
         throw err;
      } catch( const std::exception& e ) {
         STRATUM_THROW( service_init_failed, "initialization of service ${name} failed: ${what}",
                        ("name", inst.name)("what", e.what()) );
      }
      drop_actions.cancel();
      session.squash();
   }

   ilog( "started service ${name} (${id}) from ${a}",
         ("name", inst.name)("id", inst.id)("a", artifact_id.to_string()) );
   _instances.emplace( inst.id, move(inst) );
}

void native_runtime::execute( runtime_context& ctx, const call_info& call, const bytes& payload ) {
   auto itr = _instances.find( call.instance_id );
   STRATUM_ASSERT( itr != _instances.end(), execution_wrong_runtime,
                   "Wrong runtime: instance ${id} is not started", ("id", call.instance_id) );

   auto& inst = itr->second;
   const auto* method = inst.instance->find_method( call.method_id );
   STRATUM_ASSERT( method != nullptr, unknown_method_exception,
                   "service ${name} has no method ${m}", ("name", inst.name)("m", call.method_id) );

   service_context sctx( ctx, inst.id, inst.name );
   try {
      (*method)( sctx, payload );
   } STRATUM_RETHROW_EXCEPTIONS( service_error_exception, "call to ${name}::${m} failed",
                                 ("name", inst.name)("m", call.method_id) )
}

vector<pair<instance_id_type, digest_type>> native_runtime::state_hashes( const chainbase::database& snapshot )const {
   vector<pair<instance_id_type, digest_type>> result;
   result.reserve( _instances.size() );
   for( const auto& i : _instances ) {
      result.emplace_back( i.first, service_state_hash( snapshot, i.first ) );
   }
   return result;
}

void native_runtime::before_commit( chainbase::database& fork ) {
   for( auto& i : _instances ) {
      try {
         service_state state( fork, i.first );
         i.second.instance->before_commit( state );
      } FC_CAPTURE_AND_RETHROW( (i.second.name) )
   }
}

void native_runtime::after_commit( const chainbase::database& snapshot ) {
   for( auto& i : _instances ) {
      try {
         service_state_view state( snapshot, i.first );
         i.second.instance->after_commit( state );
      } catch( const fc::exception& e ) {
         elog( "after_commit of service ${name} failed: ${e}", ("name", i.second.name)("e", e.to_detail_string()) );
      } catch( const std::exception& e ) {
         elog( "after_commit of service ${name} failed: ${e}", ("name", i.second.name)("e", e.what()) );
      }
   }
}

vector<pair<string, service_api_builder>> native_runtime::services_api()const {
   vector<pair<string, service_api_builder>> result;
   for( const auto& i : _instances ) {
      service_api_builder builder;
      builder.instance_id = i.first;
      i.second.instance->wire_api( builder );
      result.emplace_back( i.second.name, move(builder) );
   }
   return result;
}

} } // stratum::runtime
