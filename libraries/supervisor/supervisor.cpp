#include <stratum/supervisor/supervisor.hpp>
#include <stratum/runtime/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace stratum { namespace supervisor {

namespace {

   enum state_key : uint64_t {
      configuration_number_key = 0,
      pending_proposal_key     = 1,
      next_instance_id_key     = 2
   };

   digest_type broadcast( const service_api_state& s, method_id_type method, const bytes& payload ) {
      STRATUM_ASSERT( s.broadcaster != nullptr, not_a_validator_exception, "Node is not a validator" );
      return s.broadcaster->broadcast( call_info( s.instance_id, method ), payload );
   }

   template<typename Payload>
   auto broadcast_handler( method_id_type method ) {
      return [method]( const service_api_state& s, const Payload& payload ) {
         return broadcast( s, method, fc::raw::pack( payload ) );
      };
   }

}

digest_type proposal_hash( const config_propose& propose ) {
   auto packed = fc::raw::pack( propose );
   return digest_type::hash( packed.data(), packed.size() );
}

supervisor_service::supervisor_service( supervisor_config config )
:_config( config )
{
   register_method<deploy_request>( request_artifact_deploy_method,
      [this]( service_context& ctx, const deploy_request& r ) { request_artifact_deploy( ctx, r ); } );
   register_method<config_propose>( propose_config_change_method,
      [this]( service_context& ctx, const config_propose& p ) { propose_config_change( ctx, p ); } );
   register_method<config_vote>( confirm_config_change_method,
      [this]( service_context& ctx, const config_vote& v ) { confirm_config_change( ctx, v ); } );
}

uint64_t supervisor_service::configuration_number( const service_state_view& state ) {
   return state.get_as<uint64_t>( configuration_number_key ).value_or( 0 );
}

optional<pending_proposal> supervisor_service::pending( const service_state_view& state ) {
   return state.get_as<pending_proposal>( pending_proposal_key );
}

void supervisor_service::request_artifact_deploy( service_context& ctx, const deploy_request& request ) {
   STRATUM_SERVICE_ASSERT( !request.artifact.raw_spec.empty(), supervisor_error::malformed_deploy_request,
                           "artifact specification for runtime ${r} is empty", ("r", request.artifact.runtime_id) );

   ctx.dispatch_action( start_deploy_action{ request.artifact } );
   ilog( "requested deployment of artifact for runtime ${r} by ${a}",
         ("r", request.artifact.runtime_id)("a", ctx.author()) );
}

void supervisor_service::propose_config_change( service_context& ctx, const config_propose& propose ) {
   STRATUM_SERVICE_ASSERT( !propose.changes.empty(), supervisor_error::empty_config_proposal,
                           "configuration proposal has no changes" );
   for( const auto& change : propose.changes ) {
      std::visit( [&]( const start_service& s ) {
         STRATUM_SERVICE_ASSERT( !s.name.empty() && !s.artifact.raw_spec.empty(), supervisor_error::malformed_start_service,
                                 "start_service change requires an artifact and a name" );
      }, change );
   }

   if( _config.mode == supervisor_mode::simple ) {
      apply_proposal( ctx, propose );
      return;
   }

   auto state = ctx.state();
   STRATUM_SERVICE_ASSERT( !state.contains( pending_proposal_key ), supervisor_error::proposal_already_exists,
                           "a configuration proposal is already pending" );

   pending_proposal p{ propose, proposal_hash( propose ), ctx.author() };
   state.set_as( pending_proposal_key, p );
   ilog( "stored configuration proposal ${h}", ("h", p.propose_hash) );
}

void supervisor_service::confirm_config_change( service_context& ctx, const config_vote& vote ) {
   auto state = ctx.state();
   auto p = pending( state );
   STRATUM_SERVICE_ASSERT( p.has_value(), supervisor_error::no_pending_proposal,
                           "there is no pending configuration proposal" );
   STRATUM_SERVICE_ASSERT( p->propose_hash == vote.propose_hash, supervisor_error::proposal_hash_mismatch,
                           "vote for ${v} does not match pending proposal ${p}",
                           ("v", vote.propose_hash)("p", p->propose_hash) );

   state.erase( pending_proposal_key );
   apply_proposal( ctx, p->propose );
}

void supervisor_service::apply_proposal( service_context& ctx, const config_propose& propose ) {
   auto state = ctx.state();
   auto next_id = state.get_as<instance_id_type>( next_instance_id_key ).value_or( first_service_instance_id );

   for( const auto& change : propose.changes ) {
      std::visit( [&]( const start_service& s ) {
         dlog( "starting service ${name} as instance ${id}", ("name", s.name)("id", next_id) );
         ctx.dispatch_action( init_service_action{ s.artifact, service_constructor{ next_id, s.config } } );
         ++next_id;
      }, change );
   }

   auto number = configuration_number( state ) + 1;
   state.set_as( next_instance_id_key, next_id );
   state.set_as( configuration_number_key, number );
   ilog( "applied configuration ${n} with ${c} changes", ("n", number)("c", propose.changes.size()) );
}

void supervisor_service::wire_api( service_api_builder& builder ) {
   auto config = _config;

   builder.private_scope()
      .endpoint_mut<deploy_request>( "deploy-artifact", broadcast_handler<deploy_request>( request_artifact_deploy_method ) )
      .endpoint_mut<config_propose>( "propose-config", broadcast_handler<config_propose>( propose_config_change_method ) )
      .endpoint_mut<config_vote>( "confirm-config", broadcast_handler<config_vote>( confirm_config_change_method ) )
      .endpoint( "configuration-number", []( const service_api_state& s, const fc::variant& ) {
         return fc::variant( configuration_number( s.state() ) );
      })
      .endpoint( "supervisor-config", [config]( const service_api_state&, const fc::variant& ) {
         return fc::variant( config );
      });

   builder.public_scope()
      .endpoint( "config-proposal", []( const service_api_state& s, const fc::variant& ) {
         auto p = pending( s.state() );
         return p ? fc::variant( *p ) : fc::variant();
      });
}

native_artifact_id supervisor_factory::artifact()const {
   return native_artifact_id{ "stratum-supervisor", "1.0.0" };
}

unique_ptr<service> supervisor_factory::create_instance()const {
   return make_unique<supervisor_service>( _config );
}

builtin_service make_builtin_supervisor( supervisor_config config ) {
   return builtin_service{ make_unique<supervisor_factory>( config ), supervisor_instance_id, supervisor_instance_name };
}

} } // stratum::supervisor
