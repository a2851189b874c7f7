#include "test_services.hpp"

#include <stratum/runtime/broadcaster.hpp>
#include <stratum/supervisor/supervisor.hpp>

#include <boost/test/unit_test.hpp>

using namespace stratum::runtime;
using namespace stratum::supervisor;
using namespace stratum::testing;

namespace {

   struct supervisor_fixture : state_fixture {
      explicit supervisor_fixture( supervisor_mode mode = supervisor_mode::simple )
      :requests( 32 )
      {
         d = dispatcher_builder( requests )
               .with_builtin_service( make_builtin_supervisor( supervisor_config{ mode } ) )
               .with_service_factory( counter_factory( counter_v1() ) )
               .finalize();
      }

      template<typename Payload>
      void call( method_id_type method, const Payload& payload ) {
         auto ctx = make_context();
         d->execute( ctx, call_info( supervisor_instance_id, method ), fc::raw::pack( payload ) );
      }

      void deploy_counter() {
         call( request_artifact_deploy_method, deploy_request{ counter_v1().to_spec(), 0 } );
      }

      static config_propose counters( std::initializer_list<string> names ) {
         config_propose p;
         for( const auto& n : names )
            p.changes.push_back( start_service{ counter_v1().to_spec(), n, to_bytes( n ) } );
         return p;
      }

      uint64_t service_error( std::function<void()> f ) {
         try {
            f();
         } catch( const service_error_exception& e ) {
            BOOST_REQUIRE( e.error_code.has_value() );
            return *e.error_code;
         }
         BOOST_FAIL( "expected a service error" );
         return 0;
      }

      service_state_view supervisor_state()const { return service_state_view( db, supervisor_instance_id ); }

      service_api_builder api() {
         for( auto& a : d->services_api() ) {
            if( a.first == supervisor_instance_name )
               return move(a.second);
         }
         BOOST_FAIL( "supervisor API not found" );
         return {};
      }

      fc::variant invoke( const service_api_scope& scope, const string& name, const fc::variant& query,
                          transaction_broadcaster* broadcaster = nullptr ) {
         auto itr = scope.endpoints().find( name );
         BOOST_REQUIRE( itr != scope.endpoints().end() );
         return itr->second.handler( service_api_state{ db, supervisor_instance_id, supervisor_instance_name, broadcaster },
                                     query );
      }

      internal_request_queue   requests;
      unique_ptr<dispatcher>   d;
   };

   struct decentralized_fixture : supervisor_fixture {
      decentralized_fixture() : supervisor_fixture( supervisor_mode::decentralized ) {}
   };

}

BOOST_AUTO_TEST_SUITE(supervisor_tests)

BOOST_FIXTURE_TEST_CASE(supervisor_is_builtin, supervisor_fixture) { try {
   BOOST_TEST( *d->find_instance_runtime( supervisor_instance_id ) == native_runtime::id );
   BOOST_TEST( supervisor_service::configuration_number( supervisor_state() ) == 0u );
   BOOST_TEST( !supervisor_service::pending( supervisor_state() ).has_value() );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(deploy_request_queues_deployment, supervisor_fixture) { try {
   auto spec = counter_v1().to_spec();
   BOOST_CHECK( d->check_deploy_status( spec, false ) == deploy_status::pending );
   deploy_counter();
   BOOST_CHECK( d->check_deploy_status( spec, false ) == deploy_status::deployed );

   BOOST_TEST( service_error( [&]() {
      call( request_artifact_deploy_method, deploy_request{ artifact_spec{ native_runtime::id, {} }, 0 } );
   }) == static_cast<uint64_t>( supervisor_error::malformed_deploy_request ) );

   BOOST_CHECK_THROW( call( request_artifact_deploy_method, deploy_request{ counter_v2().to_spec(), 0 } ),
                      dispatcher_action_exception );
   BOOST_CHECK_THROW( call( request_artifact_deploy_method, deploy_request{ artifact_spec{ 9, { 'a' } }, 0 } ),
                      dispatcher_action_exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(simple_mode_applies_proposals, supervisor_fixture) { try {
   deploy_counter();
   call( propose_config_change_method, counters( { "alpha", "beta" } ) );

   BOOST_TEST( supervisor_service::configuration_number( supervisor_state() ) == 1u );
   BOOST_TEST( !supervisor_service::pending( supervisor_state() ).has_value() );
   BOOST_TEST( *d->find_instance_runtime( first_service_instance_id ) == native_runtime::id );
   BOOST_TEST( *d->find_instance_runtime( first_service_instance_id + 1 ) == native_runtime::id );
   BOOST_CHECK( *service_state_view( db, first_service_instance_id ).get( 1 ) == to_bytes( "alpha" ) );
   BOOST_CHECK( *service_state_view( db, first_service_instance_id + 1 ).get( 1 ) == to_bytes( "beta" ) );

   call( propose_config_change_method, counters( { "gamma" } ) );
   BOOST_TEST( supervisor_service::configuration_number( supervisor_state() ) == 2u );
   BOOST_TEST( d->find_instance_runtime( first_service_instance_id + 2 ).has_value() );

   size_t restarts = 0;
   while( auto r = requests.try_pop() )
      restarts += std::holds_alternative<restart_api_signal>( *r ) ? 1 : 0;
   BOOST_TEST( restarts == 3u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(failed_start_rolls_back_with_transaction, supervisor_fixture) { try {
   // not deployed: the init_service action fails and the whole call fails
   {
      auto session = db.start_undo_session( true );
      BOOST_CHECK_THROW( call( propose_config_change_method, counters( { "alpha" } ) ), dispatcher_action_exception );
   }
   BOOST_TEST( supervisor_service::configuration_number( supervisor_state() ) == 0u );
   BOOST_TEST( !d->find_instance_runtime( first_service_instance_id ).has_value() );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(malformed_proposals, supervisor_fixture) { try {
   BOOST_TEST( service_error( [&]() { call( propose_config_change_method, config_propose() ); } )
               == static_cast<uint64_t>( supervisor_error::empty_config_proposal ) );

   auto nameless = counters( { "" } );
   BOOST_TEST( service_error( [&]() { call( propose_config_change_method, nameless ); } )
               == static_cast<uint64_t>( supervisor_error::malformed_start_service ) );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(decentralized_mode_waits_for_confirmation, decentralized_fixture) { try {
   deploy_counter();
   auto proposal = counters( { "alpha" } );
   call( propose_config_change_method, proposal );

   auto pending = supervisor_service::pending( supervisor_state() );
   BOOST_REQUIRE( pending.has_value() );
   BOOST_CHECK( pending->propose_hash == proposal_hash( proposal ) );
   BOOST_CHECK( pending->author == author );
   BOOST_TEST( !d->find_instance_runtime( first_service_instance_id ).has_value() );

   BOOST_TEST( service_error( [&]() { call( propose_config_change_method, counters( { "beta" } ) ); } )
               == static_cast<uint64_t>( supervisor_error::proposal_already_exists ) );

   BOOST_TEST( service_error( [&]() {
      call( confirm_config_change_method, config_vote{ proposal_hash( counters( { "beta" } ) ) } );
   }) == static_cast<uint64_t>( supervisor_error::proposal_hash_mismatch ) );

   call( confirm_config_change_method, config_vote{ proposal_hash( proposal ) } );
   BOOST_TEST( !supervisor_service::pending( supervisor_state() ).has_value() );
   BOOST_TEST( supervisor_service::configuration_number( supervisor_state() ) == 1u );
   BOOST_TEST( *d->find_instance_runtime( first_service_instance_id ) == native_runtime::id );

   BOOST_TEST( service_error( [&]() {
      call( confirm_config_change_method, config_vote{ proposal_hash( proposal ) } );
   }) == static_cast<uint64_t>( supervisor_error::no_pending_proposal ) );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(api_requires_a_validator, supervisor_fixture) { try {
   auto sv = api();
   BOOST_TEST( sv.private_scope().endpoints().at( "deploy-artifact" ).mutating );
   BOOST_TEST( !sv.private_scope().endpoints().at( "configuration-number" ).mutating );

   fc::variant query( deploy_request{ counter_v1().to_spec(), 5 } );
   BOOST_CHECK_THROW( invoke( sv.private_scope(), "deploy-artifact", query ), not_a_validator_exception );
   BOOST_TEST( requests.size() == 0u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(api_broadcasts_signed_transactions, supervisor_fixture) { try {
   auto key = private_key_type::generate();
   signing_broadcaster broadcaster( key, requests );
   auto sv = api();

   deploy_request request{ counter_v1().to_spec(), 5 };
   auto result = invoke( sv.private_scope(), "deploy-artifact", fc::variant( request ), &broadcaster );
   auto hash = result.as<digest_type>();

   auto queued = requests.try_pop();
   BOOST_REQUIRE( queued.has_value() );
   auto* verify = std::get_if<verify_message_request>( &*queued );
   BOOST_REQUIRE( verify != nullptr );

   auto verified = verify_message( verify->raw );
   BOOST_REQUIRE( verified.has_value() );
   BOOST_CHECK( verified->hash == hash );
   BOOST_CHECK( verified->author == key.get_public_key() );

   const auto& tx = std::get<any_tx>( verified->message );
   BOOST_CHECK( tx.call == call_info( supervisor_instance_id, request_artifact_deploy_method ) );
   auto decoded = fc::raw::unpack<deploy_request>( tx.payload );
   BOOST_CHECK( decoded.artifact == request.artifact );
   BOOST_TEST( decoded.deadline_height == 5u );

   // proposals carry config_change variants through the query
   auto proposal = counters( { "alpha", "beta" } );
   invoke( sv.private_scope(), "propose-config", fc::variant( proposal ), &broadcaster );
   queued = requests.try_pop();
   BOOST_REQUIRE( queued.has_value() );
   verified = verify_message( std::get<verify_message_request>( *queued ).raw );
   BOOST_REQUIRE( verified.has_value() );
   const auto& propose_tx = std::get<any_tx>( verified->message );
   BOOST_CHECK( propose_tx.call == call_info( supervisor_instance_id, propose_config_change_method ) );
   BOOST_CHECK( proposal_hash( fc::raw::unpack<config_propose>( propose_tx.payload ) ) == proposal_hash( proposal ) );

   requests.close();
   BOOST_CHECK_THROW( invoke( sv.private_scope(), "deploy-artifact", fc::variant( request ), &broadcaster ),
                      broadcast_exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(api_reads_state, decentralized_fixture) { try {
   auto sv = api();
   BOOST_TEST( invoke( sv.private_scope(), "configuration-number", fc::variant() ).as_uint64() == 0u );
   BOOST_CHECK( invoke( sv.private_scope(), "supervisor-config", fc::variant() ).as<supervisor_config>().mode
                == supervisor_mode::decentralized );
   BOOST_TEST( invoke( sv.public_scope(), "config-proposal", fc::variant() ).is_null() );

   deploy_counter();
   auto proposal = counters( { "alpha" } );
   call( propose_config_change_method, proposal );

   auto pending = invoke( sv.public_scope(), "config-proposal", fc::variant() ).as<pending_proposal>();
   BOOST_CHECK( pending.propose_hash == proposal_hash( proposal ) );

   call( confirm_config_change_method, config_vote{ pending.propose_hash } );
   BOOST_TEST( invoke( sv.private_scope(), "configuration-number", fc::variant() ).as_uint64() == 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
