#include "test_services.hpp"

#include <stratum/runtime/foreign_runtime.hpp>

#include <boost/test/unit_test.hpp>

using namespace stratum::runtime;
using namespace stratum::testing;

namespace {

   /// In-process stand-in for an external backend
   class scripted_endpoint : public foreign_endpoint {
      public:
         using handler_type = std::function<foreign_response(const foreign_request&)>;

         bytes roundtrip( const bytes& request ) override {
            requests.push_back( fc::raw::unpack<foreign_request>( request ) );
            if( raw_reply )
               return *raw_reply;
            if( !handler )
               throw std::runtime_error( "backend unreachable" );
            return fc::raw::pack( handler( requests.back() ) );
         }

         handler_type             handler;
         optional<bytes>          raw_reply;
         vector<foreign_request>  requests;
   };

   constexpr runtime_id_type foreign_id = static_cast<runtime_id_type>( runtime_identifier::foreign );

   struct foreign_fixture : state_fixture {
      foreign_fixture() {
         auto ep = make_unique<scripted_endpoint>();
         endpoint = ep.get();
         endpoint->handler = []( const foreign_request& ) { return foreign_response(); };
         rt = make_unique<foreign_runtime>( foreign_id, move(ep) );
      }

      artifact_spec artifact()const { return artifact_spec{ foreign_id, to_bytes( "wasm-module" ) }; }

      scripted_endpoint*           endpoint = nullptr;
      unique_ptr<foreign_runtime>  rt;
   };

   foreign_response failure( int64_t code, const string& description, optional<uint64_t> error_code = {} ) {
      foreign_response r;
      r.code = code;
      r.description = description;
      r.error_code = error_code;
      return r;
   }

}

BOOST_AUTO_TEST_SUITE(foreign_runtime_tests)

BOOST_FIXTURE_TEST_CASE(deploy_is_forwarded, foreign_fixture) { try {
   endpoint->handler = []( const foreign_request& req ) {
      foreign_response r;
      if( std::holds_alternative<foreign_deploy_status_request>( req ) )
         r.status = deploy_status::deployed;
      return r;
   };

   rt->start_deploy( artifact() );
   BOOST_CHECK( rt->check_deploy_status( artifact(), true ) == deploy_status::deployed );

   BOOST_REQUIRE_EQUAL( endpoint->requests.size(), 2u );
   BOOST_CHECK( std::get<foreign_deploy_request>( endpoint->requests[0] ).artifact == artifact() );
   BOOST_TEST( std::get<foreign_deploy_status_request>( endpoint->requests[1] ).cancel_if_incomplete );

   auto native = counter_v1().to_spec();
   BOOST_CHECK_THROW( rt->start_deploy( native ), deploy_wrong_runtime );
   BOOST_TEST( endpoint->requests.size() == 2u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(backend_errors_become_typed_exceptions, foreign_fixture) { try {
   endpoint->handler = []( const foreign_request& ) {
      return failure( unknown_artifact_exception::code_value, "no such module" );
   };
   BOOST_CHECK_THROW( rt->start_deploy( artifact() ), unknown_artifact_exception );

   endpoint->handler = []( const foreign_request& ) { return failure( 1234, "something odd" ); };
   BOOST_CHECK_THROW( rt->start_deploy( artifact() ), artifact_deploy_failed );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(transport_failures, foreign_fixture) { try {
   endpoint->handler = nullptr;
   BOOST_CHECK_THROW( rt->start_deploy( artifact() ), foreign_runtime_exception );

   endpoint->raw_reply = bytes{ 'n', 'o', 'p', 'e' };
   BOOST_CHECK_THROW( rt->check_deploy_status( artifact(), false ), foreign_runtime_exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(init_applies_writes_and_actions, foreign_fixture) { try {
   endpoint->handler = []( const foreign_request& req ) {
      foreign_response r;
      if( auto* init = std::get_if<foreign_init_request>( &req ) ) {
         r.writes.push_back( state_write{ init->constructor.instance_id, 1, init->constructor.data } );
         r.actions.push_back( start_deploy_action{ artifact_spec{ foreign_id, to_bytes( "dependency" ) } } );
      }
      return r;
   };

   auto ctx = make_context();
   rt->init_service( ctx, artifact(), service_constructor{ 100, to_bytes( "init" ) } );

   BOOST_TEST( rt->has_instance( 100 ) );
   BOOST_CHECK( *service_state_view( db, 100 ).get( 1 ) == to_bytes( "init" ) );

   const auto& sent = std::get<foreign_init_request>( endpoint->requests.back() );
   BOOST_CHECK( sent.author == author );
   BOOST_CHECK( sent.tx_hash == tx_hash );

   auto actions = ctx.take_dispatcher_actions();
   BOOST_REQUIRE_EQUAL( actions.size(), 1u );
   BOOST_TEST( std::holds_alternative<start_deploy_action>( actions[0] ) );

   BOOST_CHECK_THROW( rt->init_service( ctx, artifact(), service_constructor{ 100, {} } ), service_already_exists );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(init_cannot_touch_other_instances, foreign_fixture) { try {
   endpoint->handler = []( const foreign_request& ) {
      foreign_response r;
      r.writes.push_back( state_write{ 100, 1, bytes{ 'a' } } );
      r.writes.push_back( state_write{ 0, 1, bytes{ 'b' } } );
      return r;
   };

   auto ctx = make_context();
   BOOST_CHECK_THROW( rt->init_service( ctx, artifact(), service_constructor{ 100, {} } ), foreign_runtime_exception );
   BOOST_TEST( !rt->has_instance( 100 ) );
   BOOST_TEST( service_state_view( db, 100 ).size() == 0u );
   BOOST_TEST( service_state_view( db, 0 ).size() == 0u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(init_failure_reported_by_backend, foreign_fixture) { try {
   endpoint->handler = []( const foreign_request& ) {
      return failure( service_init_failed::code_value, "bad constructor", 9 );
   };
   auto ctx = make_context();
   try {
      rt->init_service( ctx, artifact(), service_constructor{ 100, {} } );
      BOOST_FAIL( "init should fail" );
   } catch( const service_init_failed& e ) {
      BOOST_TEST( *e.error_code == 9u );
   }
   BOOST_TEST( !rt->has_instance( 100 ) );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(execute_round_trip, foreign_fixture) { try {
   auto ctx = make_context();
   rt->init_service( ctx, artifact(), service_constructor{ 100, {} } );

   endpoint->handler = []( const foreign_request& req ) {
      const auto& exec = std::get<foreign_execute_request>( req );
      if( exec.call.method_id == 1 )
         return failure( service_error_exception::code_value, "insufficient funds", 17 );
      foreign_response r;
      r.writes.push_back( state_write{ exec.call.instance_id, 5, exec.payload } );
      r.writes.push_back( state_write{ exec.call.instance_id, 6, {} } );
      return r;
   };

   service_state( db, 100 ).set( 6, bytes{ 'o', 'l', 'd' } );
   rt->execute( ctx, call_info( 100, 0 ), to_bytes( "payload" ) );
   service_state_view state( db, 100 );
   BOOST_CHECK( *state.get( 5 ) == to_bytes( "payload" ) );
   BOOST_TEST( !state.contains( 6 ) );

   try {
      rt->execute( ctx, call_info( 100, 1 ), bytes() );
      BOOST_FAIL( "method 1 should fail" );
   } catch( const service_error_exception& e ) {
      auto status = execution_status::from_exception( e );
      BOOST_TEST( status.code == service_error_exception::code_value );
      BOOST_TEST( *status.error_code == 17u );
   }

   auto sent = endpoint->requests.size();
   BOOST_CHECK_THROW( rt->execute( ctx, call_info( 101, 0 ), bytes() ), execution_wrong_runtime );
   BOOST_TEST( endpoint->requests.size() == sent );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(commit_hooks, foreign_fixture) { try {
   auto ctx = make_context();
   rt->init_service( ctx, artifact(), service_constructor{ 100, {} } );

   endpoint->handler = []( const foreign_request& req ) {
      const auto& commit = std::get<foreign_commit_request>( req );
      if( commit.after )
         return failure( 1, "backend crashed" );
      foreign_response r;
      r.writes.push_back( state_write{ 100, 9, bytes{ 'c' } } );
      return r;
   };

   rt->before_commit( db );
   BOOST_TEST( service_state_view( db, 100 ).contains( 9 ) );
   BOOST_CHECK_NO_THROW( rt->after_commit( db ) );

   auto hashes = rt->state_hashes( db );
   BOOST_REQUIRE_EQUAL( hashes.size(), 1u );
   BOOST_TEST( hashes[0].first == 100u );
   BOOST_CHECK( hashes[0].second == service_state_hash( db, 100 ) );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(routed_through_dispatcher, foreign_fixture) { try {
   internal_request_queue requests( 4 );
   auto d = dispatcher_builder( requests )
         .with_service_factory( counter_factory( counter_v1() ) )
         .with_runtime( foreign_id, move(rt) )
         .finalize();

   auto ctx = make_context();
   d->init_service( ctx, artifact(), service_constructor{ 100, {} } );
   BOOST_TEST( *d->find_instance_runtime( 100 ) == foreign_id );

   d->execute( ctx, call_info( 100, 0 ), bytes() );
   BOOST_TEST( std::holds_alternative<foreign_execute_request>( endpoint->requests.back() ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
