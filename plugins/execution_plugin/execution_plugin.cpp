#include <stratum/execution_plugin/execution_plugin.hpp>

#include <stratum/runtime/broadcaster.hpp>
#include <stratum/runtime/exceptions.hpp>
#include <stratum/runtime/internal_part.hpp>
#include <stratum/runtime/thread_utils.hpp>
#include <stratum/supervisor/supervisor.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger_config.hpp> // set_os_thread_name

#include <boost/filesystem.hpp>

#include <thread>

namespace bfs = boost::filesystem;

namespace stratum {
   static appbase::abstract_plugin& _execution_plugin = app().register_plugin<execution_plugin>();

using runtime::any_tx;
using runtime::dispatcher_builder;
using runtime::digest_type;
using runtime::execution_status;
using runtime::internal_event;
using runtime::internal_event_queue;
using runtime::internal_part;
using runtime::internal_request_queue;
using runtime::jump_to_round;
using runtime::message_verified_event;
using runtime::named_thread_pool;
using runtime::overloaded;
using runtime::private_key_type;
using runtime::public_key_type;
using runtime::restart_api_signal;
using runtime::runtime_context;
using runtime::service_api_builder;
using runtime::service_api_state;
using runtime::shutdown_signal;
using runtime::signing_broadcaster;
using runtime::timeout_event;
using runtime::api_exception;
using runtime::plugin_config_exception;

class execution_plugin_impl {
public:
   void set_program_options(options_description&, options_description& cfg) {
      cfg.add_options()
         ( "state-dir", bpo::value<bfs::path>()->default_value("state"),
           "the location of the state directory (absolute path or relative to application data dir)" )
         ( "state-size-mb", bpo::value<uint64_t>()->default_value(def_state_size_mb),
           "Maximum size (in MiB) of the state database" )
         ( "internal-requests-queue-size", bpo::value<uint32_t>()->default_value(def_queue_size),
           "Capacity of the internal request queue. Producers block while it is full. Should be between 1 and 1048576" )
         ( "internal-events-queue-size", bpo::value<uint32_t>()->default_value(def_queue_size),
           "Capacity of the internal event queue. Producers block while it is full. Should be between 1 and 1048576" )
         ( "signature-verification-threads", bpo::value<uint16_t>()->default_value(def_verification_threads),
           "Number of worker threads verifying message signatures. Should be between 1 and 64" )
         ( "supervisor-mode", bpo::value<std::string>()->default_value("simple"),
           "Supervisor mode: 'simple' applies configuration proposals immediately, 'decentralized' waits for a confirmation" )
         ( "service-private-key", bpo::value<std::string>(),
           "Key used to sign service transactions broadcast by this node. A new key is generated when not provided" )
         ;
   }

   void plugin_initialize(const variables_map& options) {
      requests_queue_size = options.at("internal-requests-queue-size").as<uint32_t>();
      STRATUM_ASSERT( requests_queue_size >= queue_size_low && requests_queue_size <= queue_size_high, plugin_config_exception,
         "\"internal-requests-queue-size\" must be between ${l} and ${h}", ("l", queue_size_low)("h", queue_size_high) );

      events_queue_size = options.at("internal-events-queue-size").as<uint32_t>();
      STRATUM_ASSERT( events_queue_size >= queue_size_low && events_queue_size <= queue_size_high, plugin_config_exception,
         "\"internal-events-queue-size\" must be between ${l} and ${h}", ("l", queue_size_low)("h", queue_size_high) );

      verification_threads = options.at("signature-verification-threads").as<uint16_t>();
      STRATUM_ASSERT( verification_threads >= verification_threads_low && verification_threads <= verification_threads_high,
         plugin_config_exception, "\"signature-verification-threads\" must be between ${l} and ${h}",
         ("l", verification_threads_low)("h", verification_threads_high) );

      auto mode = options.at("supervisor-mode").as<std::string>();
      if( mode == "simple" ) {
         sv_config.mode = supervisor::supervisor_mode::simple;
      } else if( mode == "decentralized" ) {
         sv_config.mode = supervisor::supervisor_mode::decentralized;
      } else {
         STRATUM_THROW( plugin_config_exception, "unknown \"supervisor-mode\" ${m}, expected simple or decentralized", ("m", mode) );
      }

      private_key_type service_key;
      if( options.count("service-private-key") ) {
         try {
            service_key = private_key_type( options.at("service-private-key").as<std::string>() );
         } catch( const fc::exception& e ) {
            STRATUM_THROW( plugin_config_exception, "invalid \"service-private-key\": ${e}", ("e", e.to_string()) );
         }
      } else {
         service_key = private_key_type::generate();
         wlog( "\"service-private-key\" not provided, generated service key ${k}", ("k", service_key.get_public_key()) );
      }

      state_dir = options.at("state-dir").as<bfs::path>();
      if( state_dir.is_relative() )
         state_dir = app().data_dir() / state_dir;
      auto state_size = options.at("state-size-mb").as<uint64_t>() * 1024 * 1024;

      db = std::make_unique<chainbase::database>( state_dir, chainbase::database::read_write, state_size );
      runtime::add_state_indices( *db );

      requests.emplace( requests_queue_size );
      events.emplace( events_queue_size );

      disp = dispatcher_builder( *requests )
            .with_builtin_service( supervisor::make_builtin_supervisor( sv_config ) )
            .finalize();
      broadcaster = std::make_unique<signing_broadcaster>( service_key, *requests );

      ilog( "execution core initialized, state in ${d}, service key ${k}",
            ("d", state_dir.string())("k", broadcaster->public_key()) );
   }

   void plugin_startup() {
      rebuild_api();

      verification_pool.emplace( "verify", verification_threads );
      event_pool.emplace( "events", 1 );
      scheduler = std::make_unique<internal_part>( *requests, *events, *verification_pool, *event_pool );

      scheduler_thread = std::thread( [this] {
         fc::set_os_thread_name( "internal" );
         try {
            scheduler->run();
         } FC_LOG_AND_DROP()
      } );

      event_thread = std::thread( [this, events = *events]() mutable {
         fc::set_os_thread_name( "evloop" );
         while( auto event = events.pop() ) {
            app().post( priority::medium, [this, event = std::move(*event)]() mutable {
               handle_event( std::move(event) );
            } );
         }
         dlog( "internal event loop exited" );
      } );
   }

   void plugin_shutdown() {
      ilog("shutdown...");

      if( requests ) {
         if( !requests->try_push( shutdown_signal{} ) )
            wlog( "unable to forward shutdown request, internal request queue is full or closed" );
         requests->close();
      }
      if( scheduler_thread.joinable() )
         scheduler_thread.join();

      if( events )
         events->close();
      if( event_thread.joinable() )
         event_thread.join();

      if( verification_pool )
         verification_pool->stop();
      if( event_pool )
         event_pool->stop();

      ilog("exit shutdown");
   }

   void handle_event( internal_event event ) {
      std::visit( overloaded {
         [&]( message_verified_event& e ) {
            if( auto* tx = std::get_if<any_tx>( &e.message.message ) ) {
               apply_transaction( e.message.author, e.message.hash, *tx );
            } else {
               dlog( "consensus message ${h} from ${a} ignored, no consensus engine attached",
                     ("h", e.message.hash)("a", e.message.author) );
            }
         },
         [&]( timeout_event& e ) {
            dlog( "timeout ${t}", ("t", e.token) );
         },
         [&]( jump_to_round& e ) {
            dlog( "jump to round ${r} at height ${h}", ("r", e.round)("h", e.height) );
         },
         [&]( restart_api_signal& ) {
            rebuild_api();
         },
         [&]( shutdown_signal& ) {
            ilog( "internal part forwarded shutdown" );
         }
      }, event );
   }

   void apply_transaction( const public_key_type& author, const digest_type& hash, const any_tx& tx ) {
      {
         auto session = db->start_undo_session( true );
         runtime_context ctx( *db, author, hash );
         try {
            disp->execute( ctx, tx.call, tx.payload );
            disp->before_commit( *db );
         } catch( const fc::exception& e ) {
            auto status = execution_status::from_exception( e );
            wlog( "transaction ${h} failed: ${s}", ("h", hash)("s", status) );
            dlog( "${d}", ("d", e.to_detail_string()) );
            return;
         }
         session.push();
      }
      db->commit( db->revision() );
      disp->after_commit( *db );
      dlog( "applied transaction ${h} to ${i}:${m}", ("h", hash)("i", tx.call.instance_id)("m", tx.call.method_id) );
   }

   void rebuild_api() {
      apis.clear();
      for( auto& api : disp->services_api() ) {
         ilog( "service API /${n} with ${p} private and ${u} public endpoints",
               ("n", api.first)("p", api.second.private_scope().endpoints().size())
               ("u", api.second.public_scope().endpoints().size()) );
         apis.emplace( api.first, std::move(api.second) );
      }
   }

   fc::variant call_api( const std::string& service, const std::string& endpoint,
                         const fc::variant& query, bool private_api ) const {
      auto itr = apis.find( service );
      STRATUM_ASSERT( itr != apis.end(), api_exception, "unknown service ${s}", ("s", service) );
      const auto& scope = private_api ? itr->second.private_scope() : itr->second.public_scope();
      auto e = scope.endpoints().find( endpoint );
      STRATUM_ASSERT( e != scope.endpoints().end(), api_exception, "unknown endpoint /${s}/${e}",
                      ("s", service)("e", endpoint) );
      service_api_state state{ *db, itr->second.instance_id, service, broadcaster.get() };
      return e->second.handler( state, query );
   }

   static constexpr uint64_t def_state_size_mb = 1024;
   static constexpr uint32_t def_queue_size = 1024;
   static constexpr uint32_t queue_size_low = 1;
   static constexpr uint32_t queue_size_high = 1024 * 1024;
   static constexpr uint16_t def_verification_threads = 2;
   static constexpr uint16_t verification_threads_low = 1;
   static constexpr uint16_t verification_threads_high = 64;

   uint32_t                                   requests_queue_size = def_queue_size;
   uint32_t                                   events_queue_size = def_queue_size;
   uint16_t                                   verification_threads = def_verification_threads;
   supervisor::supervisor_config              sv_config;
   bfs::path                                  state_dir;

   std::unique_ptr<chainbase::database>       db;
   std::optional<internal_request_queue>      requests;
   std::optional<internal_event_queue>        events;
   std::unique_ptr<runtime::dispatcher>       disp;
   std::unique_ptr<signing_broadcaster>       broadcaster;
   std::map<std::string, service_api_builder> apis;

   std::optional<named_thread_pool>           verification_pool;
   std::optional<named_thread_pool>           event_pool;
   std::unique_ptr<internal_part>             scheduler;
   std::thread                                scheduler_thread;
   std::thread                                event_thread;
};

execution_plugin::execution_plugin():my(std::make_unique<execution_plugin_impl>()) {}

execution_plugin::~execution_plugin() {}

void execution_plugin::set_program_options(options_description& cli, options_description& cfg) {
   my->set_program_options(cli, cfg);
}

void execution_plugin::plugin_initialize(const variables_map& options) {
   try {
      my->plugin_initialize(options);
   } FC_LOG_AND_RETHROW()
}

void execution_plugin::plugin_startup() {
   try {
      my->plugin_startup();
   } FC_LOG_AND_RETHROW()
}

void execution_plugin::plugin_shutdown() {
   my->plugin_shutdown();
}

runtime::dispatcher& execution_plugin::get_dispatcher() {
   return *my->disp;
}

const chainbase::database& execution_plugin::db() const {
   return *my->db;
}

runtime::internal_request_queue execution_plugin::requests() const {
   return *my->requests;
}

runtime::transaction_broadcaster* execution_plugin::broadcaster() const {
   return my->broadcaster.get();
}

fc::variant execution_plugin::call_api( const std::string& service, const std::string& endpoint,
                                        const fc::variant& query, bool private_api ) const {
   return my->call_api( service, endpoint, query, private_api );
}

}
