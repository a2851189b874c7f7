#include <stratum/runtime/dispatcher.hpp>
#include <stratum/runtime/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/scoped_exit.hpp>

#include <iterator>

namespace stratum { namespace runtime {

dispatcher::dispatcher( internal_request_queue requests )
:_requests( move(requests) ) {}

dispatcher::~dispatcher() = default;

void dispatcher::add_runtime( runtime_id_type id, unique_ptr<runtime> rt ) {
   FC_ASSERT( rt, "runtime must not be null" );
   _runtimes[id] = move(rt);
   ilog( "registered runtime ${id}", ("id", id) );
}

bool dispatcher::has_runtime( runtime_id_type id )const {
   return _runtimes.find( id ) != _runtimes.end();
}

optional<runtime_id_type> dispatcher::find_instance_runtime( instance_id_type instance_id )const {
   auto itr = _runtime_lookup.find( instance_id );
   if( itr == _runtime_lookup.end() ) return {};
   return itr->second;
}

void dispatcher::notify_service_started( instance_id_type instance_id, const artifact_spec& artifact ) {
   FC_ASSERT( has_runtime( artifact.runtime_id ), "runtime ${r} is not registered", ("r", artifact.runtime_id) );
   auto res = _runtime_lookup.emplace( instance_id, artifact.runtime_id );
   STRATUM_ASSERT( res.second, service_already_exists, "service instance ${id} is already run by runtime ${r}",
                   ("id", instance_id)("r", res.first->second) );
}

void dispatcher::start_deploy( const artifact_spec& artifact ) {
   auto itr = _runtimes.find( artifact.runtime_id );
   STRATUM_ASSERT( itr != _runtimes.end(), deploy_wrong_runtime,
                   "Wrong runtime: runtime ${r} is not registered", ("r", artifact.runtime_id) );
   itr->second->start_deploy( artifact );
}

deploy_status dispatcher::check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete ) {
   auto itr = _runtimes.find( artifact.runtime_id );
   STRATUM_ASSERT( itr != _runtimes.end(), deploy_wrong_runtime,
                   "Wrong runtime: runtime ${r} is not registered", ("r", artifact.runtime_id) );
   return itr->second->check_deploy_status( artifact, cancel_if_incomplete );
}

void dispatcher::init_service( runtime_context& ctx, const artifact_spec& artifact,
                               const service_constructor& constructor ) {
   auto itr = _runtimes.find( artifact.runtime_id );
   STRATUM_ASSERT( itr != _runtimes.end(), init_wrong_runtime,
                   "Wrong runtime: runtime ${r} is not registered", ("r", artifact.runtime_id) );
   auto existing = _runtime_lookup.find( constructor.instance_id );
   STRATUM_ASSERT( existing == _runtime_lookup.end(), service_already_exists,
                   "service instance ${id} is already run by runtime ${r}",
                   ("id", constructor.instance_id)("r", existing->second) );

   auto restart_api = fc::make_scoped_exit( [this]() {
      if( !_requests.try_push( restart_api_signal{} ) ) {
         elog( "Failed to request API restart: internal request queue is ${s}",
               ("s", _requests.is_closed() ? "closed" : "full") );
      }
   });

   itr->second->init_service( ctx, artifact, constructor );
   notify_service_started( constructor.instance_id, artifact );
}

void dispatcher::execute( runtime_context& ctx, const call_info& call, const bytes& payload ) {
   auto lookup = _runtime_lookup.find( call.instance_id );
   STRATUM_ASSERT( lookup != _runtime_lookup.end(), execution_wrong_runtime,
                   "Wrong runtime: service instance ${id} is not started", ("id", call.instance_id) );
   auto itr = _runtimes.find( lookup->second );
   STRATUM_ASSERT( itr != _runtimes.end(), execution_wrong_runtime,
                   "Wrong runtime: runtime ${r} is not registered", ("r", lookup->second) );

   try {
      itr->second->execute( ctx, call, payload );
   } catch( ... ) {
      ctx.take_dispatcher_actions();
      throw;
   }

   auto actions = ctx.take_dispatcher_actions();
   for( auto& a : actions ) {
      try {
         apply_action( ctx, move(a) );
      } catch( ... ) {
         ctx.take_dispatcher_actions();
         throw;
      }
      if( ctx.has_pending_actions() ) {
         auto nested = ctx.take_dispatcher_actions();
         STRATUM_THROW( nested_action_exception, "dispatcher action enqueued ${n} further actions",
                        ("n", nested.size()) );
      }
   }
}

void dispatcher::apply_action( runtime_context& ctx, dispatcher_action action ) {
   try {
      std::visit( overloaded {
         [&]( const start_deploy_action& a ) {
            dlog( "applying start_deploy for runtime ${r}", ("r", a.artifact.runtime_id) );
            start_deploy( a.artifact );
         },
         [&]( const init_service_action& a ) {
            dlog( "applying init_service of instance ${id} for runtime ${r}",
                  ("id", a.constructor.instance_id)("r", a.artifact.runtime_id) );
            init_service( ctx, a.artifact, a.constructor );
         }
      }, action );
   } catch( const fc::exception& e ) {
      dispatcher_action_exception err( FC_LOG_MESSAGE( error, "dispatcher action failed with code ${c}",
                                                       ("c", e.code()) ) );
      for( const auto& log : e.get_log() ) {
         err.append_log( log );
      }
      err.error_code = exception_error_code( e );
      throw err;
   }
}

vector<pair<instance_id_type, digest_type>> dispatcher::state_hashes( const chainbase::database& snapshot )const {
   vector<pair<instance_id_type, digest_type>> result;
   for( const auto& r : _runtimes ) {
      auto hashes = r.second->state_hashes( snapshot );
      result.insert( result.end(), hashes.begin(), hashes.end() );
   }
   return result;
}

void dispatcher::before_commit( chainbase::database& fork ) {
   for( auto& r : _runtimes ) {
      r.second->before_commit( fork );
   }
}

void dispatcher::after_commit( const chainbase::database& snapshot ) {
   for( auto& r : _runtimes ) {
      try {
         r.second->after_commit( snapshot );
      } catch( const fc::exception& e ) {
         elog( "after_commit of runtime ${r} failed: ${e}", ("r", r.first)("e", e.to_detail_string()) );
      } catch( const std::exception& e ) {
         elog( "after_commit of runtime ${r} failed: ${e}", ("r", r.first)("e", e.what()) );
      }
   }
}

vector<pair<string, service_api_builder>> dispatcher::services_api()const {
   vector<pair<string, service_api_builder>> result;
   for( const auto& r : _runtimes ) {
      auto api = r.second->services_api();
      std::move( api.begin(), api.end(), std::back_inserter( result ) );
   }
   return result;
}


//
// dispatcher_builder
//
dispatcher_builder::dispatcher_builder( internal_request_queue requests )
:_native( make_unique<native_runtime>() )
,_dispatcher( make_unique<dispatcher>( move(requests) ) ) {}

dispatcher_builder& dispatcher_builder::with_builtin_service( builtin_service service ) {
   auto artifact = _native->add_builtin_service( move(service.factory), service.instance_id, service.instance_name );
   _dispatcher->_runtime_lookup[service.instance_id] = artifact.runtime_id;
   return *this;
}

dispatcher_builder& dispatcher_builder::with_service_factory( unique_ptr<service_factory> factory ) {
   _native->add_service_factory( move(factory) );
   return *this;
}

dispatcher_builder& dispatcher_builder::with_runtime( runtime_id_type id, unique_ptr<runtime> rt ) {
   FC_ASSERT( id != native_runtime::id, "runtime id ${id} is reserved for the native runtime", ("id", id) );
   _dispatcher->add_runtime( id, move(rt) );
   return *this;
}

unique_ptr<dispatcher> dispatcher_builder::finalize() {
   FC_ASSERT( _dispatcher, "dispatcher_builder::finalize called twice" );
   _dispatcher->add_runtime( native_runtime::id, move(_native) );
   return move(_dispatcher);
}

} } // stratum::runtime
