#include <stratum/runtime/internal_part.hpp>

#include <fc/log/logger.hpp>

#include <boost/asio/steady_timer.hpp>

namespace stratum { namespace runtime {

namespace {

   void deliver( internal_event_queue& events, internal_event event ) {
      if( !events.push( move(event) ) ) {
         dlog( "internal event dropped, event queue is closed" );
      }
   }

}

internal_part::internal_part( internal_request_queue requests, internal_event_queue events,
                              named_thread_pool& verification_pool, named_thread_pool& event_pool )
:_requests( move(requests) )
,_events( move(events) )
,_verification_pool( verification_pool )
,_event_pool( event_pool ) {}

void internal_part::run() {
   ilog( "internal part started" );
   while( true ) {
      if( _events.is_closed() ) {
         wlog( "internal event queue closed, stopping internal part with ${n} pending requests",
               ("n", _requests.size()) );
         return;
      }

      auto request = _requests.pop_for( idle_poll_interval );
      if( !request ) {
         if( _requests.is_closed() && _requests.size() == 0 ) {
            ilog( "internal request queue closed, stopping internal part" );
            return;
         }
         continue;
      }

      if( _events.is_closed() ) continue;

      if( !handle( move(*request) ) ) {
         ilog( "internal part stopped" );
         return;
      }
   }
}

bool internal_part::handle( internal_request request ) {
   return std::visit( overloaded {
      [&]( verify_message_request& r ) {
         verify( move(r.raw) );
         return true;
      },
      [&]( timeout_request& r ) {
         arm_timeout( r );
         return true;
      },
      [&]( jump_to_round& r ) {
         send_event( r );
         return true;
      },
      [&]( restart_api_signal& r ) {
         send_event( r );
         return true;
      },
      [&]( shutdown_signal& r ) {
         send_event( r );
         return false;
      }
   }, request );
}

void internal_part::verify( bytes raw ) {
   bool posted = _verification_pool.post( [events = _events, raw = move(raw)]() mutable {
      auto msg = verify_message( raw );
      if( msg ) {
         deliver( events, message_verified_event{ move(*msg) } );
      }
   });
   if( !posted ) {
      elog( "unable to schedule message verification, verification pool is stopped" );
   }
}

void internal_part::arm_timeout( const timeout_request& request ) {
   auto delay = request.deadline - time_point::now();
   if( delay < microseconds( 0 ) )
      delay = microseconds( 0 );

   dlog( "arming timeout in ${d}us", ("d", delay.count()) );

   auto& ioc = _event_pool.get_executor();
   bool posted = _event_pool.post( [events = _events, token = request.token, delay, &ioc]() mutable {
      auto timer = std::make_shared<boost::asio::steady_timer>( ioc );
      timer->expires_after( std::chrono::microseconds( delay.count() ) );
      timer->async_wait( [timer, events, token]( const boost::system::error_code& ec ) mutable {
         if( ec ) {
            if( ec != boost::asio::error::operation_aborted )
               elog( "timeout timer failed: ${m}", ("m", ec.message()) );
            return;
         }
         deliver( events, timeout_event{ token } );
      });
   });
   if( !posted ) {
      elog( "unable to schedule timeout, event pool is stopped" );
   }
}

void internal_part::send_event( internal_event event ) {
   bool posted = _event_pool.post( [events = _events, event = move(event)]() mutable {
      deliver( events, move(event) );
   });
   if( !posted ) {
      elog( "unable to schedule internal event, event pool is stopped" );
   }
}

} } // stratum::runtime
