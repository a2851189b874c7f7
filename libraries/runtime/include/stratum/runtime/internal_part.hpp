#pragma once

#include <stratum/runtime/internal_events.hpp>
#include <stratum/runtime/thread_utils.hpp>

#include <chrono>

namespace stratum { namespace runtime {

   /**
    * @brief Turns internal requests into internal events
    *
    * Message verification runs on the verification pool, timers and every other
    * event emission run on the event pool, so the request loop never waits for
    * either. Events may therefore arrive in a different order than the requests
    * that caused them.
    *
    * run() returns when a shutdown request has been forwarded, when the event
    * queue is closed, or when the request queue is closed and drained. Work that
    * is still in flight at that point may complete later; emitting into a closed
    * event queue is a no-op.
    */
   class internal_part {
      public:
         internal_part( internal_request_queue requests, internal_event_queue events,
                        named_thread_pool& verification_pool, named_thread_pool& event_pool );

         /// Blocking request loop, normally run on a dedicated thread
         void run();

         /// Interval at which an idle loop re-checks whether the event queue was closed
         std::chrono::milliseconds idle_poll_interval{100};

      private:
         /// @return false if the loop should stop
         bool handle( internal_request request );

         void verify( bytes raw );
         void arm_timeout( const timeout_request& request );
         void send_event( internal_event event );

         internal_request_queue   _requests;
         internal_event_queue     _events;
         named_thread_pool&       _verification_pool;
         named_thread_pool&       _event_pool;
   };

} } // stratum::runtime
