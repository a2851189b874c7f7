#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace stratum { namespace runtime {

   /**
    * Wrapper class for boost asio io_contexts each run on a named thread,
    * so that tools like htop can see thread name.
    */
   class named_thread_pool {
   public:
      // name_prefix is name appended with -## of thread.
      // short name_prefix (6 chars or under) is recommended as console_appender uses 9 chars for thread name
      named_thread_pool( std::string name_prefix, size_t num_threads, bool one_io_context = false );

      // calls stop()
      ~named_thread_pool();

      // round robin executor from pool
      boost::asio::io_context& get_executor();

      // post f to the next executor, returns false once the pool is stopped
      template<typename F>
      bool post( F&& f ) {
         if( _stopped.load() ) return false;
         boost::asio::post( get_executor(), std::forward<F>( f ) );
         return true;
      }

      size_t size()const { return _num_threads; }
      bool stopped()const { return _stopped.load(); }

      // destroy work guard, stop io_context, join threads
      // io_contexts are kept alive until destruction so late posts are dropped rather than dangling
      void stop();

   private:
      using ioc_work_t = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

      const size_t                                           _num_threads;
      std::vector<std::thread>                               _thread_pool;
      std::vector<std::unique_ptr<boost::asio::io_context>>  _iocs;
      std::optional<std::vector<ioc_work_t>>                 _ioc_works;
      std::atomic<size_t>                                    _next_ioc = 0;
      std::atomic<bool>                                      _stopped = false;
   };

} } // stratum::runtime
