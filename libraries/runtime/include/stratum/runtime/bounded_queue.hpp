#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace stratum { namespace runtime {

   /**
    * Multi producer / single consumer FIFO with a fixed capacity.
    *
    * Copies share the same underlying queue, so a copy can be handed to every
    * producer. push() blocks while the queue is full; try_push() never blocks and
    * reports whether the item was accepted. Once closed, pushes are rejected and
    * pop() drains what is left before reporting the end of the stream.
    */
   template<typename T>
   class bounded_queue {
      public:
         explicit bounded_queue( size_t max_size )
         :my( std::make_shared<queue_state>( max_size ) ) {}

         /// @return false if the queue was closed before the item could be queued
         bool push( T item ) {
            std::unique_lock<std::mutex> lock( my->mtx );
            my->not_full.wait( lock, [this]() { return my->closed || my->items.size() < my->max_size; } );
            if( my->closed ) return false;
            my->items.emplace_back( std::move( item ) );
            lock.unlock();
            my->not_empty.notify_one();
            return true;
         }

         /// @return false if the queue is full or closed
         bool try_push( T item ) {
            std::unique_lock<std::mutex> lock( my->mtx );
            if( my->closed || my->items.size() >= my->max_size ) return false;
            my->items.emplace_back( std::move( item ) );
            lock.unlock();
            my->not_empty.notify_one();
            return true;
         }

         /// Blocks until an item is available, empty optional once closed and drained
         std::optional<T> pop() {
            std::unique_lock<std::mutex> lock( my->mtx );
            my->not_empty.wait( lock, [this]() { return my->closed || !my->items.empty(); } );
            return take( lock );
         }

         template<typename Rep, typename Period>
         std::optional<T> pop_for( const std::chrono::duration<Rep, Period>& timeout ) {
            std::unique_lock<std::mutex> lock( my->mtx );
            my->not_empty.wait_for( lock, timeout, [this]() { return my->closed || !my->items.empty(); } );
            return take( lock );
         }

         std::optional<T> try_pop() {
            std::unique_lock<std::mutex> lock( my->mtx );
            return take( lock );
         }

         /// Wakes every waiting producer and consumer; items already queued can still be popped
         void close() {
            {
               std::lock_guard<std::mutex> g( my->mtx );
               my->closed = true;
            }
            my->not_empty.notify_all();
            my->not_full.notify_all();
         }

         bool is_closed()const {
            std::lock_guard<std::mutex> g( my->mtx );
            return my->closed;
         }

         size_t size()const {
            std::lock_guard<std::mutex> g( my->mtx );
            return my->items.size();
         }

         size_t capacity()const { return my->max_size; }

      private:
         struct queue_state {
            explicit queue_state( size_t s ) : max_size(s) {}

            mutable std::mutex        mtx;
            std::condition_variable   not_empty;
            std::condition_variable   not_full;
            std::deque<T>             items;
            const size_t              max_size;
            bool                      closed = false;
         };

         std::optional<T> take( std::unique_lock<std::mutex>& lock ) {
            if( my->items.empty() ) return {};
            std::optional<T> result( std::move( my->items.front() ) );
            my->items.pop_front();
            lock.unlock();
            my->not_full.notify_one();
            return result;
         }

         std::shared_ptr<queue_state> my;
   };

} } // stratum::runtime
