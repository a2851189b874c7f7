#include <stratum/runtime/bounded_queue.hpp>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>

BOOST_TEST_DONT_PRINT_LOG_VALUE( std::chrono::milliseconds )
BOOST_TEST_DONT_PRINT_LOG_VALUE( std::chrono::steady_clock::duration )
BOOST_TEST_DONT_PRINT_LOG_VALUE( std::chrono::steady_clock::time_point )

using namespace stratum::runtime;
using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(bounded_queue_tests)

BOOST_AUTO_TEST_CASE(fifo_order) {
   bounded_queue<int> q( 8 );
   for( int i = 0; i < 5; ++i )
      BOOST_REQUIRE( q.push( i ) );
   BOOST_TEST( q.size() == 5u );
   for( int i = 0; i < 5; ++i ) {
      auto v = q.try_pop();
      BOOST_REQUIRE( v.has_value() );
      BOOST_TEST( *v == i );
   }
   BOOST_TEST( !q.try_pop().has_value() );
}

BOOST_AUTO_TEST_CASE(try_push_respects_capacity) {
   bounded_queue<int> q( 2 );
   BOOST_TEST( q.capacity() == 2u );
   BOOST_TEST( q.try_push( 1 ) );
   BOOST_TEST( q.try_push( 2 ) );
   BOOST_TEST( !q.try_push( 3 ) );
   BOOST_TEST( *q.pop() == 1 );
   BOOST_TEST( q.try_push( 3 ) );
}

BOOST_AUTO_TEST_CASE(push_blocks_while_full) {
   bounded_queue<int> q( 1 );
   BOOST_REQUIRE( q.push( 1 ) );

   std::atomic<bool> pushed = false;
   std::thread producer( [q, &pushed]() mutable {
      pushed = q.push( 2 );
   });

   std::this_thread::sleep_for( 50ms );
   BOOST_TEST( !pushed.load() );

   BOOST_TEST( *q.pop() == 1 );
   producer.join();
   BOOST_TEST( pushed.load() );
   BOOST_TEST( *q.pop() == 2 );
}

BOOST_AUTO_TEST_CASE(close_wakes_everyone) {
   bounded_queue<int> q( 1 );

   std::atomic<bool> got_item = true;
   std::thread consumer( [q, &got_item]() mutable {
      got_item = q.pop().has_value();
   });
   std::this_thread::sleep_for( 20ms );
   q.close();
   consumer.join();
   BOOST_TEST( !got_item.load() );

   BOOST_TEST( q.is_closed() );
   BOOST_TEST( !q.push( 1 ) );
   BOOST_TEST( !q.try_push( 1 ) );
}

BOOST_AUTO_TEST_CASE(close_unblocks_producer) {
   bounded_queue<int> q( 1 );
   BOOST_REQUIRE( q.push( 1 ) );

   std::atomic<bool> accepted = true;
   std::thread producer( [q, &accepted]() mutable {
      accepted = q.push( 2 );
   });
   std::this_thread::sleep_for( 20ms );
   q.close();
   producer.join();
   BOOST_TEST( !accepted.load() );
   BOOST_TEST( q.size() == 1u );
}

BOOST_AUTO_TEST_CASE(closed_queue_drains) {
   bounded_queue<int> q( 4 );
   q.push( 1 );
   q.push( 2 );
   q.close();

   BOOST_TEST( *q.pop() == 1 );
   BOOST_TEST( *q.pop_for( 10ms ) == 2 );
   BOOST_TEST( !q.pop().has_value() );
}

BOOST_AUTO_TEST_CASE(pop_for_times_out) {
   bounded_queue<int> q( 4 );
   auto start = std::chrono::steady_clock::now();
   BOOST_TEST( !q.pop_for( 20ms ).has_value() );
   BOOST_TEST( std::chrono::steady_clock::now() - start >= 20ms );
}

BOOST_AUTO_TEST_CASE(copies_share_the_queue) {
   bounded_queue<std::string> q( 4 );
   auto producer = q;
   producer.push( "shared" );
   BOOST_TEST( q.size() == 1u );
   BOOST_TEST( *q.pop() == "shared" );

   q.close();
   BOOST_TEST( producer.is_closed() );
}

BOOST_AUTO_TEST_SUITE_END()
