#include <tally/blockchain/time.hpp>

#include <fc/exception/exception.hpp>

#include <atomic>

namespace tally { namespace blockchain {

static std::atomic<bool>    simulated_time_enabled( false );
static std::atomic<int64_t> simulated_time( 0 );
static std::atomic<int64_t> adjusted_time_sec( 0 );

fc::time_point_sec now()
{
   if( simulated_time_enabled )
       return fc::time_point() + fc::seconds( simulated_time + adjusted_time_sec );

   return fc::time_point::now() + fc::seconds( adjusted_time_sec );
}

void start_simulated_time( const fc::time_point sim_time )
{
   simulated_time = sim_time.sec_since_epoch();
   adjusted_time_sec = 0;
   simulated_time_enabled = true;
}

void stop_simulated_time()
{
   simulated_time_enabled = false;
   simulated_time = 0;
   adjusted_time_sec = 0;
}

void advance_time( int32_t delta_seconds )
{
   adjusted_time_sec += delta_seconds;
}

} } // tally::blockchain
