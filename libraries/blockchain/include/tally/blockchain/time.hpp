#pragma once

#include <fc/time.hpp>
#include <string>

namespace tally { namespace blockchain {

   fc::time_point_sec           now();

   void                         start_simulated_time( const fc::time_point sim_time );
   void                         stop_simulated_time();
   void                         advance_time( int32_t delta_seconds );

} } // tally::blockchain
