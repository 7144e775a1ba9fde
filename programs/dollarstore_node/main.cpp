/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <dollarstore/app/ledger_api.hpp>
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>
#include <dollarstore/chain/genesis_state.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/stacktrace.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <sstream>

namespace bpo = boost::program_options;

namespace dollarstore { namespace node {

   /// One entry of a script: either move ledger time forward or push a transaction
   struct script_step
   {
      fc::optional<uint32_t>                         advance_seconds;
      fc::optional<dollarstore::protocol::transaction> transaction;
   };

} } // dollarstore::node

FC_REFLECT( dollarstore::node::script_step, (advance_seconds)(transaction) )

using namespace dollarstore;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Log messages to console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

/// Prints the events of every committed transaction
void log_events( const protocol::processed_transaction& trx, const std::vector<chain::operation_history_object>& applied )
{
   for( const auto& oh : applied )
   {
      if( !protocol::is_virtual_operation( oh.op ) )
         continue;
      ilog( "trx ${n} event: ${e}", ("n",oh.trx_num)("e",oh.op) );
   }
}

void print_state( const app::ledger_api& api )
{
   std::stringstream ss;
   ss << "reserves: " << fc::json::to_pretty_string( fc::variant( api.get_reserves(), DOLLARSTORE_MAX_NESTED_OBJECTS ) ) << "\n";
   ss << "synthetic supply: " << api.get_synthetic_supply().value << "\n";
   ss << "emission: " << fc::json::to_pretty_string( fc::variant( api.get_emission_stats(), DOLLARSTORE_MAX_NESTED_OBJECTS ) );
   my_log( ss.str() );
}

/// The main program
int main(int argc, char** argv) {
   fc::print_stacktrace_on_segfault();
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("DollarStore Ledger Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json", bpo::value<boost::filesystem::path>(),
                    "File to read genesis state from; the built-in basket is used if omitted")
            ("script", bpo::value<boost::filesystem::path>(),
                    "JSON array of steps, each either {\"advance_seconds\":N} or {\"transaction\":{...}}")
            ("stop-on-error", "Exit with an error when a transaction of the script is rejected");

      bpo::variables_map options;
      try
      {
         bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      }
      catch (const boost::program_options::error& e)
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }
      bpo::notify(options);

      chain::genesis_state_type genesis;
      if( options.count("genesis-json") > 0 )
      {
         const auto genesis_path = options.at("genesis-json").as<boost::filesystem::path>();
         ilog( "Reading genesis state from ${p}", ("p",genesis_path.string()) );
         genesis = fc::json::from_file( genesis_path.string() )
                      .as<chain::genesis_state_type>( DOLLARSTORE_MAX_NESTED_OBJECTS );
      }
      else
         genesis = chain::create_default_genesis();

      chain::database db;
      db.init_genesis( genesis );
      app::ledger_api api( db );

      auto events_connection = db.applied_transaction.connect( &log_events );

      uint32_t rejected = 0;
      if( options.count("script") > 0 )
      {
         const auto script_path = options.at("script").as<boost::filesystem::path>();
         const auto steps = fc::json::from_file( script_path.string() )
                               .as<std::vector<node::script_step>>( DOLLARSTORE_MAX_NESTED_OBJECTS );
         ilog( "Applying ${n} script steps from ${p}", ("n",steps.size())("p",script_path.string()) );

         for( const auto& step : steps )
         {
            if( step.advance_seconds.valid() )
               db.advance_time( db.head_time() + *step.advance_seconds );
            if( !step.transaction.valid() )
               continue;
            try
            {
               db.push_transaction( *step.transaction );
            }
            catch( const fc::exception& e )
            {
               ++rejected;
               wlog( "Transaction rejected: ${e}", ("e",e.to_string()) );
               if( options.count("stop-on-error") > 0 )
                  throw;
            }
         }
      }
      events_connection.disconnect();

      ilog( "Ledger at ${t}, ${r} transactions rejected", ("t",db.head_time())("r",rejected) );
      print_state( api );
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if (unhandled_exception)
   {
      elog("Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()));
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
