#include <sendme/context.hpp>
#include <sendme/send_session.hpp>
#include <sendme/receive_session.hpp>
#include <sendme/node.hpp>
#include <sendme/events.hpp>
#include <sendme/error.hpp>
#include <fc/thread.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <boost/program_options.hpp>
#include <boost/thread/thread.hpp>
#include <boost/bind.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace {

  /// prints events until the channel is closed
  void print_events( sm::event_channel* events ) {
    sm::event e;
    while( !events->is_closed() || events->size() ) {
      if( events->next( e, fc::milliseconds(250) ) )
        std::cout << e.to_string().c_str() << std::endl;
    }
  }

  void wait_for_eof() {
    std::string line;
    while( std::getline( std::cin, line ) ) {}
  }

  int send_files( const sm::config& cfg, const std::vector<std::string>& paths ) {
    if( paths.empty() ) {
      std::cerr << "usage: sendme send PATH...\n";
      return 2;
    }
    sm::context ctx( cfg );
    boost::thread printer( boost::bind( print_events, &ctx.events() ) );

    sm::send_session s( ctx );
    for( size_t i = 0; i < paths.size(); ++i )
      s.add( fc::path( paths[i].c_str() ) );
    sm::ticket t = s.start();

    std::cout << "sharing " << s.get_manifest().entries.size() << " files, "
              << s.get_manifest().total_size() << " bytes\n"
              << "to receive run:\n\n  sendme receive " << t.encode().c_str() << "\n\n"
              << "close stdin (ctrl-d) to stop sharing" << std::endl;
    wait_for_eof();

    s.stop();
    ctx.shutdown();
    printer.join();
    return 0;
  }

  int receive_files( const sm::config& cfg, const std::vector<std::string>& args, const std::string& out ) {
    if( args.size() != 1 ) {
      std::cerr << "usage: sendme receive TICKET [-o DIR]\n";
      return 2;
    }
    sm::context ctx( cfg );
    boost::thread printer( boost::bind( print_events, &ctx.events() ) );

    int rtn = 1;
    try {
      sm::receive_session r( ctx );
      std::vector<sm::transfer> ts = r.run( args[0].c_str(), fc::path( out.c_str() ) );
      rtn = 0;
      for( size_t i = 0; i < ts.size(); ++i )
        if( ts[i].state != sm::transfer::verified ) rtn = 1;
    } catch ( const sm::sendme_exception& ) {
      ctx.shutdown();
      printer.join();
      throw;
    }
    ctx.shutdown();
    printer.join();
    return rtn;
  }

  int run_relay( const sm::config& cfg ) {
    sm::context ctx( cfg );
    ctx.start();
    ctx.get_node().enable_relay( true );
    std::cout << "relay " << fc::string( ctx.get_node().get_id() ).c_str()
              << " listening on " << fc::string( ctx.get_node().local_endpoint() ).c_str() << "\n"
              << "close stdin (ctrl-d) to stop" << std::endl;
    wait_for_eof();
    ctx.shutdown();
    return 0;
  }

}

int main( int argc, char** argv ) {
  try {
    fc::thread::current().set_name("main");

    std::string              command;
    std::string              config_file;
    std::string              data_dir;
    std::string              output;
    uint16_t                 port = 0;
    std::vector<std::string> relays;
    std::vector<std::string> args;

    namespace po = boost::program_options;
    po::options_description desc("Allowed options");
    desc.add_options()
      ("help,h", "print this help message." )
      ("config,c", po::value<std::string>(&config_file), "JSON configuration file" )
      ("port,p", po::value<uint16_t>(&port), "UDP port to listen on, 0 picks a free one" )
      ("data-dir,d", po::value<std::string>(&data_dir), "Directory for the node identity and resume state" )
      ("relay,r", po::value<std::vector<std::string> >(&relays), "HOST:PORT of a relay node" )
      ("output,o", po::value<std::string>(&output)->default_value("."), "Directory received files are written to" )
    ;
    po::options_description hidden;
    hidden.add_options()
      ("command", po::value<std::string>(&command) )
      ("args", po::value<std::vector<std::string> >(&args) )
    ;
    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description pos;
    pos.add( "command", 1 ).add( "args", -1 );

    po::variables_map vm;
    po::store( po::command_line_parser(argc,argv).options(all).positional(pos).run(), vm );
    po::notify(vm);

    if( vm.count("help") || command.empty() ) {
      std::cout << "usage:\n"
                << "  sendme send PATH...\n"
                << "  sendme receive TICKET [-o DIR]\n"
                << "  sendme relay\n\n"
                << desc << std::endl;
      return command.empty() && !vm.count("help") ? 2 : 0;
    }

    sm::config cfg;
    if( config_file.size() ) cfg = sm::config::load( fc::path( config_file.c_str() ) );
    if( vm.count("port") )     cfg.port     = port;
    if( vm.count("data-dir") ) cfg.data_dir = data_dir.c_str();
    for( size_t i = 0; i < relays.size(); ++i )
      cfg.relays.push_back( relays[i].c_str() );

    if( command == "send" )    return send_files( cfg, args );
    if( command == "receive" ) return receive_files( cfg, args, output );
    if( command == "relay" )   return run_relay( cfg );

    std::cerr << "unknown command '" << command << "'\n";
    return 2;
  } catch ( const sm::sendme_exception& e ) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  } catch ( const boost::exception& e ) {
    std::cerr << boost::diagnostic_information(e) << std::endl;
  } catch ( const std::exception& e ) {
    std::cerr << e.what() << std::endl;
  } catch ( ... ) {
    std::cerr << fc::except_str().c_str() << std::endl;
  }
  return 1;
}
