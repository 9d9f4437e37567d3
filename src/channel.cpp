#include <sendme/channel.hpp>
#include <sendme/connection.hpp>
#include <sendme/error.hpp>
#include <fc/log.hpp>
#include <fc/mutex.hpp>
#include <fc/unique_lock.hpp>

namespace sm {

  class channel::impl : public fc::retainable {
    public:
       impl( connection* c )
       :con(c,true),closed(false),rport(0),lport(0){}

       channel::recv_handler rc;
       connection::ptr       con;
       bool                  closed;
       uint16_t              rport;
       uint16_t              lport;
       fc::mutex             mtx;
  };

  channel::channel( connection* con, uint16_t r, uint16_t l )
  :my(new impl(con)) {
    my->rport = r;
    my->lport = l;
  }

  channel::channel( const channel& c )
  :my(c.my){}

  channel::channel() {}
  channel::~channel() {}

  channel& channel::operator=( const channel& c ) {
    my = c.my;
    return *this;
  }

  node& channel::get_node()const {
    if( !my || !my->con ) SENDME_THROW( sendme_exception, "channel is closed" );
    return my->con->get_node();
  }

  void channel::close() {
    if( my ) {
      fc::shared_ptr<impl> keep(my);
      if( keep->con ) keep->con->close_channel(*this);
      {
        fc::unique_lock<fc::mutex> lock( keep->mtx );
        keep->rc = channel::recv_handler();
      }
      keep->closed = true;
      keep->con.reset();
      my.reset();
    }
  }

  void channel::reset() {
    if( my ) my->con.reset();
  }

  channel::node_id channel::remote_node()const {
    if( !my || !my->con ) SENDME_THROW( sendme_exception, "channel is closed" );
    return my->con->get_remote_id();
  }

  uint16_t channel::local_channel_num()const  { return my ? my->lport : 0; }
  uint16_t channel::remote_channel_num()const { return my ? my->rport : 0; }

  void channel::on_recv( const recv_handler& rc ) {
    if( !my ) SENDME_THROW( sendme_exception, "channel is closed" );
    fc::unique_lock<fc::mutex> lock( my->mtx );
    my->rc = rc;
  }

  void channel::recv( const sm::buffer& b, channel::error_code ec ) {
    fc::shared_ptr<impl> keep(my);
    if( !keep ) return;
    // the handler may close this channel, call a copy outside the lock
    recv_handler h;
    {
      fc::unique_lock<fc::mutex> lock( keep->mtx );
      h = keep->rc;
    }
    if( h ) h( b, ec );
  }

  void channel::send( const sm::buffer& b ) {
    if( !my || !my->con )
      SENDME_THROW( sendme_exception, "send on a closed channel" );
    my->con->send( *this, b );
  }

  channel::operator bool()const {
    return !!my && !my->closed && !!my->con;
  }

  bool channel::operator==( const channel& c )const {
    return my == c.my;
  }

} // namespace sm
