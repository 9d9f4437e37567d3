#ifndef _SENDME_SERVICE_PORTS_HPP_
#define _SENDME_SERVICE_PORTS_HPP_
namespace sm {
  enum service_ports {
    blob_service_port = 2
  };
}
#endif// _SENDME_SERVICE_PORTS_HPP_
