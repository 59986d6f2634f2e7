
#ifndef __LIVEMIG_CONDUCTOR_HTTP_HPP__
#define __LIVEMIG_CONDUCTOR_HTTP_HPP__

#include <string>

#include <pistache/http.h>
#include <pistache/endpoint.h>

#include <livemig/errors.hpp>

#include "settings.hpp"

namespace livemig::conductor {

  struct ClusterDB;
  struct Conductor;

  struct HTTPReply
  {
    Pistache::Http::Code code;
    std::string body;
    bool json;
  };

  struct HTTPHandler : public Pistache::Http::Handler
  {
    ClusterDB & _database;
    Conductor & _conductor;

    HTTPHandler(ClusterDB &, Conductor &);

    HTTP_PROTOTYPE(HTTPHandler)
    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) override;

    // Routes a request without touching the connection.
    HTTPReply handle(Pistache::Http::Method method, const std::string& resource,
        const Pistache::Http::Uri::Query& query, const std::string& body);

    static Pistache::Http::Code status_code(livemig::ErrorKind kind);

  private:
    HTTPReply _migrate(const std::string& instance, const std::string& body);
    HTTPReply _add(const std::string& node, const std::string& body);
    HTTPReply _update(const std::string& node, const std::string& body);
  };

  struct HTTPServer
  {
    Pistache::Http::Endpoint _server;

    HTTPServer(ClusterDB &, Conductor &, Settings &);

    void start();
    void stop();
  };

}

#endif
