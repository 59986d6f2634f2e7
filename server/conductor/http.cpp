
#include <exception>
#include <optional>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <spdlog/spdlog.h>

#include "conductor.hpp"
#include "db.hpp"
#include "http.hpp"

namespace livemig::conductor {

  namespace {

    bool parse_body(const std::string & body, rapidjson::Document & document)
    {
      if(body.empty()) {
        document.SetObject();
        return true;
      }
      document.Parse(body.c_str());
      return !document.HasParseError() && document.IsObject();
    }

    std::string error_body(const std::string & kind, const std::string & message)
    {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
      writer.StartObject();
      writer.Key("kind");
      writer.String(kind.c_str());
      writer.Key("message");
      writer.String(message.c_str());
      writer.EndObject();
      return buffer.GetString();
    }

    std::string outcome_body(const Outcome & outcome)
    {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
      writer.StartObject();
      writer.Key("instance");
      writer.String(outcome.instance.c_str());
      writer.Key("source");
      writer.String(outcome.source.c_str());
      writer.Key("destination");
      writer.String(outcome.destination.c_str());
      writer.EndObject();
      return buffer.GetString();
    }

    // Optional boolean member; false when present with a wrong type.
    bool read_flag(const rapidjson::Document & document, const char* name, bool & value)
    {
      if(!document.HasMember(name))
        return true;
      if(!document[name].IsBool())
        return false;
      value = document[name].GetBool();
      return true;
    }

  }

  HTTPHandler::HTTPHandler(ClusterDB & db, Conductor & conductor):
    _database(db),
    _conductor(conductor)
  {}

  Pistache::Http::Code HTTPHandler::status_code(livemig::ErrorKind kind)
  {
    switch(kind) {
      case livemig::ErrorKind::INSTANCE_NOT_RUNNING:
        return Pistache::Http::Code::Conflict;
      case livemig::ErrorKind::DISPATCH_FAILED:
        return Pistache::Http::Code::Internal_Server_Error;
      default:
        return Pistache::Http::Code::Bad_Request;
    }
  }

  void HTTPHandler::onRequest(
    const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response
  ) {
    HTTPReply reply;
    try {
      reply = handle(req.method(), req.resource(), req.query(), req.body());
    } catch(const std::exception & e) {
      spdlog::error("[HTTPServer] Request {} failed: {}", req.resource(), e.what());
      reply = HTTPReply{
        Pistache::Http::Code::Internal_Server_Error, error_body("InternalError", e.what()), true
      };
    }

    if(reply.json)
      response.send(reply.code, reply.body, MIME(Application, Json));
    else
      response.send(reply.code, reply.body);
  }

  HTTPReply HTTPHandler::handle(Pistache::Http::Method method, const std::string& resource,
      const Pistache::Http::Uri::Query& query, const std::string& body)
  {
    if(method != Pistache::Http::Method::Post) {
      return HTTPReply{Pistache::Http::Code::Method_Not_Allowed, "Only POST is supported", false};
    }

    if(resource == "/migrate") {
      auto instance = query.get("instance");
      if(!instance.has_value()) {
        return HTTPReply{Pistache::Http::Code::Bad_Request, "Malformed Parameters", false};
      }
      return _migrate(instance.value(), body);
    }

    if(resource != "/add" && resource != "/remove" && resource != "/update") {
      return HTTPReply{Pistache::Http::Code::Not_Found, "Operation not supported", false};
    }

    auto node_name = query.get("node");
    if(!node_name.has_value()) {
      return HTTPReply{Pistache::Http::Code::Bad_Request, "Malformed Parameters", false};
    }

    if(resource == "/add") {
      return _add(node_name.value(), body);
    } else if(resource == "/update") {
      return _update(node_name.value(), body);
    }

    if(_database.remove_host(node_name.value()) == ClusterDB::ResultCode::OK) {
      return HTTPReply{Pistache::Http::Code::Ok, "Success", false};
    }
    return HTTPReply{Pistache::Http::Code::Not_Found, "Unknown host", false};
  }

  HTTPReply HTTPHandler::_migrate(const std::string& instance, const std::string& body)
  {
    const HTTPReply malformed{Pistache::Http::Code::Bad_Request, "Malformed Input", false};

    rapidjson::Document document;
    if(!parse_body(body, document)) {
      return malformed;
    }

    std::optional<std::string> destination;
    if(document.HasMember("host") && !document["host"].IsNull()) {
      if(!document["host"].IsString()) {
        return malformed;
      }
      std::string host{document["host"].GetString()};
      if(!host.empty())
        destination = host;
    }

    bool block_migration = false;
    bool disk_over_commit = false;
    if(!read_flag(document, "block_migration", block_migration) ||
        !read_flag(document, "disk_over_commit", disk_over_commit)) {
      return malformed;
    }

    livemig::MigrationRequest request{instance, destination, block_migration, disk_over_commit};
    auto outcome = _conductor.migrate(request);

    if(!outcome) {
      return HTTPReply{
        Pistache::Http::Code::Not_Found,
        error_body("InstanceNotFound", "Instance " + instance + " could not be found"), true
      };
    } else if(!outcome->succeeded()) {
      const livemig::Failure & failure = *outcome->failure;
      return HTTPReply{
        status_code(failure.kind),
        error_body(livemig::error_kind_name(failure.kind), failure.describe()), true
      };
    }
    return HTTPReply{Pistache::Http::Code::Accepted, outcome_body(*outcome), true};
  }

  HTTPReply HTTPHandler::_add(const std::string& node, const std::string& body)
  {
    const HTTPReply malformed{Pistache::Http::Code::Bad_Request, "Malformed Input", false};

    rapidjson::Document document;
    if(
        !parse_body(body, document) ||
        !(document.HasMember("memory_mb")           && document["memory_mb"].IsInt64()) ||
        !(document.HasMember("hypervisor_type")     && document["hypervisor_type"].IsString()) ||
        !(document.HasMember("hypervisor_version")  && document["hypervisor_version"].IsInt64()) ||
        !(document.HasMember("aggregates")          && document["aggregates"].IsArray())
    ) {
      return malformed;
    }

    HostRecord record;
    record.facts.host = node;
    record.facts.up = true;
    record.facts.memory_mb = document["memory_mb"].GetInt64();
    record.facts.hypervisor_type = document["hypervisor_type"].GetString();
    record.facts.hypervisor_version = document["hypervisor_version"].GetInt64();

    if(document.HasMember("memory_mb_used")) {
      if(!document["memory_mb_used"].IsInt64()) {
        return malformed;
      }
      record.facts.memory_mb_used = document["memory_mb_used"].GetInt64();
    }

    for(const auto & agg : document["aggregates"].GetArray()) {
      if(
          !agg.IsObject() ||
          !(agg.HasMember("name")                 && agg["name"].IsString()) ||
          !(agg.HasMember("ram_allocation_ratio") && agg["ram_allocation_ratio"].IsNumber())
      ) {
        return malformed;
      }
      record.facts.aggregates.emplace_back(agg["name"].GetString(), agg["ram_allocation_ratio"].GetDouble());
    }

    if(document.HasMember("storage_pool") && document["storage_pool"].IsString()) {
      record.storage_pool = document["storage_pool"].GetString();
    }
    if(document.HasMember("free_disk_gb") && document["free_disk_gb"].IsInt64()) {
      record.free_disk_gb = document["free_disk_gb"].GetInt64();
    }

    auto code = _database.add_host(record);
    if(code == ClusterDB::ResultCode::OK) {
      return HTTPReply{Pistache::Http::Code::Ok, "Success", false};
    } else if(code == ClusterDB::ResultCode::HOST_EXISTS) {
      return HTTPReply{Pistache::Http::Code::Conflict, "Host exists", false};
    }
    return malformed;
  }

  HTTPReply HTTPHandler::_update(const std::string& node, const std::string& body)
  {
    const HTTPReply malformed{Pistache::Http::Code::Bad_Request, "Malformed Input", false};

    rapidjson::Document document;
    if(!parse_body(body, document)) {
      return malformed;
    }

    std::optional<bool> up;
    std::optional<int64_t> memory_mb_used;
    if(document.HasMember("up")) {
      if(!document["up"].IsBool()) {
        return malformed;
      }
      up = document["up"].GetBool();
    }
    if(document.HasMember("memory_mb_used")) {
      if(!document["memory_mb_used"].IsInt64()) {
        return malformed;
      }
      memory_mb_used = document["memory_mb_used"].GetInt64();
    }
    if(!up && !memory_mb_used) {
      return HTTPReply{Pistache::Http::Code::Bad_Request, "Nothing to update", false};
    }

    auto code = _database.update_host(node, up, memory_mb_used);
    if(code == ClusterDB::ResultCode::OK) {
      return HTTPReply{Pistache::Http::Code::Ok, "Success", false};
    } else if(code == ClusterDB::ResultCode::HOST_DOESNT_EXIST) {
      return HTTPReply{Pistache::Http::Code::Not_Found, "Unknown host", false};
    }
    return malformed;
  }

  HTTPServer::HTTPServer(ClusterDB & db, Conductor & conductor, Settings & settings):
    _server(Pistache::Address{settings.http_network_address, Pistache::Port{settings.http_network_port}})
  {
    spdlog::info(
      "[HTTPServer] Initialize on address {} and port {}",
      settings.http_network_address, settings.http_network_port
    );
    auto opts = Pistache::Http::Endpoint::options().threads(settings.http_threads);
    _server.init(opts);
    _server.setHandler(Pistache::Http::make_handler<HTTPHandler>(db, conductor));
  }

  void HTTPServer::start()
  {
    spdlog::info("[HTTPServer] Begin listening");
    _server.serveThreaded();
  }

  void HTTPServer::stop()
  {
    spdlog::info("[HTTPServer] Background thread stops waiting for HTTP requests");
    _server.shutdown();
  }

}
