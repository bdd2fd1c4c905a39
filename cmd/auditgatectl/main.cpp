#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "auditgate/v1.hpp"
#include "auditgate/v1/audit_query_service.grpc.pb.h"
#include "auditgate/v1/gateway_service.grpc.pb.h"

using namespace auditgate::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  auditgatectl <addr> recent [limit]\n"
            << "  auditgatectl <addr> query [operation=<name>] [session=<id>] [client=<name>]\n"
            << "                            [since=<iso8601>] [until=<iso8601>] [errors_only=<bool>] [limit=<n>]\n"
            << "  auditgatectl <addr> summary\n"
            << "  auditgatectl <addr> ops\n"
            << "  auditgatectl <addr> invoke <operation> [json-arguments] [session=<id>] [client=<name>]\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;
  auto status                        = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

static bool SplitKeyValue(const std::string& arg, std::string* key, std::string* value) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }
  *key   = arg.substr(0, eq);
  *value = arg.substr(eq + 1);
  return true;
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }
  std::cout << ToJson(resp);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto query_stub   = AuditQueryService::NewStub(channel);
  auto gateway_stub = GatewayService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "recent") {
    RecentRequest req;
    if (argc >= 4) req.set_limit(argv[3]);

    EventsResponse resp;
    return Report(query_stub->Recent(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "query") {
    QueryRequest req;
    for (int i = 3; i < argc; ++i) {
      std::string key;
      std::string value;
      if (!SplitKeyValue(argv[i], &key, &value)) {
        std::cerr << "expected key=value, got '" << argv[i] << "'\n";
        return 1;
      }

      if (key == "operation") {
        req.set_operation_name(value);
      } else if (key == "session") {
        req.set_session_id(value);
      } else if (key == "client") {
        req.set_client_name(value);
      } else if (key == "since") {
        req.set_since(value);
      } else if (key == "until") {
        req.set_until(value);
      } else if (key == "errors_only") {
        req.set_errors_only(value);
      } else if (key == "limit") {
        req.set_limit(value);
      } else {
        std::cerr << "unknown filter: " << key << "\n";
        return 1;
      }
    }

    EventsResponse resp;
    return Report(query_stub->Query(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    SummaryRequest  req;
    SummaryResponse resp;
    return Report(query_stub->Summary(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "ops") {
    ListOperationsRequest  req;
    ListOperationsResponse resp;
    return Report(gateway_stub->ListOperations(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "invoke") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    InvokeRequest req;
    req.set_operation(argv[3]);
    req.mutable_caller()->set_client_name("auditgatectl");

    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      std::string       key;
      std::string       value;
      if (!arg.empty() && arg.front() == '{') {
        auto status = google::protobuf::util::JsonStringToMessage(arg, req.mutable_arguments());
        if (!status.ok()) {
          std::cerr << "invalid arguments: " << status.message() << "\n";
          return 1;
        }
        continue;
      }

      if (!SplitKeyValue(arg, &key, &value)) {
        std::cerr << "unexpected argument: " << arg << "\n";
        return 1;
      }
      if (key == "session") {
        req.mutable_caller()->set_session_id(value);
      } else if (key == "client") {
        req.mutable_caller()->set_client_name(value);
      } else {
        std::cerr << "unknown caller field: " << key << "\n";
        return 1;
      }
    }

    InvokeResponse resp;
    auto           status = gateway_stub->Invoke(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
      return 2;
    }
    std::cout << resp.result_json() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
