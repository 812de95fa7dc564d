#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/telemetry_client.h"
#include "internal/model/telemetry_enums.hpp"
#include "internal/util/time.hpp"
#include "telemetry/gate/v1.hpp"

using namespace telemetry::gate::v1;
using telemetry::gate::client::TelemetryClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  telemetryctl <addr> upsert-account <owner_id> [email]\n"
            << "  telemetryctl <addr> register <serial> <owner_id> [name]\n"
            << "  telemetryctl <addr> rename <serial> <name>\n"
            << "  telemetryctl <addr> device <serial>\n"
            << "  telemetryctl <addr> rotate <serial>\n"
            << "  telemetryctl <addr> revoke <serial>\n"
            << "  telemetryctl <addr> credentials <serial>\n"
            << "  telemetryctl <addr> alerts <serial>\n"
            << "  telemetryctl <addr> set-alerts <serial> <high_c|off> <low_c|off> <cooldown_min> [recipient]\n"
            << "  telemetryctl <addr> profile <owner_id>\n"
            << "  telemetryctl <addr> set-plan <owner_id> <free|standard|premium>\n"
            << "  telemetryctl <addr> recompute [owner_id]\n"
            << "  telemetryctl <addr> ingest <serial> <secret> <json>\n"
            << "  telemetryctl <addr> recent <serial> [count]\n"
            << "  telemetryctl <addr> range <serial> <start> <end> [limit]\n"
            << "  telemetryctl <addr> export <serial> <start> <end> <file.arrow>\n"
            << "Times are RFC 3339 (2024-05-01T12:00:00Z).\n";
}

static telemetry::util::TimePoint ParseTimeOrExit(const std::string& value) {
  auto parsed = telemetry::util::ParseRfc3339(value);
  if (!parsed) {
    std::cerr << "invalid time: " << value << "\n";
    std::exit(1);
  }
  return *parsed;
}

// Prints the response as JSON, or the error; returns the process exit code.
template <typename T>
static int Print(const arrow::Result<T>& result) {
  if (!result.ok()) {
    std::cerr << result.status().ToString() << "\n";
    return 2;
  }

  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  auto status = google::protobuf::util::MessageToJsonString(*result, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << std::string(status.message()) << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  TelemetryClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "upsert-account") {
    if (argc < 4) return 1;
    UpsertAccountRequest req;
    req.mutable_account()->set_id(argv[3]);
    if (argc >= 5) req.mutable_account()->set_email(argv[4]);
    return Print(client.UpsertAccount(req));
  }

  if (cmd == "register") {
    if (argc < 5) return 1;
    RegisterDeviceRequest req;
    req.set_serial(argv[3]);
    req.set_owner_id(argv[4]);
    if (argc >= 6) req.set_name(argv[5]);
    return Print(client.RegisterDevice(req));
  }

  if (cmd == "rename") {
    if (argc < 5) return 1;
    RenameDeviceRequest req;
    req.set_serial(argv[3]);
    req.set_name(argv[4]);
    return Print(client.RenameDevice(req));
  }

  if (cmd == "device") {
    if (argc < 4) return 1;
    GetDeviceRequest req;
    req.set_serial(argv[3]);
    return Print(client.GetDevice(req));
  }

  if (cmd == "rotate") {
    if (argc < 4) return 1;
    RotateCredentialRequest req;
    req.set_serial(argv[3]);
    return Print(client.RotateCredential(req));
  }

  if (cmd == "revoke") {
    if (argc < 4) return 1;
    RevokeCredentialRequest req;
    req.set_serial(argv[3]);
    return Print(client.RevokeCredential(req));
  }

  if (cmd == "credentials") {
    if (argc < 4) return 1;
    ListCredentialsRequest req;
    req.set_serial(argv[3]);
    return Print(client.ListCredentials(req));
  }

  if (cmd == "alerts") {
    if (argc < 4) return 1;
    GetAlertSettingsRequest req;
    req.set_serial(argv[3]);
    return Print(client.GetAlertSettings(req));
  }

  if (cmd == "set-alerts") {
    if (argc < 7) return 1;

    // start from the stored settings so unspecified fields are kept
    GetAlertSettingsRequest get;
    get.set_serial(argv[3]);
    auto current = client.GetAlertSettings(get);
    if (!current.ok()) {
      std::cerr << current.status().ToString() << "\n";
      return 2;
    }

    UpdateAlertSettingsRequest req;
    auto*                      settings = req.mutable_settings();
    *settings                           = current->settings();
    settings->set_alerts_enabled(true);

    const std::string high = argv[4];
    const std::string low  = argv[5];
    settings->set_high_temp_enabled(high != "off");
    if (high != "off") settings->set_high_temp_threshold_c(std::stod(high));
    settings->set_low_temp_enabled(low != "off");
    if (low != "off") settings->set_low_temp_threshold_c(std::stod(low));
    settings->set_cooldown_minutes(static_cast<uint32_t>(std::stoul(argv[6])));
    if (argc >= 8) settings->set_recipient(argv[7]);

    return Print(client.UpdateAlertSettings(req));
  }

  if (cmd == "profile") {
    if (argc < 4) return 1;
    GetStorageProfileRequest req;
    req.set_owner_id(argv[3]);
    return Print(client.GetStorageProfile(req));
  }

  if (cmd == "set-plan") {
    if (argc < 5) return 1;
    auto plan = telemetry::model::ParsePlan(argv[4]);
    if (!plan) {
      std::cerr << "unsupported plan: " << argv[4] << "\n";
      return 1;
    }
    SetStoragePlanRequest req;
    req.set_owner_id(argv[3]);
    req.set_plan(*plan);
    return Print(client.SetStoragePlan(req));
  }

  if (cmd == "recompute") {
    RecomputeUsageRequest req;
    if (argc >= 4) req.set_owner_id(argv[3]);
    return Print(client.RecomputeUsage(req));
  }

  if (cmd == "ingest") {
    if (argc < 6) return 1;
    auto authorization = TelemetryClient::MakeAuthorization(argv[3], argv[4]);
    if (!authorization.ok()) {
      std::cerr << authorization.status().ToString() << "\n";
      return 1;
    }
    return Print(client.IngestJson(*authorization, argv[5]));
  }

  if (cmd == "recent") {
    if (argc < 4) return 1;
    QueryRecentRequest req;
    req.set_serial(argv[3]);
    req.set_count(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 10);
    return Print(client.QueryRecent(req));
  }

  if (cmd == "range") {
    if (argc < 6) return 1;
    QueryRangeRequest req;
    req.set_serial(argv[3]);
    *req.mutable_start() = telemetry::util::ToProto(ParseTimeOrExit(argv[4]));
    *req.mutable_end()   = telemetry::util::ToProto(ParseTimeOrExit(argv[5]));
    if (argc >= 7) req.set_limit(static_cast<uint32_t>(std::stoul(argv[6])));
    return Print(client.QueryRange(req));
  }

  if (cmd == "export") {
    if (argc < 7) return 1;
    auto rows = client.ExportRange(argv[3], ParseTimeOrExit(argv[4]), ParseTimeOrExit(argv[5]), argv[6]);
    if (!rows.ok()) {
      std::cerr << rows.status().ToString() << "\n";
      return 2;
    }
    std::cout << "exported " << *rows << " samples to " << argv[6] << "\n";
    return 0;
  }

  Usage();
  return 1;
}
