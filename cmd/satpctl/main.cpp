#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "satp/gateway/v1.hpp"

using namespace satp::gateway::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  satpctl <addr> transact <request.json>\n"
            << "  satpctl <addr> approve-address <network_id> <ledger=fabric|besu|ethereum|simulated> <token=fungible|nonfungible|erc20|erc721>\n"
            << "  satpctl <addr> status <session_id>\n"
            << "  satpctl <addr> list [--all]\n"
            << "  satpctl <addr> abort <session_id> [reason]\n"
            << "  satpctl <addr> identity\n";
}

static std::optional<LedgerType> ParseLedger(const std::string& value) {
  if (value == "fabric") return LEDGER_TYPE_FABRIC_2;
  if (value == "besu") return LEDGER_TYPE_BESU_2X;
  if (value == "ethereum") return LEDGER_TYPE_ETHEREUM;
  if (value == "simulated") return LEDGER_TYPE_SIMULATED;
  return std::nullopt;
}

static std::optional<TokenType> ParseToken(const std::string& value) {
  if (value == "fungible") return TOKEN_TYPE_NONSTANDARD_FUNGIBLE;
  if (value == "nonfungible") return TOKEN_TYPE_NONSTANDARD_NONFUNGIBLE;
  if (value == "erc20") return TOKEN_TYPE_ERC20;
  if (value == "erc721") return TOKEN_TYPE_ERC721;
  return std::nullopt;
}

static int Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render response: " << status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SatpGatewayService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "transact") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    TransactRequest req;
    auto            parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
    if (!parsed.ok()) {
      std::cerr << "invalid request: " << parsed.message() << "\n";
      return 1;
    }

    TransactResponse resp;
    auto             status = stub->Transact(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);
    return Print(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "approve-address") {
    if (argc < 6) return 1;

    auto ledger = ParseLedger(argv[4]);
    auto token  = ParseToken(argv[5]);
    if (!ledger || !token) {
      Usage();
      return 1;
    }

    GetApproveAddressRequest req;
    req.mutable_network_id()->set_id(argv[3]);
    req.mutable_network_id()->set_ledger_type(*ledger);
    req.set_token_type(*token);

    GetApproveAddressResponse resp;
    auto                      status = stub->GetApproveAddress(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.approve_address() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetStatusRequest req;
    req.set_session_id(argv[3]);

    GetStatusResponse resp;
    auto              status = stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);
    return Print(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListSessionsRequest req;
    req.set_include_terminal(argc >= 4 && std::string(argv[3]) == "--all");

    ListSessionsResponse resp;
    auto                 status = stub->ListSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& session : resp.sessions()) {
      std::cout << session.session_id() << " stage=" << Stage_Name(session.stage()) << " status=" << SessionStatus_Name(session.status())
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "abort") {
    if (argc < 4) return 1;

    AbortTransferRequest req;
    req.set_session_id(argv[3]);
    req.set_reason(argc >= 5 ? argv[4] : "aborted by operator");

    AbortTransferResponse resp;
    auto                  status = stub->AbortTransfer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.accepted() ? "abort accepted" : "abort not accepted") << "\n";
    return resp.accepted() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "identity") {
    GetIdentityRequest req;
    GatewayIdentity    resp;
    auto               status = stub->GetIdentity(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);
    return Print(resp);
  }

  Usage();
  return 1;
}
