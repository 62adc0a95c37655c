#include <cassert>
#include <iostream>
#include <string>

#include "internal/store/session_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

satp::model::SessionData SampleSession() {
  satp::model::SessionData session;
  session.session_id          = "s-1";
  session.stage               = satp::model::Stage::kDestinationMintPending;
  session.stage_history       = {satp::model::Stage::kInitiated, satp::model::Stage::kSourceLockPending,
                                 satp::model::Stage::kSourceLockConfirmed, satp::model::Stage::kDestinationMintPending};
  session.source_network      = {"fabric-a", satp::model::LedgerType::kFabric};
  session.destination_network = {"besu-b", satp::model::LedgerType::kBesu};
  session.source_asset.id     = "ExampleAsset";
  session.source_asset.owner  = "User_A";
  session.amount              = 42;
  session.max_retries         = 4294967295u;
  session.max_timeout         = std::chrono::milliseconds(0);
  session.attempt_count       = 2;
  session.last_error          = {satp::model::ErrorKind::kLedgerInvocation, "connector timeout"};
  session.receipts.push_back({satp::model::Stage::kSourceLockConfirmed, "lock", session.source_network, "tx-1", 7, 1000, true});
  session.version = 3;
  return session;
}

void TestRetryBoundsTravelAsDecimalStrings() {
  auto proto = satp::store::ToProto(SampleSession());
  assert(proto.max_retries() == "4294967295");
  assert(proto.max_timeout_ms() == "0");
  assert(proto.last_error().kind() == "ledger_invocation");

  auto back = satp::store::FromProto(proto);
  assert(back.max_retries == 4294967295u);
  assert(back.max_timeout.count() == 0);
  assert(back.receipts.size() == 1);
  assert(back.receipts[0].recovered);
  assert(back.stage_history.size() == 4);
  assert(back.last_error.kind == satp::model::ErrorKind::kLedgerInvocation);
}

void TestRejectsMalformedRetryBounds() {
  auto proto = satp::store::ToProto(SampleSession());

  for (const std::string bad : {"", "-1", "1.5", "abc", " 3", "4294967296"}) {
    proto.set_max_retries(bad);
    bool rejected = false;
    try {
      satp::store::FromProto(proto);
    } catch (const satp::util::InvalidArgument&) {
      rejected = true;
    }
    assert(rejected);
  }
}

void TestCorruptJsonIsPersistenceError() {
  bool failed = false;
  try {
    satp::store::FromJson("{\"session_id\": \"s-1\", \"unknown\": 1}");
  } catch (const satp::util::PersistenceError&) {
    failed = true;
  }
  assert(failed);

  auto json = satp::store::ToJson(SampleSession());
  auto pos  = json.find("4294967295");
  assert(pos != std::string::npos);
  json.replace(pos, 10, "nope");

  failed = false;
  try {
    satp::store::FromJson(json);
  } catch (const satp::util::PersistenceError&) {
    failed = true;
  }
  assert(failed);
}

void TestParseUnsigned() {
  assert(satp::store::ParseUnsigned("n", "0") == 0);
  assert(satp::store::ParseUnsigned("n", "18446744073") == 18446744073ull);
}

} // namespace

int main() {
  TestRetryBoundsTravelAsDecimalStrings();
  TestRejectsMalformedRetryBounds();
  TestCorruptJsonIsPersistenceError();
  TestParseUnsigned();

  std::cout << "session_codec_test: pass\n";
  return 0;
}
