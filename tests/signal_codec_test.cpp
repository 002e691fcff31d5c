// =============================================================================
// signal_codec_test.cpp
// =============================================================================
// Unit tests for the inbound signal JSON codec (decodeSignal / parseSignal /
// encodeSignal / normalizeSymbol).
//
// Validates:
//   - ENTRY_SIGNAL, MANAGE_ACTION and NON_SIGNAL payloads decode to the
//     matching intent alternative
//   - A single "entry" price fills both ends of the entry zone
//   - Symbols are normalised ("btc/usdt" -> "BTCUSDT")
//   - Malformed payloads raise SignalFormatError with no partial result
//   - Envelope defaults: message_id falls back to signal_id, version to 1
// =============================================================================

#include "warden/gateway/signal_codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <variant>

using nlohmann::json;
using warden::SignalFormatError;
using warden::decodeSignal;

namespace {

constexpr std::int64_t kNow = 1'700'000'000'000;

json entryPayload() {
  return json{{"signal_id", "sig-1"},
              {"message_id", "msg-1"},
              {"version", 1},
              {"type", "ENTRY_SIGNAL"},
              {"symbol", "btc/usdt"},
              {"side", "long"},
              {"entry_type", "LIMIT"},
              {"entry", 100.0},
              {"stop_loss", 99.0},
              {"take_profits", {101.0, 102.0}},
              {"leverage", 5},
              {"quality", 0.8},
              {"confidence", 0.9}};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Entry signal.
// -----------------------------------------------------------------------------
TEST(SignalCodecTest, DecodesEntrySignal) {
  auto envelope = decodeSignal(entryPayload(), kNow);

  EXPECT_EQ(envelope.signal_id, "sig-1");
  EXPECT_EQ(envelope.message_id, "msg-1");
  EXPECT_EQ(envelope.version, 1);
  EXPECT_EQ(envelope.received_at_ms, kNow);

  const auto* entry = std::get_if<warden::domain::EntrySignal>(&envelope.intent);
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->symbol, "BTCUSDT");
  EXPECT_EQ(entry->side, warden::domain::PositionSide::Long);
  EXPECT_EQ(entry->entry_type, warden::domain::EntryType::Limit);
  EXPECT_DOUBLE_EQ(entry->entry_low, 100.0);
  EXPECT_DOUBLE_EQ(entry->entry_high, 100.0);
  ASSERT_TRUE(entry->stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*entry->stop_loss, 99.0);
  EXPECT_EQ(entry->take_profits.size(), 2u);
  EXPECT_EQ(entry->leverage.value_or(0), 5);
  EXPECT_DOUBLE_EQ(entry->quality, 0.8);
  EXPECT_DOUBLE_EQ(entry->confidence, 0.9);
}

TEST(SignalCodecTest, EntryZoneIsOrdered) {
  json j = entryPayload();
  j.erase("entry");
  j["entry_low"] = 101.0;
  j["entry_high"] = 99.0;
  j["side"] = "SELL";

  auto envelope = decodeSignal(j, kNow);
  const auto& entry = std::get<warden::domain::EntrySignal>(envelope.intent);
  EXPECT_DOUBLE_EQ(entry.entry_low, 99.0);
  EXPECT_DOUBLE_EQ(entry.entry_high, 101.0);
  EXPECT_EQ(entry.side, warden::domain::PositionSide::Short);
}

TEST(SignalCodecTest, MarketEntryNeedsNoPrice) {
  json j = entryPayload();
  j.erase("entry");
  j["entry_type"] = "market";

  auto envelope = decodeSignal(j, kNow);
  const auto& entry = std::get<warden::domain::EntrySignal>(envelope.intent);
  EXPECT_EQ(entry.entry_type, warden::domain::EntryType::Market);
  EXPECT_DOUBLE_EQ(entry.entry_low, 0.0);
}

TEST(SignalCodecTest, EnvelopeDefaults) {
  json j = entryPayload();
  j.erase("message_id");
  j.erase("version");
  j.erase("quality");
  j.erase("confidence");

  auto envelope = decodeSignal(j, kNow);
  EXPECT_EQ(envelope.message_id, "sig-1");
  EXPECT_EQ(envelope.version, 1);
  const auto& entry = std::get<warden::domain::EntrySignal>(envelope.intent);
  EXPECT_DOUBLE_EQ(entry.quality, 1.0);
  EXPECT_DOUBLE_EQ(entry.confidence, 1.0);
}

// -----------------------------------------------------------------------------
// 2. Manage action and non-signal.
// -----------------------------------------------------------------------------
TEST(SignalCodecTest, DecodesManageActions) {
  auto reduce = decodeSignal(json{{"signal_id", "m-1"},
                                  {"type", "MANAGE_ACTION"},
                                  {"symbol", "ETH-USDT"},
                                  {"action", "REDUCE"},
                                  {"reduce_pct", 50}},
                             kNow);
  const auto* action = std::get_if<warden::domain::ManageAction>(&reduce.intent);
  ASSERT_NE(action, nullptr);
  EXPECT_EQ(action->symbol, "ETHUSDT");
  EXPECT_EQ(action->kind, warden::domain::ManageActionKind::Reduce);
  EXPECT_DOUBLE_EQ(action->reduce_pct.value_or(0.0), 50.0);

  auto be = decodeSignal(json{{"signal_id", "m-2"},
                              {"type", "MANAGE_ACTION"},
                              {"symbol", "ETHUSDT"},
                              {"action", "move_sl_to_be"}},
                         kNow);
  EXPECT_EQ(std::get<warden::domain::ManageAction>(be.intent).kind,
            warden::domain::ManageActionKind::MoveStopToBreakEven);
}

TEST(SignalCodecTest, DecodesNonSignal) {
  auto envelope = decodeSignal(
      json{{"signal_id", "n-1"}, {"type", "NON_SIGNAL"}, {"reason", "chatter"}},
      kNow);
  const auto* non = std::get_if<warden::domain::NonSignal>(&envelope.intent);
  ASSERT_NE(non, nullptr);
  EXPECT_EQ(non->reason, "chatter");
  EXPECT_STREQ(warden::domain::intentKindName(envelope.intent), "NON_SIGNAL");
}

// -----------------------------------------------------------------------------
// 3. Malformed payloads.
// -----------------------------------------------------------------------------
TEST(SignalCodecTest, RejectsMalformedPayloads) {
  auto without = [](const char* field) {
    json j = entryPayload();
    j.erase(field);
    return j;
  };
  EXPECT_THROW(decodeSignal(without("signal_id"), kNow), SignalFormatError);
  EXPECT_THROW(decodeSignal(without("type"), kNow), SignalFormatError);
  EXPECT_THROW(decodeSignal(without("symbol"), kNow), SignalFormatError);
  EXPECT_THROW(decodeSignal(without("side"), kNow), SignalFormatError);
  EXPECT_THROW(decodeSignal(without("entry"), kNow), SignalFormatError);

  json j = entryPayload();
  j["version"] = 0;
  EXPECT_THROW(decodeSignal(j, kNow), SignalFormatError);

  j = entryPayload();
  j["quality"] = 1.5;
  EXPECT_THROW(decodeSignal(j, kNow), SignalFormatError);

  j = entryPayload();
  j["leverage"] = 0;
  EXPECT_THROW(decodeSignal(j, kNow), SignalFormatError);

  j = entryPayload();
  j["type"] = "SOMETHING_ELSE";
  EXPECT_THROW(decodeSignal(j, kNow), SignalFormatError);

  EXPECT_THROW(decodeSignal(json{{"signal_id", "m"},
                                 {"type", "MANAGE_ACTION"},
                                 {"symbol", "BTCUSDT"},
                                 {"action", "REDUCE"},
                                 {"reduce_pct", 150}},
                            kNow),
               SignalFormatError);
  EXPECT_THROW(decodeSignal(json{{"signal_id", "m"},
                                 {"type", "MANAGE_ACTION"},
                                 {"symbol", "BTCUSDT"},
                                 {"action", "SET_TP"},
                                 {"take_profits", json::array()}},
                            kNow),
               SignalFormatError);
  EXPECT_THROW(decodeSignal(json::array(), kNow), SignalFormatError);
}

TEST(SignalCodecTest, ParseRejectsInvalidJson) {
  EXPECT_THROW(warden::parseSignal("{not json", kNow), json::parse_error);
}

// -----------------------------------------------------------------------------
// 4. Encoding keeps the fields the decoder reads.
// -----------------------------------------------------------------------------
TEST(SignalCodecTest, EncodeThenDecodePreservesEntry) {
  auto original = decodeSignal(entryPayload(), kNow);
  auto again = decodeSignal(warden::encodeSignal(original), 0);

  EXPECT_EQ(again.signal_id, original.signal_id);
  EXPECT_EQ(again.received_at_ms, kNow);
  const auto& entry = std::get<warden::domain::EntrySignal>(again.intent);
  EXPECT_EQ(entry.symbol, "BTCUSDT");
  EXPECT_DOUBLE_EQ(entry.stop_loss.value_or(0.0), 99.0);
}

TEST(SignalCodecTest, NormalizeSymbol) {
  EXPECT_EQ(warden::normalizeSymbol(" sol / usdt "), "SOLUSDT");
  EXPECT_EQ(warden::normalizeSymbol("XRP-USDT"), "XRPUSDT");
}
