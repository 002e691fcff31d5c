#include "warden/gateway/signal_codec.hpp"

#include <algorithm>
#include <cctype>

namespace warden {

namespace {

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

std::string requireString(const nlohmann::json& j, const char* field) {
  if (!j.contains(field) || !j.at(field).is_string() ||
      j.at(field).get<std::string>().empty()) {
    throw SignalFormatError(std::string("missing or empty '") + field + "'");
  }
  return j.at(field).get<std::string>();
}

std::optional<double> optionalNumber(const nlohmann::json& j,
                                     const char* field) {
  if (!j.contains(field) || j.at(field).is_null()) {
    return std::nullopt;
  }
  if (!j.at(field).is_number()) {
    throw SignalFormatError(std::string("'") + field + "' is not a number");
  }
  return j.at(field).get<double>();
}

std::vector<double> numberList(const nlohmann::json& j, const char* field) {
  std::vector<double> out;
  if (!j.contains(field) || j.at(field).is_null()) {
    return out;
  }
  if (!j.at(field).is_array()) {
    throw SignalFormatError(std::string("'") + field + "' is not an array");
  }
  for (const auto& v : j.at(field)) {
    if (!v.is_number() || v.get<double>() <= 0.0) {
      throw SignalFormatError(std::string("'") + field +
                              "' holds a non-positive or non-numeric price");
    }
    out.push_back(v.get<double>());
  }
  return out;
}

double unitInterval(const nlohmann::json& j, const char* field) {
  const double value = optionalNumber(j, field).value_or(1.0);
  if (value < 0.0 || value > 1.0) {
    throw SignalFormatError(std::string("'") + field + "' outside [0, 1]");
  }
  return value;
}

domain::EntrySignal decodeEntry(const nlohmann::json& j) {
  domain::EntrySignal entry;
  entry.symbol = normalizeSymbol(requireString(j, "symbol"));
  if (entry.symbol.empty()) {
    throw SignalFormatError("'symbol' is empty after normalization");
  }

  auto side = domain::parsePositionSide(requireString(j, "side"));
  if (!side) {
    throw SignalFormatError("'side' must be LONG or SHORT");
  }
  entry.side = *side;

  const std::string type = upper(j.value("entry_type", std::string("LIMIT")));
  if (type == "MARKET") {
    entry.entry_type = domain::EntryType::Market;
  } else if (type == "LIMIT") {
    entry.entry_type = domain::EntryType::Limit;
  } else {
    throw SignalFormatError("'entry_type' must be MARKET or LIMIT");
  }

  auto single = optionalNumber(j, "entry");
  auto low = optionalNumber(j, "entry_low");
  auto high = optionalNumber(j, "entry_high");
  if (single) {
    low = high = single;
  } else if (low && !high) {
    high = low;
  } else if (high && !low) {
    low = high;
  }
  if (low && high) {
    if (*low <= 0.0 || *high <= 0.0) {
      throw SignalFormatError("entry prices must be positive");
    }
    entry.entry_low = std::min(*low, *high);
    entry.entry_high = std::max(*low, *high);
  } else if (entry.entry_type == domain::EntryType::Limit) {
    throw SignalFormatError("LIMIT entry without 'entry' price");
  }

  entry.stop_loss = optionalNumber(j, "stop_loss");
  if (entry.stop_loss && *entry.stop_loss <= 0.0) {
    throw SignalFormatError("'stop_loss' must be positive");
  }
  entry.take_profits = numberList(j, "take_profits");

  if (j.contains("leverage") && !j.at("leverage").is_null()) {
    if (!j.at("leverage").is_number()) {
      throw SignalFormatError("'leverage' is not a number");
    }
    const int leverage = static_cast<int>(j.at("leverage").get<double>());
    if (leverage < 1) {
      throw SignalFormatError("'leverage' must be >= 1");
    }
    entry.leverage = leverage;
  }

  entry.quality = unitInterval(j, "quality");
  entry.confidence = unitInterval(j, "confidence");
  return entry;
}

domain::ManageAction decodeManage(const nlohmann::json& j) {
  domain::ManageAction action;
  action.symbol = normalizeSymbol(requireString(j, "symbol"));

  const std::string kind = upper(requireString(j, "action"));
  if (kind == "MOVE_SL_TO_BE") {
    action.kind = domain::ManageActionKind::MoveStopToBreakEven;
  } else if (kind == "REDUCE") {
    action.kind = domain::ManageActionKind::Reduce;
    action.reduce_pct = optionalNumber(j, "reduce_pct");
    if (!action.reduce_pct || *action.reduce_pct <= 0.0 ||
        *action.reduce_pct > 100.0) {
      throw SignalFormatError("REDUCE needs 'reduce_pct' in (0, 100]");
    }
  } else if (kind == "CLOSE") {
    action.kind = domain::ManageActionKind::Close;
  } else if (kind == "SET_TP") {
    action.kind = domain::ManageActionKind::SetTakeProfit;
    action.take_profits = numberList(j, "take_profits");
    if (action.take_profits.empty()) {
      throw SignalFormatError("SET_TP needs a non-empty 'take_profits'");
    }
  } else {
    throw SignalFormatError("unknown 'action' " + kind);
  }
  return action;
}

}  // namespace

std::string normalizeSymbol(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    if (c == '/' || c == '-' || std::isspace(c)) {
      continue;
    }
    out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}

domain::SignalEnvelope decodeSignal(const nlohmann::json& j,
                                    std::int64_t received_at_ms) {
  if (!j.is_object()) {
    throw SignalFormatError("signal payload is not a JSON object");
  }

  domain::SignalEnvelope envelope;
  envelope.signal_id = requireString(j, "signal_id");
  envelope.message_id = j.value("message_id", envelope.signal_id);
  envelope.version = j.value("version", 1);
  if (envelope.version < 1) {
    throw SignalFormatError("'version' must be >= 1");
  }
  envelope.received_at_ms = j.value("received_at_ms", received_at_ms);

  const std::string type = upper(requireString(j, "type"));
  if (type == "ENTRY_SIGNAL" || type == "ENTRY") {
    envelope.intent = decodeEntry(j);
  } else if (type == "MANAGE_ACTION" || type == "MANAGE") {
    envelope.intent = decodeManage(j);
  } else if (type == "NON_SIGNAL") {
    envelope.intent = domain::NonSignal{j.value("reason", std::string())};
  } else {
    throw SignalFormatError("unknown 'type' " + type);
  }
  return envelope;
}

domain::SignalEnvelope parseSignal(const std::string& payload,
                                   std::int64_t received_at_ms) {
  return decodeSignal(nlohmann::json::parse(payload), received_at_ms);
}

nlohmann::json encodeSignal(const domain::SignalEnvelope& envelope) {
  nlohmann::json j;
  j["signal_id"] = envelope.signal_id;
  j["message_id"] = envelope.message_id;
  j["version"] = envelope.version;
  j["received_at_ms"] = envelope.received_at_ms;
  j["type"] = domain::intentKindName(envelope.intent);

  if (const auto* entry = std::get_if<domain::EntrySignal>(&envelope.intent)) {
    j["symbol"] = entry->symbol;
    j["side"] = domain::toString(entry->side);
    j["entry_type"] =
        entry->entry_type == domain::EntryType::Market ? "MARKET" : "LIMIT";
    if (entry->entry_low > 0.0) {
      j["entry_low"] = entry->entry_low;
      j["entry_high"] = entry->entry_high;
    }
    if (entry->stop_loss) {
      j["stop_loss"] = *entry->stop_loss;
    }
    j["take_profits"] = entry->take_profits;
    if (entry->leverage) {
      j["leverage"] = *entry->leverage;
    }
    j["quality"] = entry->quality;
    j["confidence"] = entry->confidence;
  } else if (const auto* action =
                 std::get_if<domain::ManageAction>(&envelope.intent)) {
    j["symbol"] = action->symbol;
    j["action"] = domain::toString(action->kind);
    if (action->reduce_pct) {
      j["reduce_pct"] = *action->reduce_pct;
    }
    if (!action->take_profits.empty()) {
      j["take_profits"] = action->take_profits;
    }
  } else if (const auto* non =
                 std::get_if<domain::NonSignal>(&envelope.intent)) {
    j["reason"] = non->reason;
  }
  return j;
}

}  // namespace warden
