#include "WalletModifier.h"

#include <sstream>

namespace ws {
namespace wallet {

namespace {

template <typename K, typename V>
void writeCounts(std::ostream &os, const char *name,
                 const MapModifier<K, V> &modifier) {
  os << name << " +" << modifier.getInsertions().size() << "/-"
     << modifier.getDeletions().size();
}

std::string keyToString(const std::string &key) { return key; }
std::string keyToString(const chain::TxIn &key) { return key.toString(); }

nlohmann::json valueToJson(const std::string &value) { return value; }
nlohmann::json valueToJson(const chain::TxOut &value) {
  return chain::toJson(value);
}
nlohmann::json valueToJson(const AddressMeta &value) { return toJson(value); }
nlohmann::json valueToJson(const TxHistoryEntry &value) {
  return toJson(value);
}
nlohmann::json valueToJson(const PtxBlockInfo &value) { return toJson(value); }

template <typename K, typename V>
nlohmann::json modifierToJson(const MapModifier<K, V> &modifier) {
  nlohmann::json j;
  j["insert"] = nlohmann::json::object();
  for (const auto &[key, value] : modifier.getInsertions()) {
    j["insert"][keyToString(key)] = valueToJson(value);
  }
  j["delete"] = nlohmann::json::object();
  for (const auto &[key, value] : modifier.getDeletions()) {
    j["delete"][keyToString(key)] = valueToJson(value);
  }
  return j;
}

} // namespace

void WalletModifier::merge(const WalletModifier &other) {
  addresses.merge(other.addresses);
  history.merge(other.history);
  used.merge(other.used);
  change.merge(other.change);
  utxo.merge(other.utxo);
  ptxCandidates.merge(other.ptxCandidates);
}

bool WalletModifier::isEmpty() const {
  return addresses.isEmpty() && history.isEmpty() && used.isEmpty() &&
         change.isEmpty() && utxo.isEmpty() && ptxCandidates.isEmpty();
}

std::string WalletModifier::getSummary() const {
  std::ostringstream oss;
  writeCounts(oss, "addresses", addresses);
  oss << ", ";
  writeCounts(oss, "history", history);
  oss << ", ";
  writeCounts(oss, "used", used);
  oss << ", ";
  writeCounts(oss, "change", change);
  oss << ", ";
  writeCounts(oss, "utxo", utxo);
  oss << ", ";
  writeCounts(oss, "ptx", ptxCandidates);
  return oss.str();
}

nlohmann::json WalletModifier::toJson() const {
  nlohmann::json j;
  j["addresses"] = modifierToJson(addresses);
  j["history"] = modifierToJson(history);
  j["used"] = modifierToJson(used);
  j["change"] = modifierToJson(change);
  j["utxo"] = modifierToJson(utxo);
  j["ptxCandidates"] = modifierToJson(ptxCandidates);
  return j;
}

bool WalletModifier::operator==(const WalletModifier &other) const {
  return addresses == other.addresses && history == other.history &&
         used == other.used && change == other.change && utxo == other.utxo &&
         ptxCandidates == other.ptxCandidates;
}

} // namespace wallet
} // namespace ws
