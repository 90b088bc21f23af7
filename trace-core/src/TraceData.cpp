#include <algorithm>
#include <sstream>
#include "TraceData.h"
#include "td/utils/base64.h"
#include "td/utils/logging.h"


static const std::pair<ContractInterface, td::Slice> interface_names[] = {
  {ContractInterface::jetton_wallet, "jetton_wallet"},
  {ContractInterface::jetton_master, "jetton_master"},
  {ContractInterface::nft_item, "nft_item"},
  {ContractInterface::nft_collection, "nft_collection"},
  {ContractInterface::nft_sale, "nft_sale"},
  {ContractInterface::nft_sale_getgems, "nft_sale_getgems"},
  {ContractInterface::nft_auction_getgems, "nft_auction_getgems"},
};

td::Slice to_string(ContractInterface iface) {
  for (const auto& [value, name] : interface_names) {
    if (value == iface) {
      return name;
    }
  }
  return "unknown";
}

td::Result<ContractInterface> parse_contract_interface(td::Slice name) {
  for (const auto& [value, iface_name] : interface_names) {
    if (iface_name == name) {
      return value;
    }
  }
  return td::Status::Error(PSLICE() << "unknown contract interface '" << name << "'");
}

Trace::~Trace() {
  // unlink descendants first so that destruction does not recurse over depth
  std::vector<std::unique_ptr<Trace>> pending = std::move(children);
  while (!pending.empty()) {
    auto node = std::move(pending.back());
    pending.pop_back();
    for (auto& child : node->children) {
      pending.push_back(std::move(child));
    }
    node->children.clear();
  }
}

void visit(Trace& trace, const std::function<void(Trace&)>& fn) {
  std::vector<Trace*> stack{&trace};
  while (!stack.empty()) {
    Trace* current = stack.back();
    stack.pop_back();
    fn(*current);
    for (auto it = current->children.rbegin(); it != current->children.rend(); ++it) {
      stack.push_back(it->get());
    }
  }
}

void visit(const Trace& trace, const std::function<void(const Trace&)>& fn) {
  std::vector<const Trace*> stack{&trace};
  while (!stack.empty()) {
    const Trace* current = stack.back();
    stack.pop_back();
    fn(*current);
    for (auto it = current->children.rbegin(); it != current->children.rend(); ++it) {
      stack.push_back(it->get());
    }
  }
}

bool Trace::has_interface(ContractInterface iface) const {
  for (const auto& item : account_interfaces) {
    if (item == iface) {
      return true;
    }
  }
  return false;
}

bool Trace::in_progress() const {
  return count_uncompleted() != 0;
}

size_t Trace::count_uncompleted() const {
  size_t res = 0;
  visit(*this, [&res](const Trace& node) {
    res += node.transaction.out_msgs.size();  // TODO: skip external outbound messages once they are marked by the trace builder
  });
  return res;
}

int Trace::depth() const {
  int res = 0;
  std::vector<std::pair<const Trace*, int>> stack{{this, 1}};
  while (!stack.empty()) {
    auto [node, level] = stack.back();
    stack.pop_back();
    res = std::max(res, level);
    for (const auto& child : node->children) {
      stack.emplace_back(child.get(), level + 1);
    }
  }
  return res;
}

size_t Trace::transactions_count() const {
  size_t res = 0;
  visit(*this, [&res](const Trace&) { res++; });
  return res;
}

std::string Trace::to_string() const {
  std::stringstream ss;
  std::vector<std::pair<const Trace*, int>> stack{{this, 0}};
  while (!stack.empty()) {
    auto [node, tabs] = stack.back();
    stack.pop_back();
    for (int i = 0; i < tabs; i++) {
      ss << "--";
    }
    const auto& tx = node->transaction;
    ss << "TX acc=" << convert::to_raw_address(tx.account) << " lt=" << tx.lt
       << " hash=" << td::base64_encode(tx.hash.as_slice())
       << " pending_out_msgs=" << tx.out_msgs.size() << " aborted=" << tx.aborted;
    if (tx.in_msg && tx.in_msg->decoded_body) {
      ss << " op=" << tx.in_msg->decoded_body->operation;
    }
    ss << std::endl;
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      stack.emplace_back(it->get(), tabs + 1);
    }
  }
  return ss.str();
}
